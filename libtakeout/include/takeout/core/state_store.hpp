// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_STATE_STORE_HPP
#define TAKEOUT_CORE_STATE_STORE_HPP

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "takeout/core/error_handling.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * Progress of a retrieval, as persisted between runs.
     */
    struct RetrievalState
    {
        // 0 when nothing has been downloaded yet.
        int last_completed_index = 0;
        int target_end = 0;
        int max_index = 0;
        int delay_seconds = 0;
        std::string job_id = "";
        std::string output_location = "";
        // UTC, informative only.
        std::string updated_at = "";
    };

    bool operator==(const RetrievalState& lhs, const RetrievalState& rhs);
    bool operator!=(const RetrievalState& lhs, const RetrievalState& rhs);

    void to_json(nlohmann::json& j, const RetrievalState& state);
    void from_json(const nlohmann::json& j, RetrievalState& state);

    class StateStore
    {
    public:

        virtual ~StateStore() = default;

        /// ``std::nullopt`` when no state was ever saved.
        expected_t<std::optional<RetrievalState>> load() const;

        /// The state is durable once this returns successfully.
        expected_t<void> save(const RetrievalState& state);

    private:

        virtual expected_t<std::optional<RetrievalState>> load_impl() const = 0;
        virtual expected_t<void> save_impl(const RetrievalState& state) = 0;
    };

    /**
     * Stores the state as a JSON document.
     *
     * A new state is written to a temporary sibling, synced to disk and renamed
     * over the previous one: a crash leaves either the old or the new record.
     */
    class JsonStateStore : public StateStore
    {
    public:

        explicit JsonStateStore(fs::path path);

        const fs::path& path() const;

    private:

        expected_t<std::optional<RetrievalState>> load_impl() const override;
        expected_t<void> save_impl(const RetrievalState& state) override;

        fs::path m_path;
    };
}

#endif
