// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <tuple>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "takeout/core/logging.hpp"
#include "takeout/core/state_store.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/cfile.hpp"
#include "takeout/util/random.hpp"

namespace takeout
{
    namespace
    {
        auto attrs(const RetrievalState& s)
        {
            return std::tie(
                s.last_completed_index,
                s.target_end,
                s.max_index,
                s.delay_seconds,
                s.job_id,
                s.output_location,
                s.updated_at
            );
        }

        tl::unexpected<takeout_error> store_error(std::string msg)
        {
            return make_unexpected(std::move(msg), takeout_error_code::state_store_failure);
        }
    }

    bool operator==(const RetrievalState& lhs, const RetrievalState& rhs)
    {
        return attrs(lhs) == attrs(rhs);
    }

    bool operator!=(const RetrievalState& lhs, const RetrievalState& rhs)
    {
        return !(lhs == rhs);
    }

    void to_json(nlohmann::json& j, const RetrievalState& state)
    {
        j["last_completed_index"] = state.last_completed_index;
        j["target_end"] = state.target_end;
        j["max_index"] = state.max_index;
        j["delay_seconds"] = state.delay_seconds;
        j["job_id"] = state.job_id;
        j["output_location"] = state.output_location;
        j["updated_at"] = state.updated_at;
    }

    void from_json(const nlohmann::json& j, RetrievalState& state)
    {
        // The marker is the whole point of the record, it must be there.
        state.last_completed_index = j.at("last_completed_index").get<int>();
        state.target_end = j.value("target_end", 0);
        state.max_index = j.value("max_index", 0);
        state.delay_seconds = j.value("delay_seconds", 0);
        state.job_id = j.value("job_id", "");
        state.output_location = j.value("output_location", "");
        state.updated_at = j.value("updated_at", "");
    }

    /**************
     * StateStore *
     **************/

    expected_t<std::optional<RetrievalState>> StateStore::load() const
    {
        return load_impl();
    }

    expected_t<void> StateStore::save(const RetrievalState& state)
    {
        return save_impl(state);
    }

    /******************
     * JsonStateStore *
     ******************/

    JsonStateStore::JsonStateStore(fs::path path)
        : m_path(std::move(path))
    {
    }

    const fs::path& JsonStateStore::path() const
    {
        return m_path;
    }

    expected_t<std::optional<RetrievalState>> JsonStateStore::load_impl() const
    {
        std::error_code ec;
        if (!fs::exists(m_path, ec))
        {
            LOG_DEBUG << "No state file at " << m_path;
            return std::optional<RetrievalState>();
        }

        auto contents = read_contents(m_path);
        if (!contents)
        {
            return store_error(contents.error().what());
        }

        try
        {
            auto state = nlohmann::json::parse(contents.value()).get<RetrievalState>();
            if (state.last_completed_index < 0)
            {
                return store_error(fmt::format(
                    "Invalid state file '{}': negative last_completed_index",
                    m_path.string()
                ));
            }
            return std::optional<RetrievalState>(std::move(state));
        }
        catch (const nlohmann::json::exception& e)
        {
            return store_error(
                fmt::format("Invalid state file '{}': {}", m_path.string(), e.what())
            );
        }
    }

    expected_t<void> JsonStateStore::save_impl(const RetrievalState& state)
    {
        const fs::path parent = m_path.has_parent_path() ? m_path.parent_path() : fs::path(".");
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            return store_error(
                fmt::format("Could not create '{}': {}", parent.string(), ec.message())
            );
        }

        const fs::path tmp_path = fs::path(m_path).concat(
            ".tmp-" + util::generate_random_alphanumeric_string(6)
        );
        auto remove_tmp = [&tmp_path]
        {
            std::error_code rm_ec;
            fs::remove(tmp_path, rm_ec);
        };

        const std::string contents = nlohmann::json(state).dump(4) + "\n";

        auto file = util::CFile::try_open(tmp_path, "wb");
        if (!file)
        {
            return store_error(
                fmt::format("Could not open '{}': {}", tmp_path.string(), file.error().message())
            );
        }
        auto written = file->try_write(contents).and_then([&] { return file->try_sync(); });
        if (written)
        {
            written = file->try_close();
        }
        if (!written)
        {
            remove_tmp();
            return store_error(fmt::format(
                "Could not write '{}': {}",
                tmp_path.string(),
                written.error().message()
            ));
        }

        fs::rename(tmp_path, m_path, ec);
        if (ec)
        {
            remove_tmp();
            return store_error(fmt::format(
                "Could not move '{}' to '{}': {}",
                tmp_path.string(),
                m_path.string(),
                ec.message()
            ));
        }

        if (auto synced = util::sync_path(parent); !synced)
        {
            return store_error(
                fmt::format("Could not sync '{}': {}", parent.string(), synced.error().message())
            );
        }

        LOG_DEBUG << "Saved state to " << m_path << " (last completed index "
                  << state.last_completed_index << ")";
        return {};
    }
}
