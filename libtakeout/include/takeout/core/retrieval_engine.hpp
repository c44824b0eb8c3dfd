// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_RETRIEVAL_ENGINE_HPP
#define TAKEOUT_CORE_RETRIEVAL_ENGINE_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "takeout/core/archive_fetcher.hpp"
#include "takeout/core/archive_file.hpp"
#include "takeout/core/auth_provider.hpp"
#include "takeout/core/auth_session.hpp"
#include "takeout/core/clock.hpp"
#include "takeout/core/state_store.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    enum class EngineState
    {
        idle,
        downloading,
        refreshing,
        waiting,
        done,
        aborted,
    };

    const char* name_of(EngineState state) noexcept;

    enum class AbortReason
    {
        none,
        not_found,
        auth_exhausted,
        size_mismatch,
        transport_error,
        // No session could be obtained before the first download.
        auth_unavailable,
        interrupted,
        state_store_failure,
    };

    const char* name_of(AbortReason reason) noexcept;

    /**
     * First index a run downloads.
     *
     * The highest of @p requested_start, @p found_on_disk (as given by
     * ``find_resume_index``) and the index after the recorded progress.
     * @p recorded must already be known to belong to the current job.
     */
    int resume_index(
        int requested_start,
        int found_on_disk,
        const std::optional<RetrievalState>& recorded
    );

    struct EngineOptions
    {
        fs::path output_location = "GoogleTakeout";
        std::string job_id = "";
        // Lower bound only: completed archives are never downloaded again.
        int requested_start = 1;
        int target_end = default_max_index;
        int max_index = default_max_index;
        std::chrono::seconds delay = std::chrono::seconds(5);
        // Refreshes allowed for one index before giving up.
        int max_auth_refreshes = 2;
        Credentials credentials = {};
    };

    struct RunResult
    {
        EngineState state = EngineState::idle;
        AbortReason reason = AbortReason::none;
        // As persisted, safe to resume from.
        int last_completed_index = 0;
        int downloaded_count = 0;
        int refresh_count = 0;
        std::string message = "";

        /// 0 when done, 1 for any abort.
        int exit_code() const;
    };

    /**
     * Downloads the archives of a job one after the other.
     *
     * The engine starts after the last archive present or recorded, fetches
     * each index in increasing order and records it as completed before
     * moving on. An authentication failure triggers a bounded number of
     * session refreshes on the same index; every other failure ends the run,
     * a later run resumes where this one stopped.
     */
    class RetrievalEngine
    {
    public:

        using transition_callback_t = std::function<void(EngineState state, int index)>;

        /// @throws takeout_error if the options are inconsistent.
        RetrievalEngine(
            EngineOptions options,
            ArchiveFetcher& fetcher,
            AuthProvider& auth_provider,
            StateStore& store,
            const Clock& clock
        );

        /**
         * Run until every archive up to the target end is downloaded or until
         * the first fatal failure.
         *
         * @param session The session to start with, asked to the AuthProvider if empty.
         */
        RunResult run(std::optional<AuthSession> session = std::nullopt);

        EngineState state() const;
        int current_index() const;
        const EngineOptions& options() const;

        /// Called on every state change, with the index being worked on.
        void on_transition(transition_callback_t callback);

    private:

        EngineOptions m_options;
        ArchiveFetcher& m_fetcher;
        AuthProvider& m_auth_provider;
        StateStore& m_store;
        const Clock& m_clock;

        EngineState m_state = EngineState::idle;
        int m_index = 0;
        int m_last_completed = 0;
        int m_downloaded = 0;
        int m_refresh_count = 0;
        std::optional<AuthSession> m_session;
        std::optional<transition_callback_t> m_on_transition;

        void transition(EngineState state, int index);
        RunResult finish();
        RunResult abort(AbortReason reason, std::string message);

        int start_index(const std::optional<RetrievalState>& persisted) const;
        expected_t<void> persist(int index);

        // Returns false if no session could be obtained within the bound.
        bool refresh_session(int& refreshes_for_index, std::string& failure);
    };
}

#endif
