// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "takeout/core/logging.hpp"
#include "takeout/core/progress_scanner.hpp"
#include "takeout/core/retrieval_engine.hpp"
#include "takeout/core/thread_utils.hpp"

namespace takeout
{
    const char* name_of(EngineState state) noexcept
    {
        switch (state)
        {
            case EngineState::idle:
                return "Idle";
            case EngineState::downloading:
                return "Downloading";
            case EngineState::refreshing:
                return "Refreshing";
            case EngineState::waiting:
                return "Waiting";
            case EngineState::done:
                return "Done";
            case EngineState::aborted:
                return "Aborted";
        }
        return "Unknown";
    }

    const char* name_of(AbortReason reason) noexcept
    {
        switch (reason)
        {
            case AbortReason::none:
                return "None";
            case AbortReason::not_found:
                return "NotFound";
            case AbortReason::auth_exhausted:
                return "AuthExhausted";
            case AbortReason::size_mismatch:
                return "SizeMismatch";
            case AbortReason::transport_error:
                return "TransportError";
            case AbortReason::auth_unavailable:
                return "AuthUnavailable";
            case AbortReason::interrupted:
                return "Interrupted";
            case AbortReason::state_store_failure:
                return "StateStoreFailure";
        }
        return "Unknown";
    }

    int resume_index(
        int requested_start,
        int found_on_disk,
        const std::optional<RetrievalState>& recorded
    )
    {
        const int after_recorded = recorded ? recorded->last_completed_index + 1 : 1;
        return std::max({ requested_start, found_on_disk, after_recorded });
    }

    int RunResult::exit_code() const
    {
        return state == EngineState::done ? 0 : 1;
    }

    namespace
    {
        // Tokens do not say when they expire, this only adds a hint to the logs.
        constexpr auto session_age_hint = std::chrono::hours(1);

        AbortReason abort_reason_of(FetchStatus status)
        {
            switch (status)
            {
                case FetchStatus::not_found:
                    return AbortReason::not_found;
                case FetchStatus::size_mismatch:
                    return AbortReason::size_mismatch;
                default:
                    return AbortReason::transport_error;
            }
        }
    }

    RetrievalEngine::RetrievalEngine(
        EngineOptions options,
        ArchiveFetcher& fetcher,
        AuthProvider& auth_provider,
        StateStore& store,
        const Clock& clock
    )
        : m_options(std::move(options))
        , m_fetcher(fetcher)
        , m_auth_provider(auth_provider)
        , m_store(store)
        , m_clock(clock)
    {
        auto invalid = [](std::string msg)
        { return takeout_error(std::move(msg), takeout_error_code::incorrect_usage); };

        if (m_options.max_index < 1 || m_options.max_index > highest_index)
        {
            throw invalid(fmt::format("Maximum index must be in [1, {}]", highest_index));
        }
        if (m_options.requested_start < 1)
        {
            throw invalid("Start index must be at least 1");
        }
        if (m_options.target_end > m_options.max_index)
        {
            throw invalid(
                fmt::format("End index cannot exceed the maximum index {}", m_options.max_index)
            );
        }
        if (m_options.requested_start > m_options.target_end)
        {
            throw invalid("Start index cannot be greater than end index");
        }
        if (m_options.delay.count() < 0)
        {
            throw invalid("Delay cannot be negative");
        }
        if (m_options.max_auth_refreshes < 0)
        {
            throw invalid("The number of session refreshes cannot be negative");
        }
    }

    EngineState RetrievalEngine::state() const
    {
        return m_state;
    }

    int RetrievalEngine::current_index() const
    {
        return m_index;
    }

    const EngineOptions& RetrievalEngine::options() const
    {
        return m_options;
    }

    void RetrievalEngine::on_transition(transition_callback_t callback)
    {
        m_on_transition = std::move(callback);
    }

    void RetrievalEngine::transition(EngineState state, int index)
    {
        m_state = state;
        m_index = index;
        LOG_DEBUG << fmt::format("[{:03d}] -> {}", index, name_of(state));
        if (m_on_transition)
        {
            (*m_on_transition)(state, index);
        }
    }

    RunResult RetrievalEngine::finish()
    {
        transition(EngineState::done, m_index);
        RunResult result;
        result.state = EngineState::done;
        result.last_completed_index = m_last_completed;
        result.downloaded_count = m_downloaded;
        result.refresh_count = m_refresh_count;
        result.message = fmt::format(
            "Done: {} archive(s) downloaded, last completed index {}",
            m_downloaded,
            m_last_completed
        );
        LOG_INFO << result.message;
        return result;
    }

    RunResult RetrievalEngine::abort(AbortReason reason, std::string message)
    {
        transition(EngineState::aborted, m_index);
        RunResult result;
        result.state = EngineState::aborted;
        result.reason = reason;
        result.last_completed_index = m_last_completed;
        result.downloaded_count = m_downloaded;
        result.refresh_count = m_refresh_count;
        result.message = fmt::format(
            "Aborted ({}) at index {:03d}: {}",
            name_of(reason),
            m_index,
            message
        );
        LOG_ERROR << result.message;
        return result;
    }

    int RetrievalEngine::start_index(const std::optional<RetrievalState>& persisted) const
    {
        const int scanned = find_resume_index(m_options.output_location);
        const int start = resume_index(m_options.requested_start, scanned, persisted);
        LOG_INFO << fmt::format(
            "Resuming at index {} (requested {}, found on disk {}, recorded {})",
            start,
            m_options.requested_start,
            scanned,
            persisted ? persisted->last_completed_index : 0
        );
        return start;
    }

    expected_t<void> RetrievalEngine::persist(int index)
    {
        RetrievalState state;
        state.last_completed_index = index;
        state.target_end = m_options.target_end;
        state.max_index = m_options.max_index;
        state.delay_seconds = static_cast<int>(m_options.delay.count());
        state.job_id = m_options.job_id;
        state.output_location = m_options.output_location.string();
        state.updated_at = format_timestamp(m_clock.now());

        auto saved = m_store.save(state);
        if (saved)
        {
            m_last_completed = index;
        }
        return saved;
    }

    bool RetrievalEngine::refresh_session(int& refreshes_for_index, std::string& failure)
    {
        while (refreshes_for_index < m_options.max_auth_refreshes)
        {
            if (is_sig_interrupted())
            {
                return false;
            }
            ++refreshes_for_index;
            ++m_refresh_count;
            transition(EngineState::refreshing, m_index);
            LOG_INFO << fmt::format(
                "Refreshing session for index {:03d} (attempt {}/{})",
                m_index,
                refreshes_for_index,
                m_options.max_auth_refreshes
            );

            auto session = m_auth_provider.refresh(m_options.credentials);
            if (session)
            {
                m_session.emplace(std::move(session).value());
                return true;
            }
            failure = session.error().what();
            LOG_WARNING << "Session refresh failed: " << failure;
        }
        return false;
    }

    RunResult RetrievalEngine::run(std::optional<AuthSession> session)
    {
        m_session = std::move(session);
        m_downloaded = 0;
        m_refresh_count = 0;
        m_index = m_options.requested_start;
        transition(EngineState::idle, m_index);

        auto persisted = m_store.load();
        if (!persisted)
        {
            return abort(AbortReason::state_store_failure, persisted.error().what());
        }
        std::optional<RetrievalState> state = std::move(persisted).value();
        if (state && state->job_id != m_options.job_id)
        {
            LOG_WARNING << fmt::format(
                "Ignoring recorded progress of job '{}', this run is for job '{}'",
                state->job_id,
                m_options.job_id
            );
            state.reset();
        }
        m_last_completed = state ? state->last_completed_index : 0;

        int index = start_index(state);
        m_index = index;
        if (index > m_options.target_end)
        {
            LOG_INFO << fmt::format("Nothing to download up to index {}", m_options.target_end);
            return finish();
        }

        std::error_code ec;
        fs::create_directories(m_options.output_location, ec);
        if (ec)
        {
            return abort(
                AbortReason::state_store_failure,
                fmt::format(
                    "Output directory '{}' is not usable: {}",
                    m_options.output_location.string(),
                    ec.message()
                )
            );
        }

        if (!m_session)
        {
            transition(EngineState::refreshing, index);
            auto initial = m_auth_provider.refresh(m_options.credentials);
            if (!initial)
            {
                return abort(AbortReason::auth_unavailable, initial.error().what());
            }
            m_session.emplace(std::move(initial).value());
        }

        int refreshes_for_index = 0;
        while (true)
        {
            if (is_sig_interrupted())
            {
                return abort(AbortReason::interrupted, "Interrupted by user");
            }

            transition(EngineState::downloading, index);
            if (m_session->is_stale(session_age_hint, m_clock.now()))
            {
                LOG_DEBUG << "Session is more than an hour old, it may have expired";
            }

            const auto outcome = m_fetcher.fetch(index, *m_session, m_options.output_location);
            if (!outcome.ok() && is_sig_interrupted())
            {
                return abort(AbortReason::interrupted, "Interrupted by user");
            }

            switch (outcome.status)
            {
                case FetchStatus::success:
                {
                    if (auto saved = persist(index); !saved)
                    {
                        return abort(AbortReason::state_store_failure, saved.error().what());
                    }
                    ++m_downloaded;
                    refreshes_for_index = 0;
                    if (index >= m_options.target_end)
                    {
                        return finish();
                    }

                    transition(EngineState::waiting, index);
                    if (!m_clock.sleep_for(m_options.delay))
                    {
                        return abort(AbortReason::interrupted, "Interrupted by user");
                    }
                    ++index;
                    break;
                }
                case FetchStatus::auth_failure:
                {
                    LOG_WARNING << outcome.message;
                    std::string failure = outcome.message;
                    if (!refresh_session(refreshes_for_index, failure))
                    {
                        if (is_sig_interrupted())
                        {
                            return abort(AbortReason::interrupted, "Interrupted by user");
                        }
                        return abort(
                            AbortReason::auth_exhausted,
                            fmt::format(
                                "Session still rejected after {} refresh(es): {}",
                                refreshes_for_index,
                                failure
                            )
                        );
                    }
                    // Same index, new session.
                    break;
                }
                default:
                    return abort(abort_reason_of(outcome.status), outcome.message);
            }
        }
    }
}
