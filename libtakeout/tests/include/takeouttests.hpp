// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBTAKEOUTTESTS_HPP
#define LIBTAKEOUTTESTS_HPP

#include <chrono>
#include <deque>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "takeout/core/auth_provider.hpp"
#include "takeout/core/auth_session.hpp"
#include "takeout/core/clock.hpp"
#include "takeout/core/state_store.hpp"
#include "takeout/core/thread_utils.hpp"
#include "takeout/download/http_client.hpp"
#include "takeout/fs/filesystem.hpp"
#include "takeout/util/environment.hpp"

namespace takeouttests
{

#ifndef TAKEOUT_TEST_DATA_DIR
#error "TAKEOUT_TEST_DATA_DIR must be defined pointing to test data"
#endif
    inline static const takeout::fs::path test_data_dir = TAKEOUT_TEST_DATA_DIR;

    // 2025-01-01T00:00:00Z
    inline const takeout::Clock::time_point new_year_2025 = takeout::Clock::time_point(
        std::chrono::seconds(1735689600)
    );

    inline void write_file(const takeout::fs::path& path, std::string_view contents)
    {
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        out << contents;
    }

    inline takeout::AuthSession make_session(std::string token)
    {
        return takeout::AuthSession(
            { { "User-Agent", "test" } },
            { { "SID", "abc" } },
            std::move(token),
            new_year_2025
        );
    }

    /**
     * A clock that only moves when slept on.
     */
    class FakeClock : public takeout::Clock
    {
    public:

        explicit FakeClock(time_point start = new_year_2025)
            : m_now(start)
        {
        }

        time_point now() const override
        {
            return m_now;
        }

        bool sleep_for(std::chrono::milliseconds duration) const override
        {
            sleeps.push_back(duration);
            m_now += duration;
            return !interrupt_sleep;
        }

        mutable std::vector<std::chrono::milliseconds> sleeps;
        bool interrupt_sleep = false;

    private:

        mutable time_point m_now;
    };

    /**
     * Answers requests from a list of canned responses, in order.
     *
     * The body of an accepted response is written to the request file the way
     * the libcurl client does it. Once the list is exhausted, every request
     * fails without a response.
     */
    class ScriptedHttpClient : public takeout::download::HttpClient
    {
    public:

        struct Response
        {
            int status = 200;
            std::string content_type = "application/zip";
            std::string body = "";
            // Defaults to the body size.
            std::optional<std::size_t> content_length = std::nullopt;
            // Only the first half of the body is delivered, then the connection drops.
            bool truncated = false;
        };

        std::deque<Response> responses;
        std::vector<takeout::download::Request> requests;
        std::optional<std::function<void(const takeout::download::Request&)>> on_get;

        void add(Response response)
        {
            responses.push_back(std::move(response));
        }

        void add_archive(std::size_t size)
        {
            Response response;
            response.body = std::string(size, 'z');
            add(std::move(response));
        }

    private:

        takeout::download::Result get_impl(const takeout::download::Request& request) override
        {
            using namespace takeout::download;

            requests.push_back(request);
            if (on_get)
            {
                (*on_get)(request);
            }
            if (responses.empty())
            {
                return tl::make_unexpected(Error{ "Could not resolve host", std::nullopt, false });
            }

            Response response = std::move(responses.front());
            responses.pop_front();

            TransferData transfer;
            transfer.http_status = response.status;
            transfer.effective_url = request.url;
            transfer.content_type = response.content_type;
            transfer.content_length = response.content_length.value_or(response.body.size());

            const ResponseHead head{
                transfer.http_status,
                transfer.content_type,
                transfer.content_length,
            };
            if (request.accept && !(*request.accept)(head))
            {
                return tl::make_unexpected(Error{ "Response refused", transfer, true });
            }

            const std::string delivered = response.truncated
                                              ? response.body.substr(0, response.body.size() / 2)
                                              : response.body;
            write_file(request.filename, delivered);
            transfer.downloaded_size = delivered.size();
            if (request.progress)
            {
                (*request.progress)(Progress{ delivered.size(), response.body.size(), 0 });
            }

            if (response.truncated)
            {
                return tl::make_unexpected(
                    Error{ "Transferred a partial file", transfer, false }
                );
            }
            if (transfer.http_status < 200 || transfer.http_status >= 300)
            {
                takeout::fs::remove(request.filename);
                return tl::make_unexpected(Error{ "HTTP error", transfer, false });
            }
            return Success{ request.filename, transfer };
        }
    };

    /**
     * Hands out the given tokens one per refresh, an empty entry is a failed refresh.
     */
    class ScriptedAuthProvider : public takeout::AuthProvider
    {
    public:

        void add(std::optional<std::string> token)
        {
            m_tokens.push_back(std::move(token));
        }

        int calls = 0;
        std::vector<takeout::Credentials> credentials;

    private:

        std::deque<std::optional<std::string>> m_tokens;

        takeout::expected_t<takeout::AuthSession>
        refresh_impl(const takeout::Credentials& creds) override
        {
            ++calls;
            credentials.push_back(creds);
            if (m_tokens.empty() || !m_tokens.front())
            {
                if (!m_tokens.empty())
                {
                    m_tokens.pop_front();
                }
                return takeout::make_unexpected(
                    "No session available",
                    takeout::takeout_error_code::auth_failure
                );
            }
            auto token = std::move(m_tokens.front()).value();
            m_tokens.pop_front();
            return make_session(std::move(token));
        }
    };

    class MemoryStateStore : public takeout::StateStore
    {
    public:

        std::optional<takeout::RetrievalState> state;
        std::vector<takeout::RetrievalState> saved;
        bool fail_load = false;
        bool fail_save = false;

    private:

        takeout::expected_t<std::optional<takeout::RetrievalState>> load_impl() const override
        {
            if (fail_load)
            {
                return takeout::make_unexpected(
                    "Corrupted state",
                    takeout::takeout_error_code::state_store_failure
                );
            }
            return state;
        }

        takeout::expected_t<void> save_impl(const takeout::RetrievalState& new_state) override
        {
            if (fail_save)
            {
                return takeout::make_unexpected(
                    "Disk full",
                    takeout::takeout_error_code::state_store_failure
                );
            }
            state = new_state;
            saved.push_back(new_state);
            return {};
        }
    };

    /**
     * Restores the interruption flag and the given environment variables.
     */
    class EnvironmentCleaner
    {
    public:

        explicit EnvironmentCleaner(std::vector<std::string> keys = {})
        {
            for (auto& key : keys)
            {
                m_env.emplace_back(key, takeout::util::get_env(key));
                takeout::util::unset_env(key);
            }
        }

        ~EnvironmentCleaner()
        {
            takeout::reset_sig_interrupted();
            for (const auto& [key, value] : m_env)
            {
                if (value)
                {
                    takeout::util::set_env(key, *value);
                }
                else
                {
                    takeout::util::unset_env(key);
                }
            }
        }

        EnvironmentCleaner(const EnvironmentCleaner&) = delete;
        EnvironmentCleaner& operator=(const EnvironmentCleaner&) = delete;

    private:

        std::vector<std::pair<std::string, std::optional<std::string>>> m_env;
    };
}
#endif
