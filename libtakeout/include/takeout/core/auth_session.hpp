// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_AUTH_SESSION_HPP
#define TAKEOUT_CORE_AUTH_SESSION_HPP

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace takeout
{
    struct case_insensitive_less
    {
        using is_transparent = void;

        bool operator()(std::string_view lhs, std::string_view rhs) const;
    };

    // HTTP header names compare case-insensitively.
    using header_map = std::map<std::string, std::string, case_insensitive_less>;
    using cookie_map = std::map<std::string, std::string>;

    /**
     * The authentication artifacts that go along with every archive request.
     *
     * All the fields are set together: a session is never partially refreshed,
     * the engine replaces it as a whole.
     */
    class AuthSession
    {
    public:

        using clock_type = std::chrono::system_clock;
        using time_point = clock_type::time_point;

        /// @throws takeout_error if @p session_token is empty.
        AuthSession(
            header_map headers,
            cookie_map cookies,
            std::string session_token,
            time_point obtained_at = clock_type::now()
        );

        const header_map& headers() const;
        const cookie_map& cookies() const;
        const std::string& session_token() const;
        time_point obtained_at() const;

        /// ``name=value`` pairs separated by ``"; "``, as sent in a Cookie header.
        std::string cookie_header() const;

        /**
         * Whether the session is older than @p max_age_hint.
         *
         * Tokens do not advertise their expiry so this is a hint only; an
         * expired session is detected from the server answer.
         */
        bool is_stale(std::chrono::seconds max_age_hint, time_point now = clock_type::now()) const;

    private:

        header_map m_headers;
        cookie_map m_cookies;
        std::string m_session_token;
        time_point m_obtained_at;
    };
}

#endif
