// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "takeout/core/auth_session.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/util/string.hpp"

namespace takeout
{
    bool case_insensitive_less::operator()(std::string_view lhs, std::string_view rhs) const
    {
        return std::lexicographical_compare(
            lhs.begin(),
            lhs.end(),
            rhs.begin(),
            rhs.end(),
            [](char a, char b) { return util::to_lower(a) < util::to_lower(b); }
        );
    }

    AuthSession::AuthSession(
        header_map headers,
        cookie_map cookies,
        std::string session_token,
        time_point obtained_at
    )
        : m_headers(std::move(headers))
        , m_cookies(std::move(cookies))
        , m_session_token(std::move(session_token))
        , m_obtained_at(obtained_at)
    {
        if (m_session_token.empty())
        {
            throw takeout_error("Session token is empty", takeout_error_code::auth_failure);
        }
    }

    const header_map& AuthSession::headers() const
    {
        return m_headers;
    }

    const cookie_map& AuthSession::cookies() const
    {
        return m_cookies;
    }

    const std::string& AuthSession::session_token() const
    {
        return m_session_token;
    }

    auto AuthSession::obtained_at() const -> time_point
    {
        return m_obtained_at;
    }

    std::string AuthSession::cookie_header() const
    {
        std::vector<std::string> pairs;
        pairs.reserve(m_cookies.size());
        for (const auto& [name, value] : m_cookies)
        {
            pairs.push_back(name + "=" + value);
        }
        return util::join("; ", pairs);
    }

    bool AuthSession::is_stale(std::chrono::seconds max_age_hint, time_point now) const
    {
        return now - m_obtained_at > max_age_hint;
    }
}
