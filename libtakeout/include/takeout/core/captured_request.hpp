// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_CAPTURED_REQUEST_HPP
#define TAKEOUT_CORE_CAPTURED_REQUEST_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "takeout/core/auth_provider.hpp"
#include "takeout/core/auth_session.hpp"
#include "takeout/core/clock.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * A request copied from a browser with "Copy as cURL".
     */
    struct CapturedRequest
    {
        std::string url = "";
        header_map headers = {};
        cookie_map cookies = {};
        std::string session_token = "";

        /// Host part of the url, lower case, without port nor user info.
        std::string host() const;

        AuthSession to_session(AuthSession::time_point obtained_at) const;
    };

    /**
     * Split a command line the way a POSIX shell would: single quotes, double
     * quotes, ``$'...'`` strings, backslash escapes and line continuations.
     */
    expected_t<std::vector<std::string>> split_shell_words(std::string_view command);

    /**
     * Parse a curl command line.
     *
     * Headers come from ``-H``, ``-A`` and ``-e``, cookies from ``-b`` and from
     * a ``Cookie`` header. Headers curl computes by itself (``Host``,
     * ``Content-Length``, ...) are dropped. The session token is the ``rapt``
     * query parameter; a command without one is an error.
     */
    expected_t<CapturedRequest> parse_curl_command(std::string_view command);

    /**
     * AuthProvider replaying a captured request stored in a file.
     *
     * A refresh optionally runs @ref Options::refresh_command first, which is
     * expected to write a newer capture, then reads the file again. Reading the
     * same token as the previous call is a failure: retrying with it cannot work.
     */
    class CapturedRequestAuthProvider : public AuthProvider
    {
    public:

        struct Options
        {
            fs::path capture_file = "curl.txt";
            std::string service_host = "takeout.google.com";
            std::optional<std::string> refresh_command = std::nullopt;
        };

        CapturedRequestAuthProvider(Options options, const Clock& clock);

        const Options& options() const;

    private:

        expected_t<AuthSession> refresh_impl(const Credentials& credentials) override;

        expected_t<void> run_refresh_command(const Credentials& credentials) const;
        expected_t<CapturedRequest> read_capture() const;

        Options m_options;
        const Clock& m_clock;
        std::optional<std::string> m_last_token;
    };
}

#endif
