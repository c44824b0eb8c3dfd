// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <map>
#include <regex>
#include <set>

#include <fmt/format.h>
#include <reproc++/run.hpp>

#include "takeout/core/captured_request.hpp"
#include "takeout/core/logging.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/environment.hpp"
#include "takeout/util/string.hpp"

namespace takeout
{
    namespace
    {
        tl::unexpected<takeout_error> parse_error(std::string msg)
        {
            return make_unexpected(std::move(msg), takeout_error_code::capture_parse_error);
        }

        // Options whose value we do not care about but must not mistake for the URL.
        const std::set<std::string_view>& ignored_options_with_value()
        {
            static const std::set<std::string_view> options = {
                "-X",         "--request",      "-d",
                "--data",     "--data-raw",     "--data-binary",
                "-o",         "--output",       "-u",
                "--user",     "--data-ascii",   "--data-urlencode",
                "-x",         "--proxy",        "-m",
                "--max-time", "--connect-timeout",
            };
            return options;
        }

        bool is_dropped_header(std::string_view name)
        {
            static constexpr std::array<std::string_view, 4> dropped = {
                "host",
                "content-length",
                "accept-encoding",
                "range",
            };
            for (auto d : dropped)
            {
                if (util::iequals(name, d))
                {
                    return true;
                }
            }
            return false;
        }

        void add_cookies(cookie_map& cookies, std::string_view value)
        {
            for (const auto& pair : util::split(value, ";"))
            {
                const auto stripped = util::strip(pair);
                if (stripped.empty())
                {
                    continue;
                }
                auto [name, val] = util::split_once(stripped, "=");
                if (!name.empty())
                {
                    cookies[std::string(util::strip(name))] = std::string(val);
                }
            }
        }

        void add_header(CapturedRequest& request, std::string_view line)
        {
            auto [name, value] = util::split_once(line, ":");
            name = util::strip(name);
            value = util::strip(value);
            if (name.empty())
            {
                return;
            }
            if (util::iequals(name, "cookie"))
            {
                add_cookies(request.cookies, value);
            }
            else if (!is_dropped_header(name))
            {
                request.headers[std::string(name)] = std::string(value);
            }
        }

        std::optional<std::string> find_session_token(std::string_view text)
        {
            static const std::regex token_regex("rapt=([^&\\s'\"]+)");
            std::match_results<std::string_view::const_iterator> match;
            if (std::regex_search(text.begin(), text.end(), match, token_regex))
            {
                return match[1].str();
            }
            return std::nullopt;
        }

        bool is_escapable_in_double_quotes(char c)
        {
            return std::string_view("\"\\$`\n").find(c) != std::string_view::npos;
        }

        void append_escaped(std::string& out, char c)
        {
            switch (c)
            {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'r':
                    out += '\r';
                    break;
                default:
                    out += c;
                    break;
            }
        }
    }

    /*******************
     * CapturedRequest *
     *******************/

    std::string CapturedRequest::host() const
    {
        auto [scheme, rest] = util::split_once(url, "://");
        if (rest.empty())
        {
            rest = scheme;
        }
        auto authority = rest.substr(0, rest.find_first_of("/?#"));
        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            authority = authority.substr(at + 1);
        }
        return util::to_lower(authority.substr(0, authority.find(':')));
    }

    AuthSession CapturedRequest::to_session(AuthSession::time_point obtained_at) const
    {
        return AuthSession(headers, cookies, session_token, obtained_at);
    }

    expected_t<std::vector<std::string>> split_shell_words(std::string_view command)
    {
        std::vector<std::string> words;
        std::string current;
        bool in_word = false;

        std::size_t i = 0;
        const std::size_t n = command.size();
        while (i < n)
        {
            const char c = command[i];
            if (c == '\\')
            {
                if (i + 1 < n && (command[i + 1] == '\n' || command[i + 1] == '\r'))
                {
                    // Line continuation
                    i += (command[i + 1] == '\r' && i + 2 < n && command[i + 2] == '\n') ? 3 : 2;
                    continue;
                }
                if (i + 1 < n)
                {
                    current += command[i + 1];
                    in_word = true;
                }
                i += 2;
            }
            else if (c == '\'')
            {
                const auto end = command.find('\'', i + 1);
                if (end == std::string_view::npos)
                {
                    return parse_error("Unterminated single quote in capture");
                }
                current.append(command.substr(i + 1, end - i - 1));
                in_word = true;
                i = end + 1;
            }
            else if (c == '$' && i + 1 < n && command[i + 1] == '\'')
            {
                i += 2;
                bool closed = false;
                while (i < n)
                {
                    if (command[i] == '\\' && i + 1 < n)
                    {
                        append_escaped(current, command[i + 1]);
                        i += 2;
                    }
                    else if (command[i] == '\'')
                    {
                        closed = true;
                        ++i;
                        break;
                    }
                    else
                    {
                        current += command[i++];
                    }
                }
                if (!closed)
                {
                    return parse_error("Unterminated $'' string in capture");
                }
                in_word = true;
            }
            else if (c == '"')
            {
                ++i;
                bool closed = false;
                while (i < n)
                {
                    if (command[i] == '\\' && i + 1 < n
                        && is_escapable_in_double_quotes(command[i + 1]))
                    {
                        if (command[i + 1] != '\n')
                        {
                            current += command[i + 1];
                        }
                        i += 2;
                    }
                    else if (command[i] == '"')
                    {
                        closed = true;
                        ++i;
                        break;
                    }
                    else
                    {
                        current += command[i++];
                    }
                }
                if (!closed)
                {
                    return parse_error("Unterminated double quote in capture");
                }
                in_word = true;
            }
            else if (util::is_space(c))
            {
                if (in_word)
                {
                    words.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
                ++i;
            }
            else
            {
                current += c;
                in_word = true;
                ++i;
            }
        }
        if (in_word)
        {
            words.push_back(std::move(current));
        }
        return words;
    }

    expected_t<CapturedRequest> parse_curl_command(std::string_view command)
    {
        auto words = split_shell_words(command);
        if (!words)
        {
            return forward_error(words);
        }

        CapturedRequest request;
        const auto& args = words.value();
        std::size_t i = 0;
        if (!args.empty() && (args[0] == "curl" || util::ends_with(args[0], "/curl")))
        {
            ++i;
        }

        auto value_of = [&](std::string_view option) -> expected_t<std::string>
        {
            if (i + 1 >= args.size())
            {
                return parse_error(fmt::format("Option '{}' has no value in capture", option));
            }
            return args[++i];
        };

        for (; i < args.size(); ++i)
        {
            const std::string& arg = args[i];
            if (arg == "-H" || arg == "--header")
            {
                auto value = value_of(arg);
                if (!value)
                {
                    return forward_error(value);
                }
                add_header(request, value.value());
            }
            else if (arg == "-b" || arg == "--cookie")
            {
                auto value = value_of(arg);
                if (!value)
                {
                    return forward_error(value);
                }
                add_cookies(request.cookies, value.value());
            }
            else if (arg == "-A" || arg == "--user-agent")
            {
                auto value = value_of(arg);
                if (!value)
                {
                    return forward_error(value);
                }
                request.headers["User-Agent"] = value.value();
            }
            else if (arg == "-e" || arg == "--referer")
            {
                auto value = value_of(arg);
                if (!value)
                {
                    return forward_error(value);
                }
                request.headers["Referer"] = value.value();
            }
            else if (arg == "--url")
            {
                auto value = value_of(arg);
                if (!value)
                {
                    return forward_error(value);
                }
                request.url = value.value();
            }
            else if (ignored_options_with_value().count(arg) != 0)
            {
                ++i;
            }
            else if (util::starts_with(arg, "-"))
            {
                LOG_TRACE << "Ignoring curl option '" << arg << "'";
            }
            else if (request.url.empty())
            {
                request.url = arg;
            }
        }

        // The token normally sits in the URL, but any occurrence will do.
        auto token = find_session_token(request.url);
        if (!token)
        {
            token = find_session_token(command);
        }
        if (!token)
        {
            return parse_error("No rapt token found in capture");
        }
        request.session_token = std::move(token).value();
        return request;
    }

    /*******************************
     * CapturedRequestAuthProvider *
     *******************************/

    CapturedRequestAuthProvider::CapturedRequestAuthProvider(Options options, const Clock& clock)
        : m_options(std::move(options))
        , m_clock(clock)
    {
    }

    auto CapturedRequestAuthProvider::options() const -> const Options&
    {
        return m_options;
    }

    expected_t<AuthSession>
    CapturedRequestAuthProvider::refresh_impl(const Credentials& credentials)
    {
        // The first session comes from the existing capture if there is one.
        const bool need_new_capture = m_last_token.has_value()
                                      || !fs::exists(m_options.capture_file);
        if (m_options.refresh_command && need_new_capture)
        {
            if (auto ran = run_refresh_command(credentials); !ran)
            {
                return forward_error(ran);
            }
        }

        auto capture = read_capture();
        if (!capture)
        {
            return tl::make_unexpected(takeout_error(
                capture.error().what(),
                takeout_error_code::auth_failure
            ));
        }

        if (m_last_token && *m_last_token == capture->session_token)
        {
            return make_unexpected(
                fmt::format(
                    "'{}' still holds the session token that was rejected, capture a new request",
                    m_options.capture_file.string()
                ),
                takeout_error_code::auth_failure
            );
        }

        m_last_token = capture->session_token;
        LOG_INFO << fmt::format(
            "Session read from '{}' ({} headers, {} cookies)",
            m_options.capture_file.string(),
            capture->headers.size(),
            capture->cookies.size()
        );
        return capture->to_session(m_clock.now());
    }

    expected_t<void>
    CapturedRequestAuthProvider::run_refresh_command(const Credentials& credentials) const
    {
        const std::array<std::string, 3> args = { "/bin/sh", "-c", *m_options.refresh_command };

        reproc::options options;
        options.env.behavior = reproc::env::extend;
        std::map<std::string, std::string> envmap = {
            { "TAKEOUT_CAPTURE_FILE", m_options.capture_file.string() },
            { "TAKEOUT_JOB_ID", credentials.job_id },
            { "TAKEOUT_ACCOUNT", credentials.account },
        };
        options.env.extra = envmap;

        LOG_INFO << "Running refresh command: " << *m_options.refresh_command;
        std::string out;
        std::string err;
        auto [status, ec] = reproc::run(
            args,
            options,
            reproc::sink::string(out),
            reproc::sink::string(err)
        );

        if (!out.empty())
        {
            LOG_DEBUG << "Refresh command output:\n" << util::rstrip(out);
        }
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not run refresh command: {}", ec.message()),
                takeout_error_code::auth_failure
            );
        }
        if (status != 0)
        {
            return make_unexpected(
                fmt::format(
                    "Refresh command exited with status {}: {}",
                    status,
                    util::strip(err)
                ),
                takeout_error_code::auth_failure
            );
        }
        return {};
    }

    expected_t<CapturedRequest> CapturedRequestAuthProvider::read_capture() const
    {
        auto contents = read_contents(m_options.capture_file);
        if (!contents)
        {
            return forward_error(contents);
        }

        auto capture = parse_curl_command(contents.value());
        if (!capture)
        {
            return make_unexpected(
                fmt::format(
                    "Invalid capture '{}': {}",
                    m_options.capture_file.string(),
                    capture.error().what()
                ),
                takeout_error_code::capture_parse_error
            );
        }

        if (!capture->url.empty() && capture->host() != util::to_lower(m_options.service_host))
        {
            return make_unexpected(
                fmt::format(
                    "Capture '{}' is a request to '{}', not to '{}'",
                    m_options.capture_file.string(),
                    capture->host(),
                    m_options.service_host
                ),
                takeout_error_code::capture_parse_error
            );
        }
        return capture;
    }
}
