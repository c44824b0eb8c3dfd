// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

#include "takeout/core/captured_request.hpp"
#include "takeout/core/util.hpp"

#include "takeouttests.hpp"

namespace takeout
{
    namespace
    {
        using takeouttests::write_file;

        TEST_CASE("split_shell_words", "[takeout::core][takeout::core::captured_request]")
        {
            using words = std::vector<std::string>;

            SECTION("Plain words")
            {
                REQUIRE(
                    split_shell_words("curl  -H   x\ty").value() == words{ "curl", "-H", "x", "y" }
                );
                REQUIRE(split_shell_words("").value().empty());
            }

            SECTION("Quotes")
            {
                REQUIRE(split_shell_words(R"('a b' "c \"d\" \$e" 'it'\''s')").value()
                        == words{ "a b", R"(c "d" $e)", "it's" });
                REQUIRE(split_shell_words(R"("back\slash")").value() == words{ R"(back\slash)" });
                REQUIRE(split_shell_words("''").value() == words{ "" });
            }

            SECTION("ANSI-C quotes")
            {
                REQUIRE(split_shell_words(R"($'a\tb\'c')").value() == words{ "a\tb'c" });
            }

            SECTION("Backslashes")
            {
                REQUIRE(split_shell_words(R"(a\ b c)").value() == words{ "a b", "c" });
                REQUIRE(split_shell_words("curl \\\n  -H x \\\r\n  y").value()
                        == words{ "curl", "-H", "x", "y" });
            }

            SECTION("Unterminated quotes")
            {
                for (std::string_view command : { "'abc", "\"abc", "$'abc" })
                {
                    const auto result = split_shell_words(command);
                    REQUIRE_FALSE(result);
                    REQUIRE(result.error().error_code() == takeout_error_code::capture_parse_error);
                }
            }
        }

        TEST_CASE("parse_curl_command", "[takeout::core][takeout::core::captured_request]")
        {
            SECTION("Complete command")
            {
                const auto command = "curl 'https://takeout.google.com/settings/takeout/download"
                                     "?i=0&j=123&download=true&rapt=test-rapt' \\\n"
                                     "    -H 'User-Agent: test' \\\n"
                                     "    -H 'Accept: test' \\\n"
                                     "    -b 'cookie1=value1; cookie2=value2'";

                const auto request = parse_curl_command(command);
                REQUIRE(request.has_value());
                REQUIRE(request->headers.at("User-Agent") == "test");
                REQUIRE(request->headers.at("Accept") == "test");
                REQUIRE(request->cookies.at("cookie1") == "value1");
                REQUIRE(request->cookies.at("cookie2") == "value2");
                REQUIRE(request->session_token == "test-rapt");
                REQUIRE(request->host() == "takeout.google.com");
            }

            SECTION("Missing token")
            {
                const auto request = parse_curl_command(
                    "curl 'https://takeout.google.com/' -H 'Accept: test' -b 'cookie=test'"
                );
                REQUIRE_FALSE(request);
                REQUIRE(request.error().error_code() == takeout_error_code::capture_parse_error);
            }

            SECTION("Single cookie")
            {
                const auto request = parse_curl_command(
                    "curl 'https://takeout.google.com/settings/takeout/download?rapt=test' -b 'a=1'"
                );
                REQUIRE(request.has_value());
                REQUIRE(request->cookies == cookie_map{ { "a", "1" } });
                REQUIRE(request->session_token == "test");
            }

            SECTION("Browser capture")
            {
                const auto contents = read_contents(takeouttests::test_data_dir / "curl.txt");
                REQUIRE(contents.has_value());
                const auto request = parse_curl_command(contents.value());
                REQUIRE(request.has_value());

                REQUIRE(request->session_token == "AEjHL4N_test-token_123");
                REQUIRE(request->host() == "takeout.google.com");
                REQUIRE(request->headers.at("User-Agent") == "Mozilla/5.0 (X11; Linux x86_64)");
                REQUIRE(request->headers.at("referer") == "https://takeout.google.com/manage");
                REQUIRE(request->headers.at("accept-language") == "en-US,en;q=0.9");
                // Folded into the cookies, or computed by libcurl.
                REQUIRE(request->headers.count("cookie") == 0);
                REQUIRE(request->headers.count("accept-encoding") == 0);
                REQUIRE(
                    request->cookies
                    == cookie_map{
                        { "HSID", "hsid-value" },
                        { "SID", "sid-value" },
                        { "__Secure-3PSID", "secure=value" },
                    }
                );
            }

            SECTION("Options")
            {
                const auto request = parse_curl_command(
                    "curl -X GET -A agent -e https://takeout.google.com/ -H 'Host: x' "
                    "-H 'Content-Length: 3' -H 'Range: bytes=0-' --compressed "
                    "--url 'https://takeout.google.com/settings/takeout/download?rapt=tok&i=1'"
                );
                REQUIRE(request.has_value());
                REQUIRE(request->url
                        == "https://takeout.google.com/settings/takeout/download?rapt=tok&i=1");
                REQUIRE(request->session_token == "tok");
                REQUIRE(request->headers.at("user-agent") == "agent");
                REQUIRE(request->headers.at("Referer") == "https://takeout.google.com/");
                REQUIRE(request->headers.size() == 2);
            }

            SECTION("Token outside of the URL")
            {
                const auto request = parse_curl_command(
                    "curl 'https://takeout.google.com/x' -H 'X-Debug: rapt=elsewhere'"
                );
                REQUIRE(request.has_value());
                REQUIRE(request->session_token == "elsewhere");
            }

            SECTION("Option without value")
            {
                REQUIRE_FALSE(parse_curl_command("curl 'https://x/?rapt=t' -H"));
            }
        }

        TEST_CASE("CapturedRequest::host", "[takeout::core][takeout::core::captured_request]")
        {
            CapturedRequest request;
            request.url = "https://user@Takeout.Google.com:443/settings?rapt=x";
            REQUIRE(request.host() == "takeout.google.com");
            request.url = "takeout.google.com/settings";
            REQUIRE(request.host() == "takeout.google.com");
        }

        class CaptureFileTest
        {
        protected:

            CaptureFileTest()
            {
                options.capture_file = tmp_dir.path() / "curl.txt";
            }

            void write_capture(std::string_view token, std::string_view host = "takeout.google.com")
            {
                write_file(
                    options.capture_file,
                    fmt::format(
                        "curl 'https://{}/settings/takeout/download?i=1&rapt={}' -b 'SID=1'",
                        host,
                        token
                    )
                );
            }

            TemporaryDirectory tmp_dir;
            takeouttests::FakeClock clock;
            CapturedRequestAuthProvider::Options options;
            Credentials credentials = { "someone@example.com", "job-123" };
        };

        TEST_CASE_METHOD(
            CaptureFileTest,
            "CapturedRequestAuthProvider reads the capture",
            "[takeout::core][takeout::core::captured_request]"
        )
        {
            write_capture("first");
            CapturedRequestAuthProvider provider(options, clock);

            const auto session = provider.refresh(credentials);
            REQUIRE(session.has_value());
            REQUIRE(session->session_token() == "first");
            REQUIRE(session->cookies().at("SID") == "1");
            REQUIRE(session->obtained_at() == clock.now());

            SECTION("The same token is refused")
            {
                const auto again = provider.refresh(credentials);
                REQUIRE_FALSE(again);
                REQUIRE(again.error().error_code() == takeout_error_code::auth_failure);
            }

            SECTION("A new capture is picked up")
            {
                write_capture("second");
                const auto again = provider.refresh(credentials);
                REQUIRE(again.has_value());
                REQUIRE(again->session_token() == "second");
            }
        }

        TEST_CASE_METHOD(
            CaptureFileTest,
            "CapturedRequestAuthProvider errors",
            "[takeout::core][takeout::core::captured_request]"
        )
        {
            SECTION("Missing file")
            {
                CapturedRequestAuthProvider provider(options, clock);
                const auto session = provider.refresh(credentials);
                REQUIRE_FALSE(session);
                REQUIRE(session.error().error_code() == takeout_error_code::auth_failure);
            }

            SECTION("Capture of another host")
            {
                write_capture("tok", "accounts.google.com");
                CapturedRequestAuthProvider provider(options, clock);
                const auto session = provider.refresh(credentials);
                REQUIRE_FALSE(session);
                REQUIRE(session.error().error_code() == takeout_error_code::auth_failure);
            }

            SECTION("Capture without token")
            {
                write_file(options.capture_file, "curl 'https://takeout.google.com/'");
                CapturedRequestAuthProvider provider(options, clock);
                REQUIRE_FALSE(provider.refresh(credentials));
            }
        }

        TEST_CASE_METHOD(
            CaptureFileTest,
            "CapturedRequestAuthProvider refresh command",
            "[takeout::core][takeout::core::captured_request]"
        )
        {
            // Writes a capture whose token is derived from the job id.
            options.refresh_command = R"(url='https://takeout.google.com/x?rapt=fresh-')"
                                      R"(; echo "curl '${url}${TAKEOUT_JOB_ID}'")"
                                      R"( > "$TAKEOUT_CAPTURE_FILE")";

            SECTION("Run when there is no capture yet")
            {
                CapturedRequestAuthProvider provider(options, clock);
                const auto session = provider.refresh(credentials);
                REQUIRE(session.has_value());
                REQUIRE(session->session_token() == "fresh-job-123");
            }

            SECTION("Not run for the first session")
            {
                write_capture("existing");
                CapturedRequestAuthProvider provider(options, clock);
                const auto first = provider.refresh(credentials);
                REQUIRE(first.has_value());
                REQUIRE(first->session_token() == "existing");

                const auto second = provider.refresh(credentials);
                REQUIRE(second.has_value());
                REQUIRE(second->session_token() == "fresh-job-123");
            }

            SECTION("Failing command")
            {
                options.refresh_command = "echo 'no browser' >&2; exit 3";
                CapturedRequestAuthProvider provider(options, clock);
                const auto session = provider.refresh(credentials);
                REQUIRE_FALSE(session);
                REQUIRE(session.error().error_code() == takeout_error_code::auth_failure);
                REQUIRE_THAT(session.error().what(), Catch::Matchers::ContainsSubstring("3"));
                REQUIRE_THAT(
                    session.error().what(),
                    Catch::Matchers::ContainsSubstring("no browser")
                );
            }
        }
    }
}
