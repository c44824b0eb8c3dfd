// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "takeout/core/thread_utils.hpp"
#include "takeout/core/util.hpp"
#include "takeout/core/util_scope.hpp"
#include "takeout/download/http_client.hpp"
#include "takeout/download/parameters.hpp"

#include "takeouttests.hpp"

namespace takeout
{
    namespace
    {
        TEST_CASE("proxy_match", "[takeout::download]")
        {
            const download::proxy_map_type proxies = {
                { "https", "http://proxy:1" },
                { "all://example.org", "http://proxy:2" },
                { "http://takeout.google.com", "http://proxy:3" },
                { "all", "http://proxy:4" },
            };

            REQUIRE(
                download::proxy_match("https://takeout.google.com/settings", proxies)
                == "http://proxy:1"
            );
            REQUIRE(
                download::proxy_match("http://user@takeout.google.com:80/x", proxies)
                == "http://proxy:3"
            );
            REQUIRE(download::proxy_match("http://example.org/a?b", proxies) == "http://proxy:2");
            REQUIRE(download::proxy_match("ftp://elsewhere.net/", proxies) == "http://proxy:4");
            REQUIRE_FALSE(download::proxy_match("https://takeout.google.com/", {}).has_value());
        }

        TEST_CASE("file_does_not_exist", "[takeout::download]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto destination = tmp_dir.path() / "archive.zip";

            download::CurlHttpClient client(download::RemoteFetchParams{});
            download::Request request(
                "test",
                "file:///nonexistent/takeout-20250101T000000Z-001.zip",
                destination.string()
            );

            const auto result = client.get(request);
            REQUIRE_FALSE(result);
            REQUIRE_FALSE(result.error().transfer.has_value());
            REQUIRE_FALSE(result.error().message.empty());
            REQUIRE_FALSE(fs::exists(destination));
        }

        TEST_CASE("Non HTTP success is an error", "[takeout::download]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto source = tmp_dir.path() / "source.zip";
            const auto destination = tmp_dir.path() / "archive.zip";
            takeouttests::write_file(source, "PK\x03\x04 not really a zip");

            download::CurlHttpClient client(download::RemoteFetchParams{});
            download::Request request("test", "file://" + source.string(), destination.string());

            SECTION("Without acceptance check")
            {
                const auto result = client.get(request);
                REQUIRE_FALSE(result);
                REQUIRE_FALSE(fs::exists(destination));
            }

            SECTION("Refused before writing")
            {
                int checks = 0;
                request.accept = [&](const download::ResponseHead& head)
                {
                    ++checks;
                    return head.http_status == 200;
                };
                const auto result = client.get(request);
                REQUIRE_FALSE(result);
                REQUIRE(result.error().rejected);
                REQUIRE(checks == 1);
                REQUIRE_FALSE(fs::exists(destination));
            }

            // The client can be reused after a failure.
            const auto again = client.get(request);
            REQUIRE_FALSE(again);
        }

        TEST_CASE("A shutdown request does not cut a transfer", "[takeout::download]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto source = tmp_dir.path() / "source.zip";
            const auto destination = tmp_dir.path() / "archive.zip";
            takeouttests::write_file(source, std::string(4096, 'z'));

            set_sig_interrupted();
            auto reset = on_scope_exit([] { reset_sig_interrupted(); });

            download::CurlHttpClient client(download::RemoteFetchParams{});
            download::Request request("test", "file://" + source.string(), destination.string());
            int checks = 0;
            request.accept = [&](const download::ResponseHead&)
            {
                ++checks;
                return false;
            };

            // The body reached the acceptance check, so the transfer was not aborted early.
            const auto result = client.get(request);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().rejected);
            REQUIRE(checks == 1);
            REQUIRE(is_sig_interrupted());
        }

        TEST_CASE("CurlHttpClient parameters", "[takeout::download]")
        {
            download::RemoteFetchParams params;
            params.user_agent = "takeout-dl/test";
            params.low_speed_time_secs = 120;
            const download::CurlHttpClient client(params);
            REQUIRE(client.params().user_agent == "takeout-dl/test");
            REQUIRE(client.params().low_speed_time_secs == 120);
            REQUIRE(client.params().connect_timeout_secs == 30.);
        }
    }
}
