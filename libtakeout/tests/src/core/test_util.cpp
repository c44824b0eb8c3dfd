// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>
#include <string>

#include <catch2/catch_all.hpp>

#include "takeout/core/error_handling.hpp"
#include "takeout/core/util.hpp"
#include "takeout/core/util_scope.hpp"

#include "takeouttests.hpp"

namespace takeout
{
    namespace
    {
        TEST_CASE("TemporaryDirectory", "[takeout::core][takeout::core::util]")
        {
            fs::path path;
            {
                const auto tmp_dir = TemporaryDirectory();
                path = tmp_dir.path();
                REQUIRE(fs::is_directory(path));
                takeouttests::write_file(path / "file.txt", "content");
            }
            REQUIRE_FALSE(fs::exists(path));
        }

        TEST_CASE("read_contents", "[takeout::core][takeout::core::util]")
        {
            const auto tmp_dir = TemporaryDirectory();
            takeouttests::write_file(tmp_dir.path() / "file.txt", "line 1\nline 2\n");

            const auto contents = read_contents(tmp_dir.path() / "file.txt");
            REQUIRE(contents.has_value());
            REQUIRE(contents.value() == "line 1\nline 2\n");

            REQUIRE_FALSE(read_contents(tmp_dir.path() / "missing.txt"));
        }

        TEST_CASE("hide_secrets", "[takeout::core][takeout::core::util]")
        {
            REQUIRE(
                hide_secrets("https://takeout.google.com/x?i=1&j=job&rapt=AEjHL4N_secret&z=1")
                == "https://takeout.google.com/x?i=1&j=job&rapt=*****&z=1"
            );
            REQUIRE(hide_secrets("> Cookie: SID=abc; HSID=def") == "> Cookie: *****");
            REQUIRE(hide_secrets("authorization: Bearer xyz\r\nAccept: */*")
                    == "authorization: *****\r\nAccept: */*");
            REQUIRE(hide_secrets("nothing to hide") == "nothing to hide");
        }

        TEST_CASE("LockFile", "[takeout::core][takeout::core::util]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto path = tmp_dir.path() / ".takeout.lock";

            auto lock = LockFile::try_lock(path);
            REQUIRE(lock.has_value());
            REQUIRE(lock->is_locked());
            REQUIRE(lock->path() == path);

            SECTION("A second owner is refused")
            {
                const auto other = LockFile::try_lock(path);
                REQUIRE_FALSE(other);
                REQUIRE(other.error().error_code() == takeout_error_code::lockfile_failure);
            }

            SECTION("Released on destruction")
            {
                {
                    auto moved = std::move(lock).value();
                    REQUIRE(moved.is_locked());
                }
                REQUIRE(LockFile::try_lock(path).has_value());
            }

            SECTION("Missing directory")
            {
                const auto other = LockFile::try_lock(tmp_dir.path() / "nowhere" / "lock");
                REQUIRE_FALSE(other);
                REQUIRE(other.error().error_code() == takeout_error_code::lockfile_failure);
            }
        }

        TEST_CASE("on_scope_exit", "[takeout::core][takeout::core::util]")
        {
            int calls = 0;
            {
                auto guard = on_scope_exit([&] { ++calls; });
                REQUIRE(calls == 0);
            }
            REQUIRE(calls == 1);

            // Errors are logged, not propagated.
            auto throwing_guard = []
            { auto guard = on_scope_exit([] { throw std::runtime_error("x"); }); };
            REQUIRE_NOTHROW(throwing_guard());
        }

        TEST_CASE("extract", "[takeout::core][takeout::core::error_handling]")
        {
            expected_t<int> good = 3;
            REQUIRE(extract(good) == 3);

            expected_t<int> bad = make_unexpected("broken", takeout_error_code::internal_failure);
            REQUIRE_THROWS_AS(extract(bad), takeout_error);

            expected_t<void> bad_void = make_unexpected(
                std::string("broken"),
                takeout_error_code::configuration_error
            );
            REQUIRE_THROWS_AS(extract(bad_void), takeout_error);
            REQUIRE_NOTHROW(extract(expected_t<void>()));

            const auto forward = [&]() -> expected_t<std::string> { return forward_error(bad); };
            const auto forwarded = forward();
            REQUIRE_FALSE(forwarded);
            REQUIRE(forwarded.error().error_code() == takeout_error_code::internal_failure);
            REQUIRE(std::string(forwarded.error().what()) == "broken");
        }
    }
}
