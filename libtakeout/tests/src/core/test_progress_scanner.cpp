// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "takeout/core/progress_scanner.hpp"
#include "takeout/core/util.hpp"

#include "takeouttests.hpp"

namespace takeout
{
    namespace
    {
        using takeouttests::write_file;

        TEST_CASE("find_resume_index", "[takeout::core][takeout::core::progress_scanner]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto& dir = tmp_dir.path();

            SECTION("Missing directory")
            {
                REQUIRE(find_resume_index(dir / "nowhere") == 1);
                REQUIRE(list_archives(dir / "nowhere").empty());
            }

            SECTION("Empty directory")
            {
                REQUIRE(find_resume_index(dir) == 1);
            }

            SECTION("One past the highest archive")
            {
                write_file(dir / "takeout-20250101T000000Z-005.zip", "data");
                REQUIRE(find_resume_index(dir) == 6);
            }

            SECTION("Gaps are not filled")
            {
                write_file(dir / "takeout-20250101T000000Z-001.zip", "data");
                write_file(dir / "takeout-20250102T000000Z-009.zip", "data");
                write_file(dir / "takeout-20250101T000000Z-003.zip", "data");
                REQUIRE(find_resume_index(dir) == 10);
                REQUIRE(find_resume_index(list_archives(dir)) == 10);
            }

            SECTION("Temporary and foreign files are ignored")
            {
                write_file(dir / "takeout-20250101T000000Z-002.zip", "data");
                write_file(dir / "tmp_20250101_000000_000000_007_abcd.zip", "partial");
                write_file(dir / "takeout-20250101T000000Z-008.zip.bak", "data");
                write_file(dir / "notes.txt", "");
                fs::create_directory(dir / "takeout-20250101T000000Z-009.zip");
                REQUIRE(find_resume_index(dir) == 3);
            }
        }

        TEST_CASE("list_archives", "[takeout::core][takeout::core::progress_scanner]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto& dir = tmp_dir.path();

            write_file(dir / "takeout-20250103T000000Z-003.zip", "ccc");
            write_file(dir / "takeout-20250101T000000Z-001.zip", "a");
            write_file(dir / "tmp_20250101_000000_000000_002_abcd.zip", "bb");

            const auto archives = list_archives(dir);
            REQUIRE(archives.size() == 2);
            REQUIRE(archives[0].index == 1);
            REQUIRE(archives[0].size_bytes == 1);
            REQUIRE(archives[0].path == dir / "takeout-20250101T000000Z-001.zip");
            REQUIRE(archives[1].index == 3);
            REQUIRE(archives[1].size_bytes == 3);
        }
    }
}
