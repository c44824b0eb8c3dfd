// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <vector>

#include <catch2/catch_all.hpp>

#include "takeout/api/download.hpp"
#include "takeout/api/status.hpp"
#include "takeout/core/util.hpp"

#include "takeouttests.hpp"

namespace takeout
{
    namespace
    {
        TEST_CASE("validate_range", "[takeout::api]")
        {
            auto error_code = [](const DownloadRange& range)
            { return validate_range(range, 277).error().error_code(); };

            REQUIRE(validate_range({ 1, 1, false }, 277).has_value());
            REQUIRE(validate_range({ std::nullopt, std::nullopt, true }, 277).has_value());
            REQUIRE(validate_range({ std::nullopt, 10, true }, 277).has_value());
            REQUIRE(validate_range({ 5, std::nullopt, false }, 277).has_value());

            // --start and --continue are mutually exclusive, one of them is needed.
            REQUIRE(error_code({ 1, 10, true }) == takeout_error_code::incorrect_usage);
            REQUIRE(error_code({ std::nullopt, 10, false }) == takeout_error_code::incorrect_usage);

            REQUIRE_FALSE(validate_range({ 0, 10, false }, 277));
            REQUIRE_FALSE(validate_range({ 1, 278, false }, 277));
            REQUIRE_FALSE(validate_range({ 11, 10, false }, 277));
            REQUIRE_FALSE(validate_range({ std::nullopt, 3, true }, 2));
        }

        class DownloadTest
        {
        protected:

            DownloadTest()
            {
                ctx.job_params.job_id = "job-123";
                ctx.retrieval_params.output_directory = tmp_dir.path() / "GoogleTakeout";
                ctx.retrieval_params.download_delay = 0;
                ctx.auth_params.capture_file = tmp_dir.path() / "curl.txt";
            }

            takeouttests::EnvironmentCleaner cleaner;
            TemporaryDirectory tmp_dir;
            Context ctx;
        };

        TEST_CASE_METHOD(DownloadTest, "download_archives setup errors", "[takeout::api]")
        {
            SECTION("Invalid range")
            {
                const auto result = download_archives(ctx, { 3, 2, false });
                REQUIRE_FALSE(result);
                REQUIRE(result.error().error_code() == takeout_error_code::incorrect_usage);
                REQUIRE_FALSE(fs::exists(ctx.retrieval_params.output_directory));
            }

            SECTION("Directory in use")
            {
                fs::create_directories(ctx.retrieval_params.output_directory);
                const auto lock = LockFile::try_lock(ctx.lock_file());
                REQUIRE(lock.has_value());

                const auto result = download_archives(ctx, { 1, 2, false });
                REQUIRE_FALSE(result);
                REQUIRE(result.error().error_code() == takeout_error_code::lockfile_failure);
            }
        }

        TEST_CASE_METHOD(DownloadTest, "download_archives runs the engine", "[takeout::api]")
        {
            std::vector<EngineState> states;
            DownloadCallbacks callbacks;
            callbacks.on_transition = [&](EngineState state, int) { states.push_back(state); };

            SECTION("Nothing left to download")
            {
                fs::create_directories(ctx.retrieval_params.output_directory);
                takeouttests::write_file(
                    ctx.retrieval_params.output_directory / "takeout-20250101T000000Z-002.zip",
                    "data"
                );

                const auto result = download_archives(ctx, { std::nullopt, 2, true }, callbacks);
                REQUIRE(result.has_value());
                REQUIRE(result->state == EngineState::done);
                REQUIRE(result->exit_code() == 0);
                REQUIRE(result->downloaded_count == 0);
                REQUIRE(states == std::vector<EngineState>{ EngineState::idle, EngineState::done });
            }

            SECTION("No session available")
            {
                const auto result = download_archives(ctx, { 1, 2, false }, callbacks);
                REQUIRE(result.has_value());
                REQUIRE(result->state == EngineState::aborted);
                REQUIRE(result->reason == AbortReason::auth_unavailable);
                REQUIRE(result->exit_code() == 1);
                REQUIRE(states.back() == EngineState::aborted);
            }

            // The lock is released once the call returns.
            REQUIRE(LockFile::try_lock(ctx.lock_file()).has_value());
        }

        TEST_CASE_METHOD(DownloadTest, "retrieval_status", "[takeout::api]")
        {
            const auto& dir = ctx.retrieval_params.output_directory;

            SECTION("Fresh directory")
            {
                const auto status = retrieval_status(ctx);
                REQUIRE(status.has_value());
                REQUIRE(status->resume_index == 1);
                REQUIRE(status->archives.empty());
                REQUIRE_FALSE(status->state.has_value());
            }

            SECTION("Archives and recorded state")
            {
                fs::create_directories(dir);
                takeouttests::write_file(dir / "takeout-20250101T000000Z-001.zip", "a");
                takeouttests::write_file(dir / "takeout-20250101T000000Z-002.zip", "b");

                RetrievalState state;
                state.last_completed_index = 4;
                state.job_id = "job-123";
                REQUIRE(JsonStateStore(ctx.state_file()).save(state).has_value());

                const auto status = retrieval_status(ctx);
                REQUIRE(status.has_value());
                REQUIRE(status->archives.size() == 2);
                REQUIRE(status->resume_index == 5);
                REQUIRE(status->state.has_value());
                REQUIRE_FALSE(status->state_for_other_job);

                SECTION("State of another job")
                {
                    ctx.job_params.job_id = "job-456";
                    const auto other = retrieval_status(ctx);
                    REQUIRE(other.has_value());
                    REQUIRE(other->state_for_other_job);
                    REQUIRE(other->resume_index == 3);
                }
            }

            SECTION("Corrupted state")
            {
                fs::create_directories(dir);
                takeouttests::write_file(ctx.state_file(), "not json");
                const auto status = retrieval_status(ctx);
                REQUIRE_FALSE(status);
                REQUIRE(status.error().error_code() == takeout_error_code::state_store_failure);
            }
        }
    }
}
