// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "takeout/api/download.hpp"
#include "takeout/core/captured_request.hpp"
#include "takeout/core/clock.hpp"
#include "takeout/core/logging.hpp"
#include "takeout/core/state_store.hpp"
#include "takeout/core/thread_utils.hpp"
#include "takeout/core/util.hpp"
#include "takeout/core/util_scope.hpp"
#include "takeout/download/http_client.hpp"

namespace takeout
{
    expected_t<void> validate_range(const DownloadRange& range, int max_index)
    {
        auto usage_error = [](std::string msg)
        { return make_unexpected(std::move(msg), takeout_error_code::incorrect_usage); };

        if (range.continue_mode && range.start)
        {
            return usage_error("Cannot use --start together with --continue");
        }
        if (!range.continue_mode && !range.start)
        {
            return usage_error("Either --start or --continue is required");
        }
        const int start = range.start.value_or(1);
        const int end = range.end.value_or(max_index);
        if (start < 1)
        {
            return usage_error("Start index must be at least 1");
        }
        if (end > max_index)
        {
            return usage_error(fmt::format("End index cannot exceed {}", max_index));
        }
        if (start > end)
        {
            return usage_error("Start index cannot be greater than end index");
        }
        return {};
    }

    expected_t<RunResult> download_archives(
        const Context& ctx,
        const DownloadRange& range,
        const DownloadCallbacks& callbacks
    )
    {
        if (auto valid = validate_range(range, ctx.job_params.max_index); !valid)
        {
            return forward_error(valid);
        }

        try
        {
            const auto& output = ctx.retrieval_params.output_directory;
            fs::create_directories(output);
            auto lock = LockFile::try_lock(ctx.lock_file());
            if (!lock)
            {
                return forward_error(lock);
            }

            SystemClock clock;
            download::CurlHttpClient client(ctx.remote_fetch_params);

            ArchiveFetcher fetcher(
                client,
                { ctx.job_params.service_host, ctx.job_params.job_id },
                clock
            );
            if (callbacks.on_progress)
            {
                fetcher.set_progress_callback(*callbacks.on_progress);
            }

            CapturedRequestAuthProvider auth_provider(
                { ctx.auth_params.capture_file,
                  ctx.job_params.service_host,
                  ctx.auth_params.refresh_command },
                clock
            );
            JsonStateStore store(ctx.state_file());

            EngineOptions options;
            options.output_location = output;
            options.job_id = ctx.job_params.job_id;
            options.requested_start = range.continue_mode ? 1 : range.start.value_or(1);
            options.target_end = range.end.value_or(ctx.job_params.max_index);
            options.max_index = ctx.job_params.max_index;
            options.delay = std::chrono::seconds(ctx.retrieval_params.download_delay);
            options.max_auth_refreshes = ctx.retrieval_params.max_auth_refreshes;
            options.credentials = { ctx.auth_params.account, ctx.job_params.job_id };

            RetrievalEngine engine(std::move(options), fetcher, auth_provider, store, clock);
            if (callbacks.on_transition)
            {
                engine.on_transition(*callbacks.on_transition);
            }

            reset_sig_interrupted();
            set_default_signal_handler();
            on_scope_exit restore_handler{ [] { restore_previous_signal_handler(); } };

            LOG_INFO << fmt::format(
                "Downloading job {} into {}",
                ctx.job_params.job_id,
                output.string()
            );
            return engine.run();
        }
        catch (const takeout_error& e)
        {
            return tl::make_unexpected(e);
        }
        catch (const std::exception& e)
        {
            return make_unexpected(e.what(), takeout_error_code::download_failure);
        }
    }
}
