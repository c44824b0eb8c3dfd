// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdio>
#include <memory>

#include <fmt/format.h>

#include "takeout/api/configuration.hpp"
#include "takeout/api/download.hpp"
#include "takeout/core/error_handling.hpp"

#include "takeout_dl.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

namespace
{
    std::string format_size(std::size_t bytes)
    {
        constexpr double mib = 1024. * 1024.;
        if (bytes >= 1024 * mib)
        {
            return fmt::format("{:.2f} GiB", static_cast<double>(bytes) / (1024 * mib));
        }
        return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / mib);
    }

    // Prints a line every few dozen megabytes, archives are large and terminals slow.
    class ProgressPrinter
    {
    public:

        void operator()(const download::Progress& progress)
        {
            constexpr std::size_t step = 32 * 1024 * 1024;
            const bool complete = progress.downloaded_size == progress.total_to_download;
            if (progress.downloaded_size < m_next_print && !complete)
            {
                return;
            }
            m_next_print = progress.downloaded_size + step;
            if (progress.total_to_download > 0)
            {
                fmt::print(
                    "\r      {} / {} ({}/s)   ",
                    format_size(progress.downloaded_size),
                    format_size(progress.total_to_download),
                    format_size(progress.speed_Bps)
                );
            }
            else
            {
                fmt::print(
                    "\r      {} ({}/s)   ",
                    format_size(progress.downloaded_size),
                    format_size(progress.speed_Bps)
                );
            }
            std::fflush(stdout);
        }

        void reset()
        {
            m_next_print = 0;
        }

    private:

        std::size_t m_next_print = 0;
    };
}

void
set_download_command(
    CLI::App* subcom,
    Configuration& config,
    CommandLineOptions& options,
    int& exit_code
)
{
    init_general_options(subcom, options);
    init_job_options(subcom, options);
    init_auth_options(subcom, options);

    auto range = std::make_shared<DownloadRange>();

    auto* start = subcom->add_option("-s,--start", range->start, "First index to download")
                      ->check(CLI::PositiveNumber);
    auto* continue_flag = subcom->add_flag(
        "--continue",
        range->continue_mode,
        "Start after the archives already downloaded"
    );
    start->excludes(continue_flag);
    subcom->add_option("-e,--end", range->end, "Last index to download (default: the last one)")
        ->check(CLI::PositiveNumber);
    subcom->add_option("--delay", options.delay, "Seconds to wait between two archives")
        ->check(CLI::NonNegativeNumber);

    subcom->callback(
        [&config, &options, &exit_code, range]
        {
            load_configuration(config, options);
            extract(config.validate());
            const auto& ctx = config.context();
            const int end = range->end.value_or(ctx.job_params.max_index);

            auto printer = std::make_shared<ProgressPrinter>();
            DownloadCallbacks callbacks;
            callbacks.on_progress = [printer](const download::Progress& progress)
            { (*printer)(progress); };
            callbacks.on_transition = [printer, end, &ctx](EngineState state, int index)
            {
                switch (state)
                {
                    case EngineState::downloading:
                        printer->reset();
                        fmt::print("[{:03d}/{:03d}] Downloading\n", index, end);
                        break;
                    case EngineState::refreshing:
                        fmt::print("[{:03d}/{:03d}] Refreshing session\n", index, end);
                        break;
                    case EngineState::waiting:
                        fmt::print(
                            "\n[{:03d}/{:03d}] Done, waiting {}s\n",
                            index,
                            end,
                            ctx.retrieval_params.download_delay
                        );
                        break;
                    default:
                        break;
                }
                std::fflush(stdout);
            };

            const RunResult result = extract(download_archives(ctx, *range, callbacks));
            fmt::print("\n{}\n", result.message);
            exit_code = result.exit_code();
        }
    );
}
