// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <vector>

#include <fmt/format.h>

#include "takeout/api/configuration.hpp"
#include "takeout/api/status.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/util/string.hpp"

#include "takeout_dl.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

namespace
{
    std::vector<std::string> missing_indices(const std::vector<ArchiveFile>& archives)
    {
        std::vector<std::string> missing;
        int expected = 1;
        for (const auto& archive : archives)
        {
            for (; expected < archive.index; ++expected)
            {
                missing.push_back(fmt::format("{:03d}", expected));
            }
            expected = archive.index + 1;
        }
        return missing;
    }
}

void
set_status_command(CLI::App* subcom, Configuration& config, CommandLineOptions& options)
{
    init_general_options(subcom, options);
    init_job_options(subcom, options);

    subcom->callback(
        [&config, &options]
        {
            load_configuration(config, options);
            const auto& ctx = config.context();
            const auto status = extract(retrieval_status(ctx));

            fmt::print("Output directory : {}\n", ctx.retrieval_params.output_directory.string());
            fmt::print("Archives         : {}\n", status.archives.size());
            if (!status.archives.empty())
            {
                fmt::print(
                    "Indices          : {:03d} to {:03d}\n",
                    status.archives.front().index,
                    status.archives.back().index
                );
                if (const auto missing = missing_indices(status.archives); !missing.empty())
                {
                    fmt::print("Missing          : {}\n", util::join(", ", missing));
                }
            }

            fmt::print("State file       : {}\n", ctx.state_file().string());
            if (status.state)
            {
                fmt::print(
                    "Last completed   : {} (job '{}', updated {}){}\n",
                    status.state->last_completed_index,
                    status.state->job_id,
                    status.state->updated_at,
                    status.state_for_other_job ? ", other job: ignored" : ""
                );
            }
            else
            {
                fmt::print("Last completed   : none recorded\n");
            }
            fmt::print("Resume index     : {}\n", status.resume_index);
        }
    );
}
