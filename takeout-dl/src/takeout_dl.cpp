// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <iostream>

#include "takeout/api/configuration.hpp"
#include "takeout/version.hpp"

#include "takeout_dl.hpp"
#include "version.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

void
set_takeout_dl_command(
    CLI::App* com,
    Configuration& config,
    CommandLineOptions& options,
    int& exit_code
)
{
    auto print_version = [](int /*count*/)
    {
        std::cout << takeout_dl::version() << " (libtakeout " << takeout::version() << ")"
                  << std::endl;
        std::exit(0);
    };
    com->add_flag_function("--version", print_version, "Print the version and exit");

    CLI::App* download_subcom = com->add_subcommand("download", "Download the archives of a job");
    set_download_command(download_subcom, config, options, exit_code);

    CLI::App* status_subcom = com->add_subcommand(
        "status",
        "Show the archives already downloaded and where the next run resumes"
    );
    set_status_command(status_subcom, config, options);

    CLI::App* parse_capture_subcom = com->add_subcommand(
        "parse-capture",
        "Check a request captured with \"Copy as cURL\""
    );
    set_parse_capture_command(parse_capture_subcom, config, options, exit_code);

    com->require_subcommand(1);
}
