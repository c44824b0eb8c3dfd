// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DL_TAKEOUT_DL_HPP
#define TAKEOUT_DL_TAKEOUT_DL_HPP

#include <CLI/CLI.hpp>

#include "common_options.hpp"

namespace takeout
{
    class Configuration;
}

void
set_download_command(
    CLI::App* subcom,
    takeout::Configuration& config,
    CommandLineOptions& options,
    int& exit_code
);

void
set_status_command(CLI::App* subcom, takeout::Configuration& config, CommandLineOptions& options);

void
set_parse_capture_command(
    CLI::App* subcom,
    takeout::Configuration& config,
    CommandLineOptions& options,
    int& exit_code
);

void
set_takeout_dl_command(
    CLI::App* com,
    takeout::Configuration& config,
    CommandLineOptions& options,
    int& exit_code
);

#endif
