// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DL_COMMON_OPTIONS_HPP
#define TAKEOUT_DL_COMMON_OPTIONS_HPP

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "takeout/api/configuration.hpp"
#include "takeout/core/context.hpp"

// Values given on the command line, they override every other source.
struct CommandLineOptions
{
    std::optional<std::string> config_file;
    int verbosity = 0;
    std::optional<std::string> log_file;

    std::optional<std::string> job_id;
    std::optional<std::string> service_host;
    std::optional<std::string> output_directory;

    std::optional<int> delay;
    std::optional<int> max_auth_refreshes;
    std::optional<std::string> capture_file;
    std::optional<std::string> refresh_command;
};

void
init_general_options(CLI::App* subcom, CommandLineOptions& options);

void
init_job_options(CLI::App* subcom, CommandLineOptions& options);

void
init_auth_options(CLI::App* subcom, CommandLineOptions& options);

/**
 * Load the configuration file and the environment, apply the command line on
 * top, then start logging.
 */
void
load_configuration(takeout::Configuration& config, const CommandLineOptions& options);

#endif
