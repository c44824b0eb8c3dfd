// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/core/error_handling.hpp"
#include "takeout/core/logging.hpp"

#include "common_options.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

void
init_general_options(CLI::App* subcom, CommandLineOptions& options)
{
    const std::string cli_group = "Global options";

    subcom
        ->add_option(
            "--config",
            options.config_file,
            "Configuration file (default: " + Configuration::default_config_path().string() + ")"
        )
        ->group(cli_group);
    subcom
        ->add_flag(
            "-v,--verbose",
            options.verbosity,
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->group(cli_group);
    subcom->add_option("--log-file", options.log_file, "Also append logs to this file")
        ->group(cli_group);
}

void
init_job_options(CLI::App* subcom, CommandLineOptions& options)
{
    const std::string cli_group = "Job options";

    subcom->add_option("--job-id", options.job_id, "Identifier of the export job")
        ->group(cli_group);
    subcom->add_option("--host", options.service_host, "Host serving the archives")
        ->group(cli_group);
    subcom->add_option("-d,--directory", options.output_directory, "Where to save the archives")
        ->group(cli_group);
}

void
init_auth_options(CLI::App* subcom, CommandLineOptions& options)
{
    const std::string cli_group = "Authentication options";

    subcom
        ->add_option(
            "--capture-file",
            options.capture_file,
            "File holding a download request copied from the browser as cURL"
        )
        ->group(cli_group);
    subcom
        ->add_option(
            "--refresh-command",
            options.refresh_command,
            "Shell command writing a fresh capture file when the session expires"
        )
        ->group(cli_group);
    subcom
        ->add_option(
            "--max-auth-refreshes",
            options.max_auth_refreshes,
            "Session refreshes allowed for a single archive"
        )
        ->check(CLI::NonNegativeNumber)
        ->group(cli_group);
}

namespace
{
    log_level verbosity_to_log_level(int verbosity, log_level configured)
    {
        switch (verbosity)
        {
            case 0:
                return configured;
            case 1:
                return log_level::info;
            case 2:
                return log_level::debug;
            default:
                return log_level::trace;
        }
    }
}

void
load_configuration(Configuration& config, const CommandLineOptions& options)
{
    if (options.config_file)
    {
        extract(config.load_file(*options.config_file, /* must_exist = */ true));
    }
    else
    {
        extract(config.load_file(Configuration::default_config_path()));
    }
    config.load_env();

    auto& ctx = config.context();
    if (options.job_id)
    {
        ctx.job_params.job_id = *options.job_id;
    }
    if (options.service_host)
    {
        ctx.job_params.service_host = *options.service_host;
    }
    if (options.output_directory)
    {
        ctx.retrieval_params.output_directory = *options.output_directory;
    }
    if (options.delay)
    {
        ctx.retrieval_params.download_delay = *options.delay;
    }
    if (options.max_auth_refreshes)
    {
        ctx.retrieval_params.max_auth_refreshes = *options.max_auth_refreshes;
    }
    if (options.capture_file)
    {
        ctx.auth_params.capture_file = *options.capture_file;
    }
    if (options.refresh_command)
    {
        ctx.auth_params.refresh_command = *options.refresh_command;
    }
    if (options.log_file)
    {
        ctx.logging_params.log_file = *options.log_file;
    }

    ctx.logging_params.logging_level = verbosity_to_log_level(
        options.verbosity,
        ctx.logging_params.logging_level
    );
    // libcurl's own trace is only worth it at the highest verbosity.
    ctx.remote_fetch_params.verbose = options.verbosity >= 3;
    logging::start_logging(ctx.logging_params);

    for (const auto& source : config.sources())
    {
        LOG_DEBUG << "Configuration loaded from " << source;
    }
}
