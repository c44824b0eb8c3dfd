// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <string>

#include <catch2/catch_session.hpp>

#include "takeout/core/logging.hpp"

int
main(int argc, char* argv[])
{
    Catch::Session session;

    // Tests run in declaration order, the command line can still ask for another one.
    session.configData().runOrder = Catch::TestRunOrder::Declared;

    // Failures are scripted on purpose, their logs are only noise unless asked for.
    std::string log_level_name = "off";
    using Catch::Clara::Opt;
    session.cli(
        session.cli()
        | Opt(log_level_name, "level")["--takeout-log-level"]("libtakeout log level during tests")
    );

    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0)
    {
        return returnCode;
    }

    const auto level = takeout::parse_log_level(log_level_name);
    if (!level)
    {
        std::cerr << "Unknown log level '" << log_level_name << "'\n";
        return 1;
    }

    takeout::logging::LoggingParams params;
    params.logging_level = *level;
    takeout::logging::start_logging(params);

    returnCode = session.run();
    takeout::logging::stop_logging();
    return returnCode;
}
