// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <CLI/CLI.hpp>

#include "takeout/api/configuration.hpp"
#include "takeout/core/context.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/core/logging.hpp"

#include "takeout_dl.hpp"
#include "version.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    Context ctx;
    Configuration config{ ctx };
    CommandLineOptions options;
    int exit_code = 0;

    CLI::App app{ "Resumable download of export archives\nVersion: " + takeout_dl::version()
                  + "\n" };
    set_takeout_dl_command(&app, config, options, exit_code);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        // --help and --version end up here too, with a zero code.
        return app.exit(e) == 0 ? 0 : 2;
    }
    catch (const takeout_error& e)
    {
        LOG_CRITICAL << e.what();
        logging::stop_logging();
        return e.error_code() == takeout_error_code::incorrect_usage ? 2 : 1;
    }
    catch (const std::exception& e)
    {
        LOG_CRITICAL << e.what();
        logging::stop_logging();
        return 1;
    }

    logging::stop_logging();
    return exit_code;
}
