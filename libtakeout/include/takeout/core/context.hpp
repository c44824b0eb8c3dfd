// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_CONTEXT_HPP
#define TAKEOUT_CORE_CONTEXT_HPP

#include <optional>
#include <string>

#include "takeout/core/archive_file.hpp"
#include "takeout/core/logging.hpp"
#include "takeout/download/parameters.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * All the settings of a run, filled by the Configuration from the
     * defaults, the configuration file, the environment and the command line.
     */
    class Context
    {
    public:

        struct JobParams
        {
            std::string job_id = "";
            std::string service_host = "takeout.google.com";
            int max_index = default_max_index;
        };

        struct RetrievalParams
        {
            fs::path output_directory = "GoogleTakeout";
            int download_delay = 5;  // seconds
            int max_auth_refreshes = 2;
            // Defaults to a file in the output directory.
            std::optional<fs::path> state_file = std::nullopt;
        };

        struct AuthParams
        {
            fs::path capture_file = "curl.txt";
            std::optional<std::string> refresh_command = std::nullopt;
            std::string account = "";
        };

        JobParams job_params;
        RetrievalParams retrieval_params;
        AuthParams auth_params;
        download::RemoteFetchParams remote_fetch_params;
        LoggingParams logging_params;

        fs::path state_file() const;
        fs::path lock_file() const;
    };
}

#endif
