// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <vector>

#include <fmt/format.h>

#include "takeout/api/configuration.hpp"
#include "takeout/core/captured_request.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/string.hpp"

#include "takeout_dl.hpp"

using namespace takeout;  // NOLINT(build/namespaces)

namespace
{
    template <class Map>
    std::string joined_keys(const Map& map)
    {
        std::vector<std::string> keys;
        for (const auto& entry : map)
        {
            keys.push_back(entry.first);
        }
        return keys.empty() ? "(none)" : util::join(", ", keys);
    }
}

void
set_parse_capture_command(
    CLI::App* subcom,
    Configuration& config,
    CommandLineOptions& options,
    int& exit_code
)
{
    init_general_options(subcom, options);
    subcom->add_option("--host", options.service_host, "Host the capture must point to");

    auto file = std::make_shared<std::string>();
    subcom->add_option("file", *file, "Capture file (default: the configured capture file)");

    subcom->callback(
        [&config, &options, &exit_code, file]
        {
            load_configuration(config, options);
            const auto& ctx = config.context();
            const fs::path path = file->empty() ? ctx.auth_params.capture_file : fs::path(*file);

            const auto contents = extract(read_contents(path));
            const auto capture = extract(parse_curl_command(contents));

            fmt::print("Capture       : {}\n", path.string());
            fmt::print("URL           : {}\n", hide_secrets(capture.url));
            fmt::print("Headers       : {}\n", joined_keys(capture.headers));
            fmt::print("Cookies       : {}\n", joined_keys(capture.cookies));
            fmt::print("Session token : found ({} characters)\n", capture.session_token.size());

            if (!capture.url.empty()
                && capture.host() != util::to_lower(ctx.job_params.service_host))
            {
                fmt::print(
                    "The request goes to '{}' instead of '{}'\n",
                    capture.host(),
                    ctx.job_params.service_host
                );
                exit_code = 1;
            }
        }
    );
}
