// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DOWNLOAD_PARAMETERS_HPP
#define TAKEOUT_DOWNLOAD_PARAMETERS_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace takeout::download
{
    using proxy_map_type = std::map<std::string, std::string>;

    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, "<system>" to
        // use the system certificates, or a path to a cert file.
        std::string ssl_verify = "";
        bool ssl_no_revoke = false;

        std::string user_agent = "";

        double connect_timeout_secs = 30.;
        // A transfer slower than low_speed_limit_bps for low_speed_time_secs is aborted.
        long low_speed_time_secs = 30;
        long low_speed_limit_bps = 1;

        proxy_map_type proxy_servers;

        // Forward libcurl's own trace to the "libcurl" logger.
        bool verbose = false;
    };

    /**
     * Select the proxy to use for @p url, the most specific entry wins:
     * ``scheme://host``, then ``scheme``, then ``all://host``, then ``all``.
     */
    std::optional<std::string>
    proxy_match(std::string_view url, const proxy_map_type& proxy_servers);
}
#endif
