// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <set>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "takeout/api/configuration.hpp"
#include "takeout/core/logging.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/environment.hpp"

namespace takeout
{
    namespace
    {
        tl::unexpected<takeout_error> config_error(std::string msg)
        {
            return make_unexpected(std::move(msg), takeout_error_code::configuration_error);
        }

        template <class T>
        void set_if_defined(const YAML::Node& node, const char* key, T& target)
        {
            if (const auto value = node[key]; value && !value.IsNull())
            {
                target = value.as<T>();
            }
        }

        void warn_unknown_keys(
            const YAML::Node& node,
            const std::set<std::string>& known,
            std::string_view where
        )
        {
            for (const auto& entry : node)
            {
                const auto key = entry.first.as<std::string>();
                if (known.count(key) == 0)
                {
                    LOG_WARNING << fmt::format("Unknown configuration key '{}' in {}", key, where);
                }
            }
        }

        void load_remote(const YAML::Node& node, download::RemoteFetchParams& params)
        {
            set_if_defined(node, "ssl_verify", params.ssl_verify);
            set_if_defined(node, "ssl_no_revoke", params.ssl_no_revoke);
            set_if_defined(node, "user_agent", params.user_agent);
            set_if_defined(node, "connect_timeout_secs", params.connect_timeout_secs);
            set_if_defined(node, "low_speed_time_secs", params.low_speed_time_secs);
            set_if_defined(node, "low_speed_limit_bps", params.low_speed_limit_bps);
            set_if_defined(node, "verbose", params.verbose);
            if (const auto proxies = node["proxy_servers"]; proxies && proxies.IsMap())
            {
                for (const auto& entry : proxies)
                {
                    const auto scheme = entry.first.as<std::string>();
                    params.proxy_servers[scheme] = entry.second.as<std::string>();
                }
            }
        }

        expected_t<void> load_logging(const YAML::Node& node, LoggingParams& params)
        {
            if (const auto level = node["level"]; level && !level.IsNull())
            {
                const auto name = level.as<std::string>();
                const auto parsed = parse_log_level(name);
                if (!parsed)
                {
                    return config_error(fmt::format("Unknown log level '{}'", name));
                }
                params.logging_level = *parsed;
            }
            set_if_defined(node, "file", params.log_file);
            set_if_defined(node, "pattern", params.log_pattern);
            return {};
        }
    }

    Configuration::Configuration(Context& ctx)
        : m_context(ctx)
    {
    }

    Context& Configuration::context()
    {
        return m_context;
    }

    const Context& Configuration::context() const
    {
        return m_context;
    }

    const std::vector<std::string>& Configuration::sources() const
    {
        return m_sources;
    }

    fs::path Configuration::default_config_path()
    {
        return fs::path(util::user_config_dir()) / "takeout" / "takeoutrc.yaml";
    }

    expected_t<void> Configuration::load_file(const fs::path& path, bool must_exist)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            if (must_exist)
            {
                return config_error(
                    fmt::format("Configuration file '{}' not found", path.string())
                );
            }
            LOG_DEBUG << "No configuration file at " << path;
            return {};
        }

        auto contents = read_contents(path);
        if (!contents)
        {
            return config_error(contents.error().what());
        }
        return load_yaml(contents.value(), path.string());
    }

    expected_t<void> Configuration::load_yaml(std::string_view yaml, std::string_view source)
    {
        try
        {
            const YAML::Node root = YAML::Load(std::string(yaml));
            if (root.IsNull())
            {
                return {};
            }
            if (!root.IsMap())
            {
                return config_error(fmt::format("Configuration '{}' is not a mapping", source));
            }

            // Applied only once the whole document has been read.
            Context staged = m_context;

            warn_unknown_keys(
                root,
                { "job_id",
                  "service_host",
                  "max_index",
                  "output_directory",
                  "download_delay",
                  "max_auth_refreshes",
                  "state_file",
                  "capture_file",
                  "refresh_command",
                  "account",
                  "remote",
                  "logging" },
                source
            );

            auto& job = staged.job_params;
            set_if_defined(root, "job_id", job.job_id);
            set_if_defined(root, "service_host", job.service_host);
            set_if_defined(root, "max_index", job.max_index);

            auto& retrieval = staged.retrieval_params;
            if (const auto dir = root["output_directory"]; dir && !dir.IsNull())
            {
                retrieval.output_directory = dir.as<std::string>();
            }
            set_if_defined(root, "download_delay", retrieval.download_delay);
            set_if_defined(root, "max_auth_refreshes", retrieval.max_auth_refreshes);
            if (const auto state_file = root["state_file"]; state_file && !state_file.IsNull())
            {
                retrieval.state_file = fs::path(state_file.as<std::string>());
            }

            auto& auth = staged.auth_params;
            if (const auto capture = root["capture_file"]; capture && !capture.IsNull())
            {
                auth.capture_file = capture.as<std::string>();
            }
            if (const auto command = root["refresh_command"]; command && !command.IsNull())
            {
                auth.refresh_command = command.as<std::string>();
            }
            set_if_defined(root, "account", auth.account);

            if (const auto remote = root["remote"]; remote && remote.IsMap())
            {
                load_remote(remote, staged.remote_fetch_params);
            }
            if (const auto logging = root["logging"]; logging && logging.IsMap())
            {
                if (auto loaded = load_logging(logging, staged.logging_params); !loaded)
                {
                    return loaded;
                }
            }

            m_context = std::move(staged);
        }
        catch (const YAML::Exception& e)
        {
            return config_error(fmt::format("Invalid configuration '{}': {}", source, e.what()));
        }

        m_sources.emplace_back(source);
        return {};
    }

    void Configuration::load_env()
    {
        if (auto job_id = util::get_env("TAKEOUT_JOB_ID"))
        {
            m_context.job_params.job_id = std::move(job_id).value();
            m_sources.emplace_back("TAKEOUT_JOB_ID");
        }
        if (auto dir = util::get_env("TAKEOUT_OUTPUT_DIR"))
        {
            m_context.retrieval_params.output_directory = std::move(dir).value();
            m_sources.emplace_back("TAKEOUT_OUTPUT_DIR");
        }
    }

    expected_t<void> Configuration::validate() const
    {
        const auto& job = m_context.job_params;
        const auto& retrieval = m_context.retrieval_params;
        if (job.job_id.empty())
        {
            return config_error(
                "No job id configured, set 'job_id', TAKEOUT_JOB_ID or pass --job-id"
            );
        }
        if (job.service_host.empty())
        {
            return config_error("'service_host' cannot be empty");
        }
        if (job.max_index < 1 || job.max_index > highest_index)
        {
            return config_error(fmt::format("'max_index' must be in [1, {}]", highest_index));
        }
        if (retrieval.download_delay < 0)
        {
            return config_error("'download_delay' cannot be negative");
        }
        if (retrieval.max_auth_refreshes < 0)
        {
            return config_error("'max_auth_refreshes' cannot be negative");
        }
        if (m_context.remote_fetch_params.connect_timeout_secs <= 0)
        {
            return config_error("'remote.connect_timeout_secs' must be positive");
        }
        return {};
    }
}
