// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_API_CONFIGURATION_HPP
#define TAKEOUT_API_CONFIGURATION_HPP

#include <string>
#include <string_view>
#include <vector>

#include "takeout/core/context.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * Fills a Context from YAML configuration files and the environment.
     *
     * Later loads override earlier ones, so the expected order is: files,
     * then environment, then whatever the command line sets directly on the
     * context.
     */
    class Configuration
    {
    public:

        explicit Configuration(Context& ctx);

        /**
         * Load a YAML configuration file.
         *
         * A missing file is only an error if @p must_exist is set.
         */
        expected_t<void> load_file(const fs::path& path, bool must_exist = false);

        expected_t<void> load_yaml(std::string_view yaml, std::string_view source = "<string>");

        /// ``TAKEOUT_JOB_ID`` and ``TAKEOUT_OUTPUT_DIR``.
        void load_env();

        /// Check the values are usable together.
        expected_t<void> validate() const;

        /// ``$XDG_CONFIG_HOME/takeout/takeoutrc.yaml``
        static fs::path default_config_path();

        Context& context();
        const Context& context() const;

        /// Files and environment variables that contributed values, in load order.
        const std::vector<std::string>& sources() const;

    private:

        Context& m_context;
        std::vector<std::string> m_sources;
    };
}

#endif
