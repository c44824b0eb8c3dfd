// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_UTIL_ENVIRONMENT_HPP
#define TAKEOUT_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>

namespace takeout::util
{
    /**
     * Return the value of the environment variable, or nothing if it is not set.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    void set_env(const std::string& key, const std::string& value);

    void unset_env(const std::string& key);

    /**
     * Return the current user home directory.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Return the current user config directory.
     *
     * ``$XDG_CONFIG_HOME`` if set, ``~/.config`` otherwise.
     */
    [[nodiscard]] auto user_config_dir() -> std::string;
}
#endif
