// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

#include <fmt/format.h>

#include "takeout/util/environment.hpp"

namespace takeout::util
{
    namespace
    {
        std::mutex env_mutex;
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock lock{ env_mutex };
        if (const char* val = std::getenv(key.c_str()))
        {
            return { val };
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock lock{ env_mutex };
        const auto result = ::setenv(key.c_str(), value.c_str(), 1);
        if (result != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        std::scoped_lock lock{ env_mutex };
        const auto result = ::unsetenv(key.c_str());
        if (result != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not unset environment variable "{}")", key)
            );
        }
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env("HOME"); maybe_home.has_value() && !maybe_home->empty())
        {
            return std::move(maybe_home).value();
        }
        if (const auto* pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr)
        {
            return pw->pw_dir;
        }
        throw std::runtime_error("HOME not set.");
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = get_env("XDG_CONFIG_HOME").value_or(""); !maybe_dir.empty())
        {
            return maybe_dir;
        }
        return user_home_dir() + "/.config";
    }
}
