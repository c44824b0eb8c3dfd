// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "takeout/core/logging.hpp"
#include "takeout/core/util.hpp"
#include "takeout/util/string.hpp"

namespace takeout
{
    namespace
    {
        constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
        {
            static_assert(static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::off));
            return static_cast<spdlog::level::level_enum>(level);
        }

        constexpr std::array all_log_sources{ log_source::libtakeout, log_source::libcurl };
    }

    const char* name_of(log_level level) noexcept
    {
        constexpr std::array names{
            "trace", "debug", "info", "warning", "error", "critical", "off",
        };
        return names[static_cast<std::size_t>(level)];
    }

    std::optional<log_level> parse_log_level(std::string_view name)
    {
        const auto lname = util::to_lower(name);
        if (lname == "warn")
        {
            return log_level::warn;
        }
        if (lname == "err")
        {
            return log_level::err;
        }
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lname == name_of(level))
            {
                return level;
            }
        }
        return std::nullopt;
    }

    const char* name_of(log_source source) noexcept
    {
        constexpr std::array names{ "libtakeout", "libcurl" };
        return names[static_cast<std::size_t>(source)];
    }

    namespace logging
    {
        void start_logging(const LoggingParams& params)
        {
            spdlog::drop_all();

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            if (!params.log_file.empty())
            {
                // Appends, the file keeps the history of every run.
                sinks.push_back(
                    std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_file, false)
                );
            }

            for (const auto source : all_log_sources)
            {
                auto logger = std::make_shared<spdlog::logger>(
                    name_of(source),
                    sinks.cbegin(),
                    sinks.cend()
                );
                logger->set_pattern(params.log_pattern);
                if (source == log_source::libtakeout)
                {
                    spdlog::set_default_logger(logger);
                }
                else
                {
                    spdlog::register_logger(logger);
                }
            }

            spdlog::set_level(to_spdlog(params.logging_level));
            spdlog::flush_on(spdlog::level::warn);
        }

        void stop_logging()
        {
            if (auto default_logger = spdlog::default_logger())
            {
                default_logger->flush();
            }
            spdlog::drop_all();
        }

        void set_log_level(log_level level)
        {
            spdlog::set_level(to_spdlog(level));
        }

        MessageLogger::MessageLogger(log_level level, log_source source)
            : m_level(level)
            , m_source(source)
            , m_stream()
        {
        }

        MessageLogger::~MessageLogger()
        {
            emit(m_stream.str(), m_level, m_source);
        }

        std::stringstream& MessageLogger::stream()
        {
            return m_stream;
        }

        void MessageLogger::emit(const std::string& msg, log_level level, log_source source)
        {
            auto logger = spdlog::get(name_of(source));
            if (!logger)
            {
                logger = spdlog::default_logger();
            }
            if (logger && logger->should_log(to_spdlog(level)))
            {
                logger->log(to_spdlog(level), hide_secrets(msg));
            }
        }
    }
}
