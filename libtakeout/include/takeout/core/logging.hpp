// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_LOGGING_HPP
#define TAKEOUT_CORE_LOGGING_HPP

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   takeout::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(takeout::log_level::trace)
#define LOG_DEBUG       LOG(takeout::log_level::debug)
#define LOG_INFO        LOG(takeout::log_level::info)
#define LOG_WARNING     LOG(takeout::log_level::warn)
#define LOG_ERROR       LOG(takeout::log_level::err)
#define LOG_CRITICAL    LOG(takeout::log_level::critical)
// clang-format on

namespace takeout
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        The values map one to one on spdlog levels.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    const char* name_of(log_level level) noexcept;

    /// Parses the names returned by `name_of`, plus the usual "warn" and "error" aliases.
    std::optional<log_level> parse_log_level(std::string_view name);

    /** Specifies the source a log record is originating from.
        Output coming from libcurl callbacks is kept apart from our own.
    */
    enum class log_source
    {
        libtakeout,  // default
        libcurl,
    };

    /// @returns The name of the specified log source as an UTF-8 null-terminated string.
    const char* name_of(log_source source) noexcept;

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern to use in formatted logs.
        std::string log_pattern{ "%^%-9!l%-10n%$ %v" };

        /// When not empty, records are also appended to this file.
        std::string log_file{};
    };

    namespace logging
    {
        /** Installs the loggers of every `log_source`: a colored stderr sink and,
            if requested, a file sink. Calling it again replaces the previous setup.
        */
        void start_logging(const LoggingParams& params);

        /// Flushes and drops all the registered loggers.
        void stop_logging();

        void set_log_level(log_level level);

        /** Accumulates a message and emits it on destruction, after secrets
            (session tokens, cookies) have been masked.
        */
        class MessageLogger
        {
        public:

            explicit MessageLogger(log_level level, log_source source = log_source::libtakeout);
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream();

        private:

            log_level m_level;
            log_source m_source;
            std::stringstream m_stream;

            static void emit(const std::string& msg, log_level level, log_source source);
        };
    }
}

#endif
