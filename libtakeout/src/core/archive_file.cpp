// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <ctime>
#include <regex>

#include <fmt/format.h>

#include "takeout/core/archive_file.hpp"
#include "takeout/util/string.hpp"

namespace takeout
{
    namespace
    {
        constexpr std::string_view temporary_prefix = "tmp_";

        std::tm to_utc(ArchiveFile::time_point t)
        {
            const std::time_t tt = std::chrono::system_clock::to_time_t(t);
            std::tm tm{};
            ::gmtime_r(&tt, &tm);
            return tm;
        }

        std::string format_utc(const std::tm& tm, const char* format)
        {
            char buffer[32];
            const auto size = std::strftime(buffer, sizeof(buffer), format, &tm);
            return std::string(buffer, size);
        }

        const std::regex& archive_filename_regex()
        {
            static const std::regex regex("^takeout-(\\d{8})T(\\d{6})Z-(\\d{3})\\.zip$");
            return regex;
        }
    }

    std::string format_timestamp(ArchiveFile::time_point t)
    {
        return format_utc(to_utc(t), "%Y%m%dT%H%M%SZ");
    }

    std::string archive_filename(int index, ArchiveFile::time_point t)
    {
        return fmt::format("takeout-{}-{:03d}.zip", format_timestamp(t), index);
    }

    std::string
    temporary_filename(int index, ArchiveFile::time_point t, std::string_view unique)
    {
        using std::chrono::microseconds;
        const auto since_epoch = std::chrono::duration_cast<microseconds>(t.time_since_epoch());
        const auto micros = since_epoch.count() % 1000000;
        return fmt::format(
            "{}{}_{:06d}_{:03d}_{}.zip",
            temporary_prefix,
            format_utc(to_utc(t), "%Y%m%d_%H%M%S"),
            micros,
            index,
            unique
        );
    }

    bool is_temporary_filename(std::string_view filename)
    {
        return util::starts_with(filename, temporary_prefix);
    }

    std::optional<ArchiveFile> parse_archive_filename(std::string_view filename)
    {
        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_match(filename.begin(), filename.end(), match, archive_filename_regex()))
        {
            return std::nullopt;
        }

        const std::string date = match[1].str();
        const std::string time = match[2].str();
        std::tm tm{};
        tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
        tm.tm_mon = std::stoi(date.substr(4, 2)) - 1;
        tm.tm_mday = std::stoi(date.substr(6, 2));
        tm.tm_hour = std::stoi(time.substr(0, 2));
        tm.tm_min = std::stoi(time.substr(2, 2));
        tm.tm_sec = std::stoi(time.substr(4, 2));

        ArchiveFile archive;
        archive.index = std::stoi(match[3].str());
        archive.path = fs::path(std::string(filename));
        archive.created_at = std::chrono::system_clock::from_time_t(::timegm(&tm));
        return archive;
    }
}
