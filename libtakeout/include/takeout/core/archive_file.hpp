// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_ARCHIVE_FILE_HPP
#define TAKEOUT_CORE_ARCHIVE_FILE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /// Number of archives of an export job when nothing else is known.
    inline constexpr int default_max_index = 277;
    /// The file name format has room for three digits.
    inline constexpr int highest_index = 999;

    /**
     * One archive of the export job, either downloaded or about to be.
     */
    struct ArchiveFile
    {
        using time_point = std::chrono::system_clock::time_point;

        int index = 0;
        // Declared by the server, if it did.
        std::optional<std::size_t> size_bytes = std::nullopt;
        fs::path path = {};
        time_point created_at = {};
    };

    /// UTC ``YYYYMMDDTHHMMSSZ``.
    std::string format_timestamp(ArchiveFile::time_point t);

    /**
     * Final name of an archive: ``takeout-YYYYMMDDTHHMMSSZ-NNN.zip``.
     */
    std::string archive_filename(int index, ArchiveFile::time_point t);

    /**
     * Name of the file an archive is streamed into before being published.
     *
     * The ``tmp_`` prefix keeps it out of the archive pattern. The microsecond
     * timestamp and the @p unique suffix make every attempt use its own file.
     */
    std::string
    temporary_filename(int index, ArchiveFile::time_point t, std::string_view unique);

    bool is_temporary_filename(std::string_view filename);

    /**
     * Parse a final archive name.
     *
     * Only exact matches of the archive pattern are accepted, anything else
     * (temporary files, copies renamed by the user, ...) gives ``std::nullopt``.
     */
    std::optional<ArchiveFile> parse_archive_filename(std::string_view filename);
}

#endif
