// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_PROGRESS_SCANNER_HPP
#define TAKEOUT_CORE_PROGRESS_SCANNER_HPP

#include <vector>

#include "takeout/core/archive_file.hpp"
#include "takeout/fs/filesystem.hpp"

namespace takeout
{
    /**
     * Finalized archives found in @p output_location, sorted by index.
     *
     * Only regular files whose name matches the archive pattern exactly are
     * listed. A missing or unreadable directory yields an empty list.
     */
    std::vector<ArchiveFile> list_archives(const fs::path& output_location);

    /**
     * Next index to download: one past the highest finalized archive, or 1.
     */
    int find_resume_index(const fs::path& output_location);

    /// Same as above, for a listing already made with ``list_archives``.
    int find_resume_index(const std::vector<ArchiveFile>& archives);
}

#endif
