// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "takeout/core/logging.hpp"
#include "takeout/core/progress_scanner.hpp"

namespace takeout
{
    std::vector<ArchiveFile> list_archives(const fs::path& output_location)
    {
        std::vector<ArchiveFile> archives;

        std::error_code ec;
        if (!fs::is_directory(output_location, ec))
        {
            LOG_DEBUG << "No output directory yet at " << output_location;
            return archives;
        }

        auto it = fs::directory_iterator(output_location, ec);
        if (ec)
        {
            LOG_WARNING << "Could not list " << output_location << ": " << ec.message();
            return archives;
        }
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            if (ec)
            {
                LOG_WARNING << "Error while listing " << output_location << ": " << ec.message();
                break;
            }
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec))
            {
                continue;
            }
            if (auto archive = parse_archive_filename(it->path().filename().string()))
            {
                archive->path = it->path();
                archive->size_bytes = static_cast<std::size_t>(it->file_size(type_ec));
                if (type_ec)
                {
                    archive->size_bytes = std::nullopt;
                }
                archives.push_back(std::move(*archive));
            }
        }

        std::sort(
            archives.begin(),
            archives.end(),
            [](const ArchiveFile& lhs, const ArchiveFile& rhs) { return lhs.index < rhs.index; }
        );
        return archives;
    }

    int find_resume_index(const fs::path& output_location)
    {
        return find_resume_index(list_archives(output_location));
    }

    int find_resume_index(const std::vector<ArchiveFile>& archives)
    {
        if (archives.empty())
        {
            return 1;
        }
        return archives.back().index + 1;
    }
}
