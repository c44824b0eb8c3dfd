// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_FS_FILESYSTEM_HPP
#define TAKEOUT_FS_FILESYSTEM_HPP

#include <filesystem>

namespace takeout
{
    // Archives and state files only ever live on POSIX paths; the standard
    // path type is used directly.
    namespace fs = std::filesystem;
}

#endif
