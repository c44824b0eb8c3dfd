// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_DL_VERSION_HPP
#define TAKEOUT_DL_VERSION_HPP

#include <string>

#define TAKEOUT_DL_VERSION_MAJOR 0
#define TAKEOUT_DL_VERSION_MINOR 3
#define TAKEOUT_DL_VERSION_PATCH 0

#define TAKEOUT_DL_VERSION_STRING "0.3.0"

namespace takeout_dl
{
    inline std::string version()
    {
        return TAKEOUT_DL_VERSION_STRING;
    }
}

#endif
