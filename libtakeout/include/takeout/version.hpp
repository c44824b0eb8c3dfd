// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBTAKEOUT_VERSION_HPP
#define LIBTAKEOUT_VERSION_HPP

#include <string>

#define LIBTAKEOUT_VERSION_MAJOR 0
#define LIBTAKEOUT_VERSION_MINOR 3
#define LIBTAKEOUT_VERSION_PATCH 0

#define LIBTAKEOUT_VERSION_STRING "0.3.0"
#define LIBTAKEOUT_VERSION                                                                         \
    (LIBTAKEOUT_VERSION_MAJOR * 10000 + LIBTAKEOUT_VERSION_MINOR * 100 + LIBTAKEOUT_VERSION_PATCH)

namespace takeout
{
    std::string version();
}

#endif
