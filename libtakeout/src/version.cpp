// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/version.hpp"

namespace takeout
{
    std::string version()
    {
        return LIBTAKEOUT_VERSION_STRING;
    }
}
