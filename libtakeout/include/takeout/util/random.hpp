// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_UTIL_RANDOM_HPP
#define TAKEOUT_UTIL_RANDOM_HPP

#include <cstddef>
#include <string>

namespace takeout::util
{
    /**
     * Lowercase letters and digits, used to make unique temporary file names.
     */
    auto generate_random_alphanumeric_string(std::size_t len) -> std::string;
}
#endif
