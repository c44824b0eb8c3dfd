// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/download/request.hpp"

namespace takeout::download
{
    Request::Request(std::string_view lname, std::string lurl, std::string lfilename)
        : name(lname)
        , url(std::move(lurl))
        , filename(std::move(lfilename))
    {
    }
}
