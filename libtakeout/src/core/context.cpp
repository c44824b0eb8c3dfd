// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/core/context.hpp"

namespace takeout
{
    fs::path Context::state_file() const
    {
        if (retrieval_params.state_file)
        {
            return *retrieval_params.state_file;
        }
        return retrieval_params.output_directory / ".takeout-state.json";
    }

    fs::path Context::lock_file() const
    {
        return retrieval_params.output_directory / ".takeout.lock";
    }
}
