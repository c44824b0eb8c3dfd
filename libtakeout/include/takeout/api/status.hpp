// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_API_STATUS_HPP
#define TAKEOUT_API_STATUS_HPP

#include <optional>
#include <vector>

#include "takeout/core/archive_file.hpp"
#include "takeout/core/context.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/core/state_store.hpp"

namespace takeout
{
    struct RetrievalStatus
    {
        int resume_index = 1;
        std::vector<ArchiveFile> archives = {};
        std::optional<RetrievalState> state = std::nullopt;
        // The recorded state is for another job.
        bool state_for_other_job = false;
    };

    /// Read-only look at the output directory and the recorded state.
    expected_t<RetrievalStatus> retrieval_status(const Context& ctx);
}

#endif
