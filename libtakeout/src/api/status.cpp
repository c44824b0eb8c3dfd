// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "takeout/api/status.hpp"
#include "takeout/core/progress_scanner.hpp"
#include "takeout/core/retrieval_engine.hpp"

namespace takeout
{
    expected_t<RetrievalStatus> retrieval_status(const Context& ctx)
    {
        RetrievalStatus status;
        status.archives = list_archives(ctx.retrieval_params.output_directory);

        JsonStateStore store(ctx.state_file());
        auto state = store.load();
        if (!state)
        {
            return forward_error(state);
        }
        status.state = std::move(state).value();
        status.state_for_other_job = status.state
                                     && status.state->job_id != ctx.job_params.job_id;
        status.resume_index = resume_index(
            1,
            find_resume_index(status.archives),
            status.state_for_other_job ? std::nullopt : status.state
        );
        return status;
    }
}
