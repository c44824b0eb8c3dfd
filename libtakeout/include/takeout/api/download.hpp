// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_API_DOWNLOAD_HPP
#define TAKEOUT_API_DOWNLOAD_HPP

#include <functional>
#include <optional>

#include "takeout/core/context.hpp"
#include "takeout/core/error_handling.hpp"
#include "takeout/core/retrieval_engine.hpp"
#include "takeout/download/request.hpp"

namespace takeout
{
    struct DownloadRange
    {
        std::optional<int> start = std::nullopt;
        std::optional<int> end = std::nullopt;
        // Start after the archives already present, ``start`` must be empty.
        bool continue_mode = false;
    };

    struct DownloadCallbacks
    {
        std::optional<RetrievalEngine::transition_callback_t> on_transition = std::nullopt;
        std::optional<download::Request::progress_callback_t> on_progress = std::nullopt;
    };

    expected_t<void> validate_range(const DownloadRange& range, int max_index);

    /**
     * Download the archives of the configured job with libcurl, replaying the
     * captured request for authentication.
     *
     * Holds the output directory lock and turns SIGINT into a clean abort for
     * the duration of the call. Errors are reported for setup failures only,
     * the outcome of the run itself is in the RunResult.
     */
    expected_t<RunResult> download_archives(
        const Context& ctx,
        const DownloadRange& range,
        const DownloadCallbacks& callbacks = {}
    );
}

#endif
