// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <thread>

#include "takeout/core/clock.hpp"
#include "takeout/core/thread_utils.hpp"

namespace takeout
{
    auto SystemClock::now() const -> time_point
    {
        return clock_type::now();
    }

    bool SystemClock::sleep_for(std::chrono::milliseconds duration) const
    {
        using namespace std::chrono_literals;

        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (!is_sig_interrupted())
        {
            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= 0ms)
            {
                return true;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(remaining, 100ms)
            );
        }
        return false;
    }
}
