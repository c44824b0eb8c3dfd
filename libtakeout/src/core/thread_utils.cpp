// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>

#include "takeout/core/thread_utils.hpp"

namespace takeout
{
    namespace
    {
        std::atomic<bool> sig_interrupted(false);
        std::atomic<signal_handler_t> previous_int_handler = SIG_DFL;
        std::atomic<signal_handler_t> previous_term_handler = SIG_DFL;

        static_assert(std::atomic<bool>::is_always_lock_free);

        extern "C" void interruption_signal_handler(int signum)
        {
            if (sig_interrupted.exchange(true))
            {
                // Second signal: the user really wants out.
                std::signal(signum, SIG_DFL);
                std::raise(signum);
            }
        }
    }

    void set_default_signal_handler()
    {
        previous_int_handler = std::signal(SIGINT, interruption_signal_handler);
        previous_term_handler = std::signal(SIGTERM, interruption_signal_handler);
    }

    void restore_previous_signal_handler()
    {
        std::signal(SIGINT, previous_int_handler.exchange(SIG_DFL));
        std::signal(SIGTERM, previous_term_handler.exchange(SIG_DFL));
    }

    bool is_sig_interrupted() noexcept
    {
        return sig_interrupted.load();
    }

    void set_sig_interrupted() noexcept
    {
        sig_interrupted.store(true);
    }

    void reset_sig_interrupted() noexcept
    {
        sig_interrupted.store(false);
    }
}
