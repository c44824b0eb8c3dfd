// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_THREAD_UTILS_HPP
#define TAKEOUT_CORE_THREAD_UTILS_HPP

#include <csignal>

namespace takeout
{

    /***********************
     * thread interruption *
     ***********************/

    using signal_handler_t = void (*)(int);

    /**
     * Install a SIGINT/SIGTERM handler that only raises the interruption flag.
     *
     * The flag is polled between archives and during the throttling delay.
     * A second signal gets the default behavior back and terminates the process.
     */
    void set_default_signal_handler();
    void restore_previous_signal_handler();

    bool is_sig_interrupted() noexcept;
    void set_sig_interrupted() noexcept;
    void reset_sig_interrupted() noexcept;
}

#endif
