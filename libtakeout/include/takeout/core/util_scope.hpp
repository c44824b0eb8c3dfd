// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_UTIL_SCOPE_HPP
#define TAKEOUT_CORE_UTIL_SCOPE_HPP

#include <stdexcept>
#include <utility>

#include "takeout/core/logging.hpp"

namespace takeout
{
    /** Calls ``func`` when leaving the enclosing scope, errors are logged. */
    template <typename F>
    struct on_scope_exit
    {
        F func;

        explicit on_scope_exit(F&& f)
            : func(std::forward<F>(f))
        {
        }

        ~on_scope_exit()
        {
            try
            {
                func();
            }
            catch (const std::exception& ex)
            {
                LOG_ERROR << "Cleanup failed: " << ex.what();
            }
        }

        // Runs exactly once, where it was declared.
        on_scope_exit(const on_scope_exit&) = delete;
        on_scope_exit& operator=(const on_scope_exit&) = delete;
        on_scope_exit(on_scope_exit&&) = delete;
        on_scope_exit& operator=(on_scope_exit&&) = delete;
    };
}

#endif
