// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_CORE_CLOCK_HPP
#define TAKEOUT_CORE_CLOCK_HPP

#include <chrono>

namespace takeout
{
    class Clock
    {
    public:

        using clock_type = std::chrono::system_clock;
        using time_point = clock_type::time_point;

        virtual ~Clock() = default;

        virtual time_point now() const = 0;

        /**
         * Block for @p duration.
         *
         * @returns false if the wait was cut short by an interruption.
         */
        virtual bool sleep_for(std::chrono::milliseconds duration) const = 0;
    };

    /**
     * The wall clock. Sleeps are sliced so that an interruption signal is
     * honoured within a fraction of a second.
     */
    class SystemClock : public Clock
    {
    public:

        time_point now() const override;
        bool sleep_for(std::chrono::milliseconds duration) const override;
    };
}

#endif
