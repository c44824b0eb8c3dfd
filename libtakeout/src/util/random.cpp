// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <array>
#include <functional>
#include <random>
#include <string_view>

#include "takeout/util/random.hpp"

namespace takeout::util
{
    namespace
    {
        using default_random_generator = std::mt19937;

        auto seeded_generator() -> default_random_generator
        {
            using seed_type = std::seed_seq::result_type;
            auto seed = std::array<seed_type, default_random_generator::state_size>{};
            auto dev = std::random_device{};
            std::generate(seed.begin(), seed.end(), std::ref(dev));
            auto seed_seq = std::seed_seq(seed.begin(), seed.end());
            return default_random_generator{ seed_seq };
        }

        auto local_random_generator() -> default_random_generator&
        {
            thread_local auto rng = seeded_generator();
            return rng;
        }
    }

    auto generate_random_alphanumeric_string(std::size_t len) -> std::string
    {
        static constexpr auto chars = std::string_view{ "0123456789abcdefghijklmnopqrstuvwxyz" };
        auto& generator = local_random_generator();
        auto dist = std::uniform_int_distribution<std::size_t>{ 0, chars.size() - 1 };
        auto result = std::string(len, '\0');
        std::generate_n(result.begin(), len, [&]() { return chars[dist(generator)]; });
        return result;
    }
}
