// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef TAKEOUT_UTIL_STRING_HPP
#define TAKEOUT_UTIL_STRING_HPP

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace takeout::util
{
    [[nodiscard]] auto is_space(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;

    /// Case insensitive (ASCII) equality, as used for HTTP header names.
    [[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the string in two at the first occurrence of @p sep.
     *
     * If the separator is not found, the first element is the whole input and
     * the second one is empty.
     */
    [[nodiscard]] auto split_once(std::string_view str, std::string_view sep)
        -> std::array<std::string_view, 2>;

    [[nodiscard]] auto split(std::string_view input, std::string_view sep)
        -> std::vector<std::string>;

    [[nodiscard]] auto join(std::string_view sep, const std::vector<std::string>& container)
        -> std::string;
}

#endif
