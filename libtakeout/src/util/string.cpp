// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "takeout/util/string.hpp"

namespace takeout::util
{
    auto is_space(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string(str);
        std::transform(out.begin(), out.end(), out.begin(), [](char c) { return to_lower(c); });
        return out;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return (str.size() >= suffix.size())
               && (str.substr(str.size() - suffix.size()) == suffix);
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string_view::npos;
    }

    auto iequals(std::string_view lhs, std::string_view rhs) -> bool
    {
        return std::equal(
            lhs.cbegin(),
            lhs.cend(),
            rhs.cbegin(),
            rhs.cend(),
            [](char a, char b) { return to_lower(a) == to_lower(b); }
        );
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        const auto start = std::find_if_not(input.cbegin(), input.cend(), &is_space);
        return input.substr(static_cast<std::size_t>(start - input.cbegin()));
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        const auto rstart = std::find_if_not(input.crbegin(), input.crend(), &is_space);
        return input.substr(0, static_cast<std::size_t>(input.crend() - rstart));
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return lstrip(rstrip(input));
    }

    auto split_once(std::string_view str, std::string_view sep) -> std::array<std::string_view, 2>
    {
        const auto pos = str.find(sep);
        if (pos == std::string_view::npos)
        {
            return { str, std::string_view() };
        }
        return { str.substr(0, pos), str.substr(pos + sep.size()) };
    }

    auto split(std::string_view input, std::string_view sep) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        if (sep.empty())
        {
            result.emplace_back(input);
            return result;
        }

        std::size_t start = 0;
        std::size_t pos = input.find(sep);
        while (pos != std::string_view::npos)
        {
            result.emplace_back(input.substr(start, pos - start));
            start = pos + sep.size();
            pos = input.find(sep, start);
        }
        result.emplace_back(input.substr(start));
        return result;
    }

    auto join(std::string_view sep, const std::vector<std::string>& container) -> std::string
    {
        std::string out;
        for (std::size_t i = 0; i < container.size(); ++i)
        {
            if (i > 0)
            {
                out += sep;
            }
            out += container[i];
        }
        return out;
    }
}
