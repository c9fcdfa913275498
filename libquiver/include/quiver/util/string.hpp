// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_UTIL_STRING_HPP
#define QUIVER_UTIL_STRING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace quiver::util
{
    [[nodiscard]] auto is_space(char c) -> bool;
    [[nodiscard]] auto is_digit(char c) -> bool;
    [[nodiscard]] auto is_alpha(char c) -> bool;
    [[nodiscard]] auto is_alphanum(char c) -> bool;
    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;
    [[nodiscard]] auto to_lower(std::string&& str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, char c) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, char c) -> bool;
    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;
    [[nodiscard]] auto contains(std::string_view str, char c) -> bool;

    /**
     * Return a view to the input with the suffix removed if present.
     */
    [[nodiscard]] auto remove_suffix(std::string_view str, std::string_view suffix)
        -> std::string_view;
    [[nodiscard]] auto remove_suffix(std::string_view str, char c) -> std::string_view;

    [[nodiscard]] auto lstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split once on the first occurrence of the separator.
     *
     * The second element is empty if the separator was not found.
     */
    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>;

    [[nodiscard]] auto
    split(std::string_view input, std::string_view sep, std::size_t max_split = SIZE_MAX)
        -> std::vector<std::string>;

    template <typename Range>
    [[nodiscard]] auto join(std::string_view sep, const Range& container) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    template <typename Range>
    auto join(std::string_view sep, const Range& container) -> std::string
    {
        auto out = std::string();
        bool first = true;
        for (const auto& item : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += item;
            first = false;
        }
        return out;
    }
}
#endif
