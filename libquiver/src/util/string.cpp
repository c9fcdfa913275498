// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <utility>

#include "quiver/util/string.hpp"

namespace quiver::util
{
    namespace
    {
        constexpr std::string_view whitespaces = " \t\n\v\f\r";

        auto as_uchar(char c) -> unsigned char
        {
            return static_cast<unsigned char>(c);
        }
    }

    /*************************
     *  Character functions  *
     *************************/

    auto is_space(char c) -> bool
    {
        return whitespaces.find(c) != std::string_view::npos;
    }

    auto is_digit(char c) -> bool
    {
        return ('0' <= c) && (c <= '9');
    }

    auto is_alpha(char c) -> bool
    {
        return std::isalpha(as_uchar(c)) != 0;
    }

    auto is_alphanum(char c) -> bool
    {
        return is_digit(c) || is_alpha(c);
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(as_uchar(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        return to_lower(std::string(str));
    }

    auto to_lower(std::string&& str) -> std::string
    {
        for (auto& c : str)
        {
            c = to_lower(c);
        }
        return std::move(str);
    }

    /**************************
     *  Substring predicates  *
     **************************/

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.starts_with(prefix);
    }

    auto starts_with(std::string_view str, char c) -> bool
    {
        return str.starts_with(c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.ends_with(suffix);
    }

    auto ends_with(std::string_view str, char c) -> bool
    {
        return str.ends_with(c);
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string_view::npos;
    }

    auto contains(std::string_view str, char c) -> bool
    {
        return str.find(c) != std::string_view::npos;
    }

    auto remove_suffix(std::string_view str, std::string_view suffix) -> std::string_view
    {
        if (str.ends_with(suffix))
        {
            str.remove_suffix(suffix.size());
        }
        return str;
    }

    auto remove_suffix(std::string_view str, char c) -> std::string_view
    {
        return remove_suffix(str, std::string_view(&c, 1));
    }

    /***************
     *  Stripping  *
     ***************/

    auto lstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        input.remove_prefix(std::min(input.find_first_not_of(chars), input.size()));
        return input;
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip(input, whitespaces);
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto last = input.find_last_not_of(chars);
        // npos + 1 wraps to an empty view
        return input.substr(0, last + 1);
    }

    auto rstrip(std::string_view input, char c) -> std::string_view
    {
        return rstrip(input, std::string_view(&c, 1));
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip(input, whitespaces);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        return lstrip(rstrip(input, chars), chars);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, whitespaces);
    }

    /***************
     *  Splitting  *
     ***************/

    auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>
    {
        const auto pos = str.find(sep);
        if (pos == std::string_view::npos)
        {
            return { str, std::nullopt };
        }
        return { str.substr(0, pos), str.substr(pos + 1) };
    }

    auto split(std::string_view input, std::string_view sep, std::size_t max_split)
        -> std::vector<std::string>
    {
        auto parts = std::vector<std::string>();
        if (!sep.empty())
        {
            for (auto pos = input.find(sep); (pos != std::string_view::npos) && (max_split > 0);
                 pos = input.find(sep), --max_split)
            {
                parts.emplace_back(input.substr(0, pos));
                input.remove_prefix(pos + sep.size());
            }
        }
        parts.emplace_back(input);
        return parts;
    }
}
