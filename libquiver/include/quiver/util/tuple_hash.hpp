// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_UTIL_TUPLE_HASH_HPP
#define QUIVER_UTIL_TUPLE_HASH_HPP

#include <cstddef>
#include <functional>
#include <type_traits>

namespace quiver::util
{
    /** Mix the hash of a value into a running seed. */
    template <typename T>
    void hash_combine_val(std::size_t& seed, const T& val)
    {
        const std::size_t h = std::hash<T>{}(val);
        seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }

    /** The combined hash of several values, in order, such as the fields of a struct. */
    template <typename... T>
    [[nodiscard]] auto hash_vals(const T&... vals) -> std::size_t
    {
        std::size_t seed = 0;
        (hash_combine_val(seed, vals), ...);
        return seed;
    }
}
#endif
