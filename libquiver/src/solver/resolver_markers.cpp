// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <type_traits>

#include <fmt/format.h>

#include "quiver/solver/resolver_markers.hpp"

namespace quiver::solver
{
    auto ResolverMarkers::universal(std::vector<specs::MarkerTree> fork_preferences)
        -> ResolverMarkers
    {
        return { Universal{ std::move(fork_preferences) } };
    }

    auto ResolverMarkers::specific_environment(specs::MarkerEnvironment env) -> ResolverMarkers
    {
        return { SpecificEnvironment{ std::move(env) } };
    }

    auto ResolverMarkers::fork(specs::MarkerTree markers) -> ResolverMarkers
    {
        return { Fork{ std::move(markers) } };
    }

    auto ResolverMarkers::is_universal() const -> bool
    {
        return std::holds_alternative<Universal>(value);
    }

    auto ResolverMarkers::is_specific_environment() const -> bool
    {
        return std::holds_alternative<SpecificEnvironment>(value);
    }

    auto ResolverMarkers::is_fork() const -> bool
    {
        return std::holds_alternative<Fork>(value);
    }

    auto ResolverMarkers::fork_markers() const -> std::optional<specs::MarkerTree>
    {
        if (const auto* fork = std::get_if<Fork>(&value))
        {
            return fork->markers;
        }
        return std::nullopt;
    }

    auto ResolverMarkers::to_string() const -> std::string
    {
        return std::visit(
            [](const auto& markers) -> std::string
            {
                using Markers = std::decay_t<decltype(markers)>;
                if constexpr (std::is_same_v<Markers, Universal>)
                {
                    return "universal";
                }
                else if constexpr (std::is_same_v<Markers, SpecificEnvironment>)
                {
                    return "specific environment";
                }
                else
                {
                    return fmt::format("split `{}`", markers.markers.to_string());
                }
            },
            value
        );
    }
}
