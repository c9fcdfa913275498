// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_SOLVER_RESOLVER_MARKERS_HPP
#define QUIVER_SOLVER_RESOLVER_MARKERS_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "quiver/specs/marker.hpp"

namespace quiver::solver
{
    /**
     * The environments a resolution, or a branch of it, applies to.
     */
    struct ResolverMarkers
    {
        /** A resolution for every environment, before any split. */
        struct Universal
        {
            /** Splits to explore first, in order. */
            std::vector<specs::MarkerTree> fork_preferences = {};
        };

        /** A resolution for a single known environment. */
        struct SpecificEnvironment
        {
            specs::MarkerEnvironment environment;
        };

        /** A branch of a universal resolution, limited to the environments of the markers. */
        struct Fork
        {
            specs::MarkerTree markers;
        };

        using value_type = std::variant<Universal, SpecificEnvironment, Fork>;

        [[nodiscard]] static auto universal(std::vector<specs::MarkerTree> fork_preferences = {})
            -> ResolverMarkers;
        [[nodiscard]] static auto specific_environment(specs::MarkerEnvironment env)
            -> ResolverMarkers;
        [[nodiscard]] static auto fork(specs::MarkerTree markers) -> ResolverMarkers;

        value_type value = Universal{};

        [[nodiscard]] auto is_universal() const -> bool;
        [[nodiscard]] auto is_specific_environment() const -> bool;
        [[nodiscard]] auto is_fork() const -> bool;

        /** The markers of a fork, nothing for other resolutions. */
        [[nodiscard]] auto fork_markers() const -> std::optional<specs::MarkerTree>;

        [[nodiscard]] auto to_string() const -> std::string;
    };
}

#endif
