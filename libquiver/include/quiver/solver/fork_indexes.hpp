// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_SOLVER_FORK_INDEXES_HPP
#define QUIVER_SOLVER_FORK_INDEXES_HPP

#include <optional>
#include <unordered_map>

#include <tl/expected.hpp>

#include "quiver/solver/resolve_error.hpp"
#include "quiver/solver/resolver_markers.hpp"
#include "quiver/specs/index_url.hpp"
#include "quiver/specs/package_name.hpp"

namespace quiver::solver
{
    /**
     * The index used for every package in a branch of the resolution.
     *
     * A package must come from a single index within a branch, while different branches
     * may use different indexes for the same package.
     * The solver copies this object when it splits the resolution, so that every branch
     * only sees the indexes chosen on its own path.
     */
    class ForkIndexes
    {
    public:

        using index_map = std::unordered_map<specs::PackageName, specs::IndexUrl>;

        /** The index previously used for the package in this branch. */
        [[nodiscard]] auto get(const specs::PackageName& name) const
            -> std::optional<specs::IndexUrl>;

        /**
         * Record the index used for a package.
         *
         * Recording the same index again has no effect.
         * Recording another index is an error, reported for the markers of the branch, and
         * leaves the recorded index unchanged.
         */
        auto insert(
            const specs::PackageName& name,
            const specs::IndexUrl& index,
            const ResolverMarkers& fork_markers
        ) -> tl::expected<void, ResolveError>;

        [[nodiscard]] auto size() const noexcept -> std::size_t;
        [[nodiscard]] auto empty() const noexcept -> bool;

    private:

        index_map m_indexes = {};
    };
}

#endif
