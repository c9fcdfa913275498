// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_SOLVER_RESOLVE_ERROR_HPP
#define QUIVER_SOLVER_RESOLVE_ERROR_HPP

#include <string>
#include <variant>
#include <vector>

#include "quiver/core/error_handling.hpp"
#include "quiver/specs/marker.hpp"
#include "quiver/specs/package_name.hpp"

namespace quiver::solver
{
    /** A package was requested from two indexes in a resolution without splits. */
    struct ConflictingIndexesUniversal
    {
        specs::PackageName package_name;
        /** The conflicting index URLs, sorted. */
        std::vector<std::string> indexes;
    };

    /** A package was requested from two indexes in the same split of a resolution. */
    struct ConflictingIndexesFork
    {
        specs::PackageName package_name;
        /** The conflicting index URLs, sorted. */
        std::vector<std::string> indexes;
        specs::MarkerTree fork_markers;
    };

    using IndexConflict = std::variant<ConflictingIndexesUniversal, ConflictingIndexesFork>;

    [[nodiscard]] auto conflict_message(const IndexConflict& conflict) -> std::string;

    /**
     * An error ending a branch of the resolution.
     *
     * The conflict is kept as the error data.
     */
    class ResolveError : public quiver_error
    {
    public:

        explicit ResolveError(IndexConflict conflict);

        [[nodiscard]] auto conflict() const -> const IndexConflict&;
        [[nodiscard]] auto package_name() const -> const specs::PackageName&;
        [[nodiscard]] auto indexes() const -> const std::vector<std::string>&;
    };
}

#endif
