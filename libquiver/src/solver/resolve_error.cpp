// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <any>
#include <type_traits>

#include <fmt/format.h>

#include "quiver/solver/resolve_error.hpp"

namespace quiver::solver
{
    namespace
    {
        auto quoted_list(const std::vector<std::string>& items) -> std::string
        {
            auto out = std::string();
            for (const auto& item : items)
            {
                if (!out.empty())
                {
                    out += ", ";
                }
                out += fmt::format("`{}`", item);
            }
            return out;
        }
    }

    auto conflict_message(const IndexConflict& conflict) -> std::string
    {
        return std::visit(
            [](const auto& c) -> std::string
            {
                using Conflict = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<Conflict, ConflictingIndexesFork>)
                {
                    return fmt::format(
                        "Requirements contain conflicting indexes for package `{}` "
                        "in split `{}`: {}",
                        c.package_name.str(),
                        c.fork_markers.to_string(),
                        quoted_list(c.indexes)
                    );
                }
                else
                {
                    return fmt::format(
                        "Requirements contain conflicting indexes for package `{}`: {}",
                        c.package_name.str(),
                        quoted_list(c.indexes)
                    );
                }
            },
            conflict
        );
    }

    ResolveError::ResolveError(IndexConflict conflict)
        : quiver_error(
              conflict_message(conflict),
              quiver_error_code::conflicting_indexes,
              std::any(conflict)
          )
    {
    }

    auto ResolveError::conflict() const -> const IndexConflict&
    {
        return *std::any_cast<IndexConflict>(&data());
    }

    auto ResolveError::package_name() const -> const specs::PackageName&
    {
        return std::visit(
            [](const auto& c) -> const specs::PackageName& { return c.package_name; },
            conflict()
        );
    }

    auto ResolveError::indexes() const -> const std::vector<std::string>&
    {
        return std::visit(
            [](const auto& c) -> const std::vector<std::string>& { return c.indexes; },
            conflict()
        );
    }
}
