// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "quiver/core/logging.hpp"
#include "quiver/solver/fork_indexes.hpp"

namespace quiver::solver
{
    auto ForkIndexes::get(const specs::PackageName& name) const -> std::optional<specs::IndexUrl>
    {
        if (const auto it = m_indexes.find(name); it != m_indexes.cend())
        {
            return it->second;
        }
        return std::nullopt;
    }

    auto ForkIndexes::insert(
        const specs::PackageName& name,
        const specs::IndexUrl& index,
        const ResolverMarkers& fork_markers
    ) -> tl::expected<void, ResolveError>
    {
        const auto [it, inserted] = m_indexes.try_emplace(name, index);
        if (inserted || (it->second == index))
        {
            return {};
        }

        auto conflicts = std::vector<std::string>{ it->second.to_string(), index.to_string() };
        std::sort(conflicts.begin(), conflicts.end());

        LOG_DEBUG << "Conflicting indexes for " << name.str() << " in "
                  << fork_markers.to_string() << ": " << conflicts[0] << ", " << conflicts[1];

        if (auto markers = fork_markers.fork_markers())
        {
            return tl::make_unexpected(ResolveError(
                ConflictingIndexesFork{ name, std::move(conflicts), std::move(*markers) }
            ));
        }
        // Universal and specific environment resolutions do not split
        return tl::make_unexpected(
            ResolveError(ConflictingIndexesUniversal{ name, std::move(conflicts) })
        );
    }

    auto ForkIndexes::size() const noexcept -> std::size_t
    {
        return m_indexes.size();
    }

    auto ForkIndexes::empty() const noexcept -> bool
    {
        return m_indexes.empty();
    }
}
