// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CORE_REGISTRY_WHEEL_INDEX_HPP
#define QUIVER_CORE_REGISTRY_WHEEL_INDEX_HPP

#include <map>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "quiver/cache/cache.hpp"
#include "quiver/cache/cached_wheel.hpp"
#include "quiver/specs/hash.hpp"
#include "quiver/specs/index_url.hpp"
#include "quiver/specs/package_name.hpp"
#include "quiver/specs/tags.hpp"
#include "quiver/specs/version.hpp"
#include "quiver/util/loop_control.hpp"

namespace quiver
{
    /**
     * A local index of the wheels that originate from a registry, such as PyPI.
     *
     * A package is indexed the first time it is queried, by scanning the cache for every
     * index it may come from.
     * Both the wheels downloaded from an index and the wheels built from its source
     * distributions are considered, and only the most compatible wheel of every version is
     * kept.
     * Once indexed, the wheels of a package never change for the lifetime of the index.
     *
     * The cache, tags, indexes, and hash strategy are referenced, not copied, and must
     * outlive the index.
     * Querying from multiple threads is safe.
     */
    class RegistryWheelIndex
    {
    public:

        using version_map = std::map<specs::Version, CachedRegistryDist>;
        using index_versions = std::pair<specs::Index, version_map>;
        /** The versions of a package, for each index, in order of index priority. */
        using package_index = std::vector<index_versions>;

        struct entry
        {
            const specs::Index& index;
            const specs::Version& version;
            const CachedRegistryDist& dist;
        };

        RegistryWheelIndex(
            const Cache& cache,
            const specs::Tags& tags,
            const specs::IndexLocations& index_locations,
            const specs::HashStrategy& hasher
        );

        RegistryWheelIndex(const RegistryWheelIndex&) = delete;
        RegistryWheelIndex(RegistryWheelIndex&&) = delete;
        auto operator=(const RegistryWheelIndex&) -> RegistryWheelIndex& = delete;
        auto operator=(RegistryWheelIndex&&) -> RegistryWheelIndex& = delete;

        /**
         * The available wheels of a package.
         *
         * Wheels are ordered by index priority, then by increasing version.
         * The package is indexed if it was not already.
         */
        [[nodiscard]] auto get(const specs::PackageName& name) -> std::vector<entry>;

        /**
         * Execute a function on the available wheels of a package, in the order of ``get``.
         *
         * The function is called with an ``entry`` and may return a ``util::LoopControl``
         * to stop early.
         */
        template <typename Func>
        void for_each_wheel(const specs::PackageName& name, Func&& func);

        /** Whether the package was already indexed. */
        [[nodiscard]] auto is_indexed(const specs::PackageName& name) const -> bool;

        /** The number of indexed packages. */
        [[nodiscard]] auto size() const -> std::size_t;

    private:

        auto get_impl(const specs::PackageName& name) -> const package_index&;

        [[nodiscard]] auto index_package(const specs::PackageName& name) const -> package_index;

        void index_wheels(
            const specs::PackageName& name,
            const specs::Index& index,
            version_map& versions
        ) const;

        void index_built_wheels(
            const specs::PackageName& name,
            const specs::Index& index,
            version_map& versions
        ) const;

        void add_wheel(CachedWheel&& wheel, version_map& versions) const;

        const Cache& m_cache;
        const specs::Tags& m_tags;
        const specs::IndexLocations& m_index_locations;
        const specs::HashStrategy& m_hasher;

        // Node based, so that references to the values stay valid while packages are added
        std::unordered_map<specs::PackageName, package_index> m_index;
        mutable std::mutex m_mutex;
    };

    /******************************************
     *  Implementation of RegistryWheelIndex  *
     ******************************************/

    template <typename Func>
    void RegistryWheelIndex::for_each_wheel(const specs::PackageName& name, Func&& func)
    {
        for (const auto& [index, versions] : get_impl(name))
        {
            for (const auto& [version, dist] : versions)
            {
                const auto item = entry{ index, version, dist };
                if constexpr (std::is_same_v<decltype(func(item)), util::LoopControl>)
                {
                    if (func(item) == util::LoopControl::Break)
                    {
                        return;
                    }
                }
                else
                {
                    func(item);
                }
            }
        }
    }
}

#endif
