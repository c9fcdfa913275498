// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CACHE_CACHED_WHEEL_HPP
#define QUIVER_CACHE_CACHED_WHEEL_HPP

#include <optional>
#include <string_view>

#include "quiver/cache/cache.hpp"
#include "quiver/fs/filesystem.hpp"
#include "quiver/specs/hash.hpp"
#include "quiver/specs/wheel_filename.hpp"

namespace quiver
{
    /** How a cached wheel entered the cache. */
    enum class DistOrigin
    {
        /** Downloaded as a wheel from an index. */
        wheel,
        /** Built locally from a source distribution. */
        built,
    };

    [[nodiscard]] auto dist_origin_name(DistOrigin origin) -> std::string_view;

    /**
     * An unpacked wheel from a registry, ready to be installed.
     */
    struct CachedRegistryDist
    {
        specs::WheelFilename filename;
        /** The directory of the unpacked wheel. */
        fs::u8path path;
        /**
         * The digests the distribution is trusted for.
         *
         * The digests of the wheel itself for downloaded wheels, and the ones of the
         * source distribution for built wheels.
         */
        specs::HashDigestList hashes;
        DistOrigin origin = DistOrigin::wheel;
    };

    /**
     * A wheel found while scanning the cache, before it is admitted in an index.
     */
    struct CachedWheel
    {
        specs::WheelFilename filename;
        CacheEntry entry;
        specs::HashDigestList hashes;
        DistOrigin origin = DistOrigin::wheel;

        /**
         * Read a wheel from a ``<wheel stem>.http`` archive pointer.
         *
         * Nothing is returned if the name is not a wheel, the pointer cannot be read, or
         * the archive it points to is gone.
         */
        [[nodiscard]] static auto from_http_pointer(const fs::u8path& path, const Cache& cache)
            -> std::optional<CachedWheel>;

        /** Read a wheel from a ``<wheel stem>.rev`` archive pointer, see ``from_http_pointer``. */
        [[nodiscard]] static auto from_local_pointer(const fs::u8path& path, const Cache& cache)
            -> std::optional<CachedWheel>;

        /** Read a wheel from a ``<wheel stem>`` link to a build output. */
        [[nodiscard]] static auto from_built_source(const fs::u8path& path)
            -> std::optional<CachedWheel>;

        /** Whether the digests fulfill the policy. */
        [[nodiscard]] auto satisfies(const specs::HashPolicy& policy) const -> bool;

        [[nodiscard]] auto into_registry_dist() && -> CachedRegistryDist;
    };
}

#endif
