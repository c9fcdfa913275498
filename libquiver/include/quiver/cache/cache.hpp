// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CACHE_CACHE_HPP
#define QUIVER_CACHE_CACHE_HPP

#include <string>
#include <string_view>

#include "quiver/fs/filesystem.hpp"
#include "quiver/specs/index_url.hpp"

namespace quiver
{
    /**
     * The top level directories of the cache.
     *
     * Each bucket carries a version in its directory name, so that an incompatible
     * layout change uses a fresh directory.
     */
    enum class CacheBucket
    {
        /** Pointers to wheels downloaded directly from an index. */
        wheels,
        /** Revisions of source distributions, and the wheels built from them. */
        source_distributions,
        /** Unpacked wheels, addressed by a unique id. */
        archive,
    };

    [[nodiscard]] auto cache_bucket_dir(CacheBucket bucket) -> std::string_view;

    /** A file in the cache. */
    class CacheEntry
    {
    public:

        CacheEntry(fs::u8path dir, fs::u8path file);

        [[nodiscard]] static auto from_path(const fs::u8path& path) -> CacheEntry;

        [[nodiscard]] auto dir() const noexcept -> const fs::u8path&;
        [[nodiscard]] auto file_name() const noexcept -> const fs::u8path&;
        [[nodiscard]] auto path() const -> fs::u8path;

    private:

        fs::u8path m_dir;
        fs::u8path m_file;
    };

    /** A directory in the cache. */
    class CacheShard
    {
    public:

        explicit CacheShard(fs::u8path path);

        [[nodiscard]] auto path() const noexcept -> const fs::u8path&;
        [[nodiscard]] auto shard(const fs::u8path& dir) const -> CacheShard;
        [[nodiscard]] auto entry(const fs::u8path& file) const -> CacheEntry;
        [[nodiscard]] auto join(const fs::u8path& sub) const -> fs::u8path;

    private:

        fs::u8path m_path;
    };

    /**
     * The location of the wheels from a given index, relative to a bucket.
     */
    class WheelCache
    {
    public:

        [[nodiscard]] static auto index(const specs::IndexUrl& url) -> WheelCache;

        /** The directory of the index, ``pypi`` or ``index/<digest>``. */
        [[nodiscard]] auto root() const -> fs::u8path;

        /** The directory of a package from the index. */
        [[nodiscard]] auto wheel_dir(std::string_view package) const -> fs::u8path;

    private:

        explicit WheelCache(fs::u8path root);

        fs::u8path m_root;
    };

    /**
     * Compose the paths of the local cache.
     *
     * No operation touches the filesystem.
     */
    class Cache
    {
    public:

        explicit Cache(fs::u8path root);

        [[nodiscard]] auto root() const noexcept -> const fs::u8path&;
        [[nodiscard]] auto bucket(CacheBucket bucket) const -> fs::u8path;
        [[nodiscard]] auto shard(CacheBucket bucket, const fs::u8path& dir) const -> CacheShard;
        [[nodiscard]] auto
        entry(CacheBucket bucket, const fs::u8path& dir, const fs::u8path& file) const
            -> CacheEntry;

        /** The entry of an unpacked wheel in the archive bucket. */
        [[nodiscard]] auto archive(std::string_view id) const -> CacheEntry;

    private:

        fs::u8path m_root;
    };

    /** A digest of a string, short enough for a directory name. */
    [[nodiscard]] auto cache_digest(std::string_view str) -> std::string;
}

#endif
