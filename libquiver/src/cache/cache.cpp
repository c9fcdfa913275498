// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "quiver/cache/cache.hpp"
#include "quiver/util/cryptography.hpp"

namespace quiver
{
    auto cache_bucket_dir(CacheBucket bucket) -> std::string_view
    {
        switch (bucket)
        {
            case CacheBucket::wheels:
                return "wheels-v2";
            case CacheBucket::source_distributions:
                return "sdists-v5";
            case CacheBucket::archive:
                return "archive-v0";
        }
        return "unknown";
    }

    auto cache_digest(std::string_view str) -> std::string
    {
        auto hasher = util::Sha256Hasher();
        auto digest = hasher.str_hex_str(str);
        digest.resize(16);
        return digest;
    }

    /*******************************
     *  CacheEntry implementation  *
     *******************************/

    CacheEntry::CacheEntry(fs::u8path dir, fs::u8path file)
        : m_dir(std::move(dir))
        , m_file(std::move(file))
    {
    }

    auto CacheEntry::from_path(const fs::u8path& path) -> CacheEntry
    {
        return { path.parent_path(), path.filename() };
    }

    auto CacheEntry::dir() const noexcept -> const fs::u8path&
    {
        return m_dir;
    }

    auto CacheEntry::file_name() const noexcept -> const fs::u8path&
    {
        return m_file;
    }

    auto CacheEntry::path() const -> fs::u8path
    {
        return m_dir / m_file;
    }

    /*******************************
     *  CacheShard implementation  *
     *******************************/

    CacheShard::CacheShard(fs::u8path path)
        : m_path(std::move(path))
    {
    }

    auto CacheShard::path() const noexcept -> const fs::u8path&
    {
        return m_path;
    }

    auto CacheShard::shard(const fs::u8path& dir) const -> CacheShard
    {
        return CacheShard(m_path / dir);
    }

    auto CacheShard::entry(const fs::u8path& file) const -> CacheEntry
    {
        return { m_path, file };
    }

    auto CacheShard::join(const fs::u8path& sub) const -> fs::u8path
    {
        return m_path / sub;
    }

    /*******************************
     *  WheelCache implementation  *
     *******************************/

    WheelCache::WheelCache(fs::u8path root)
        : m_root(std::move(root))
    {
    }

    auto WheelCache::index(const specs::IndexUrl& url) -> WheelCache
    {
        if (url.is_pypi())
        {
            return WheelCache("pypi");
        }
        return WheelCache(fs::u8path("index") / cache_digest(url.str()));
    }

    auto WheelCache::root() const -> fs::u8path
    {
        return m_root;
    }

    auto WheelCache::wheel_dir(std::string_view package) const -> fs::u8path
    {
        return m_root / package;
    }

    /**************************
     *  Cache implementation  *
     **************************/

    Cache::Cache(fs::u8path root)
        : m_root(std::move(root))
    {
    }

    auto Cache::root() const noexcept -> const fs::u8path&
    {
        return m_root;
    }

    auto Cache::bucket(CacheBucket bucket) const -> fs::u8path
    {
        return m_root / cache_bucket_dir(bucket);
    }

    auto Cache::shard(CacheBucket bucket, const fs::u8path& dir) const -> CacheShard
    {
        return CacheShard(this->bucket(bucket) / dir);
    }

    auto Cache::entry(CacheBucket bucket, const fs::u8path& dir, const fs::u8path& file) const
        -> CacheEntry
    {
        return { this->bucket(bucket) / dir, file };
    }

    auto Cache::archive(std::string_view id) const -> CacheEntry
    {
        return { bucket(CacheBucket::archive), fs::u8path(id) };
    }
}
