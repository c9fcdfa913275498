// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "quiver/cache/pointers.hpp"
#include "quiver/core/logging.hpp"
#include "quiver/core/registry_wheel_index.hpp"
#include "quiver/fs/filesystem.hpp"
#include "quiver/util/string.hpp"

namespace quiver
{
    namespace
    {
        auto has_extension(const fs::u8path& file, std::string_view ext) -> bool
        {
            return util::to_lower(file.extension().string()) == ext;
        }

        template <typename Pointer>
        auto read_revision(const CacheEntry& entry) -> std::optional<Revision>
        {
            auto pointer = Pointer::read_from(entry);
            if (!pointer)
            {
                LOG_DEBUG << "Ignoring revision " << entry.path().string() << ": "
                          << pointer.error().what();
                return std::nullopt;
            }
            if (!pointer.value().has_value())
            {
                return std::nullopt;
            }
            return { std::move(*pointer.value()).into_revision() };
        }
    }

    RegistryWheelIndex::RegistryWheelIndex(
        const Cache& cache,
        const specs::Tags& tags,
        const specs::IndexLocations& index_locations,
        const specs::HashStrategy& hasher
    )
        : m_cache(cache)
        , m_tags(tags)
        , m_index_locations(index_locations)
        , m_hasher(hasher)
    {
    }

    auto RegistryWheelIndex::get(const specs::PackageName& name) -> std::vector<entry>
    {
        const auto& by_index = get_impl(name);

        auto out = std::vector<entry>();
        for (const auto& [index, versions] : by_index)
        {
            for (const auto& [version, dist] : versions)
            {
                out.push_back({ index, version, dist });
            }
        }
        return out;
    }

    auto RegistryWheelIndex::is_indexed(const specs::PackageName& name) const -> bool
    {
        auto lock = std::lock_guard(m_mutex);
        return m_index.find(name) != m_index.cend();
    }

    auto RegistryWheelIndex::size() const -> std::size_t
    {
        auto lock = std::lock_guard(m_mutex);
        return m_index.size();
    }

    auto RegistryWheelIndex::get_impl(const specs::PackageName& name) -> const package_index&
    {
        {
            auto lock = std::lock_guard(m_mutex);
            if (const auto it = m_index.find(name); it != m_index.cend())
            {
                return it->second;
            }
        }

        // Scanning the cache is slow, it must not block queries for other packages
        auto by_index = index_package(name);

        auto lock = std::lock_guard(m_mutex);
        const auto [it, inserted] = m_index.try_emplace(name, std::move(by_index));
        if (!inserted)
        {
            LOG_DEBUG << "Package " << name.str() << " was concurrently indexed, discarding result";
        }
        return it->second;
    }

    auto RegistryWheelIndex::index_package(const specs::PackageName& name) const -> package_index
    {
        LOG_DEBUG << "Indexing cached wheels of " << name.str();

        auto out = package_index();
        for (auto& index : m_index_locations.registry_indexes())
        {
            auto versions = version_map();
            index_wheels(name, index, versions);
            index_built_wheels(name, index, versions);

            LOG_TRACE << "Found " << versions.size() << " cached versions of " << name.str()
                      << " from " << index.url.str();
            out.emplace_back(std::move(index), std::move(versions));
        }
        return out;
    }

    void RegistryWheelIndex::index_wheels(
        const specs::PackageName& name,
        const specs::Index& index,
        version_map& versions
    ) const
    {
        // <bucket>/<index>/<package>/<wheel stem>.http or <wheel stem>.rev
        const auto wheel_dir = m_cache.shard(
            CacheBucket::wheels,
            WheelCache::index(index.url).wheel_dir(name.str())
        );

        for (const auto& file : fs::files(wheel_dir.path()))
        {
            auto wheel = std::optional<CachedWheel>();
            if (index.url.is_path())
            {
                if (has_extension(file, ".rev"))
                {
                    wheel = CachedWheel::from_local_pointer(wheel_dir.join(file), m_cache);
                }
            }
            else if (has_extension(file, ".http"))
            {
                wheel = CachedWheel::from_http_pointer(wheel_dir.join(file), m_cache);
            }

            if (!wheel)
            {
                continue;
            }

            // The digests of a downloaded wheel are the ones of the wheel itself
            const auto policy = m_hasher.get_package(
                wheel->filename.name(),
                wheel->filename.version()
            );
            if (!wheel->satisfies(policy))
            {
                LOG_DEBUG << "Ignoring cached wheel " << wheel->filename.to_string()
                          << ": digests do not satisfy the hash policy";
                continue;
            }
            add_wheel(std::move(*wheel), versions);
        }
    }

    void RegistryWheelIndex::index_built_wheels(
        const specs::PackageName& name,
        const specs::Index& index,
        version_map& versions
    ) const
    {
        // <bucket>/<index>/<package>/<version>/<revision pointer>
        // <bucket>/<index>/<package>/<version>/<revision id>/<wheel stem> -> build output
        const auto sdist_dir = m_cache.shard(
            CacheBucket::source_distributions,
            WheelCache::index(index.url).wheel_dir(name.str())
        );

        for (const auto& dir : fs::directories(sdist_dir.path()))
        {
            const auto shard = sdist_dir.shard(dir);

            const auto revision = index.url.is_path()
                                      ? read_revision<LocalRevisionPointer>(
                                            shard.entry(LOCAL_REVISION)
                                        )
                                      : read_revision<HttpRevisionPointer>(
                                            shard.entry(HTTP_REVISION)
                                        );
            if (!revision)
            {
                continue;
            }

            for (const auto& link : fs::symlinks(shard.join(revision->id)))
            {
                auto wheel = CachedWheel::from_built_source(link);
                if (!wheel)
                {
                    continue;
                }

                // A built wheel is trusted for the digests of its source distribution
                const auto policy = m_hasher.get_package(
                    wheel->filename.name(),
                    wheel->filename.version()
                );
                if (!revision->satisfies(policy))
                {
                    LOG_DEBUG << "Ignoring built wheel " << wheel->filename.to_string()
                              << ": source digests do not satisfy the hash policy";
                    continue;
                }
                wheel->hashes = revision->hashes;
                add_wheel(std::move(*wheel), versions);
            }
        }
    }

    void RegistryWheelIndex::add_wheel(CachedWheel&& wheel, version_map& versions) const
    {
        auto dist = std::move(wheel).into_registry_dist();

        // Keep the wheel with the highest priority
        const auto compatibility = dist.filename.compatibility(m_tags);
        if (auto it = versions.find(dist.filename.version()); it != versions.end())
        {
            // Ties keep the wheel seen first
            if (compatibility > it->second.filename.compatibility(m_tags))
            {
                it->second = std::move(dist);
            }
        }
        else if (compatibility.is_compatible())
        {
            auto version = dist.filename.version();
            versions.emplace(std::move(version), std::move(dist));
        }
        else
        {
            LOG_TRACE << "Ignoring cached wheel " << dist.filename.to_string() << ": "
                      << compatibility.to_string();
        }
    }
}
