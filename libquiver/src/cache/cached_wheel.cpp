// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "quiver/cache/cached_wheel.hpp"
#include "quiver/cache/pointers.hpp"
#include "quiver/core/logging.hpp"
#include "quiver/util/string.hpp"

namespace quiver
{
    namespace
    {
        auto parse_stem(const fs::u8path& path, std::string_view extension)
            -> std::optional<specs::WheelFilename>
        {
            auto stem = path.filename().string();
            if (!extension.empty())
            {
                if (util::to_lower(path.extension().string()) != extension)
                {
                    return std::nullopt;
                }
                stem = path.stem().string();
            }
            auto filename = specs::WheelFilename::from_stem(stem);
            if (!filename)
            {
                LOG_TRACE << "Ignoring cache entry " << path.string() << ": "
                          << filename.error().what();
                return std::nullopt;
            }
            return { std::move(filename).value() };
        }

        template <typename Pointer>
        auto from_archive_pointer(const fs::u8path& path, const Cache& cache, std::string_view ext)
            -> std::optional<CachedWheel>
        {
            auto filename = parse_stem(path, ext);
            if (!filename)
            {
                return std::nullopt;
            }

            auto pointer = Pointer::read_from(CacheEntry::from_path(path));
            if (!pointer)
            {
                LOG_DEBUG << "Ignoring cache entry " << path.string() << ": "
                          << pointer.error().what();
                return std::nullopt;
            }
            if (!pointer.value().has_value())
            {
                return std::nullopt;
            }

            auto archive = std::move(*pointer.value()).into_archive();
            auto entry = cache.archive(archive.id);

            std::error_code ec;
            if (!fs::exists(entry.path(), ec))
            {
                LOG_TRACE << "Ignoring stale pointer " << path.string() << " to missing archive "
                          << entry.path().string();
                return std::nullopt;
            }

            return { CachedWheel{
                std::move(filename).value(),
                std::move(entry),
                std::move(archive.hashes),
                DistOrigin::wheel,
            } };
        }
    }

    auto dist_origin_name(DistOrigin origin) -> std::string_view
    {
        switch (origin)
        {
            case DistOrigin::wheel:
                return "wheel";
            case DistOrigin::built:
                return "built";
        }
        return "wheel";
    }

    auto CachedWheel::from_http_pointer(const fs::u8path& path, const Cache& cache)
        -> std::optional<CachedWheel>
    {
        return from_archive_pointer<HttpArchivePointer>(path, cache, ".http");
    }

    auto CachedWheel::from_local_pointer(const fs::u8path& path, const Cache& cache)
        -> std::optional<CachedWheel>
    {
        return from_archive_pointer<LocalArchivePointer>(path, cache, ".rev");
    }

    auto CachedWheel::from_built_source(const fs::u8path& path) -> std::optional<CachedWheel>
    {
        auto filename = parse_stem(path, "");
        if (!filename)
        {
            return std::nullopt;
        }

        // Links to a removed build output are dangling
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            LOG_TRACE << "Ignoring dangling build output " << path.string();
            return std::nullopt;
        }

        return { CachedWheel{
            std::move(filename).value(),
            CacheEntry::from_path(path),
            {},
            DistOrigin::built,
        } };
    }

    auto CachedWheel::satisfies(const specs::HashPolicy& policy) const -> bool
    {
        return specs::satisfies(hashes, policy);
    }

    auto CachedWheel::into_registry_dist() && -> CachedRegistryDist
    {
        return {
            std::move(filename),
            entry.path(),
            std::move(hashes),
            origin,
        };
    }
}
