// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CACHE_POINTERS_HPP
#define QUIVER_CACHE_POINTERS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "quiver/cache/cache.hpp"
#include "quiver/core/error_handling.hpp"
#include "quiver/specs/hash.hpp"

namespace quiver
{
    /** The name of the revision pointer of a source distribution from a remote index. */
    inline constexpr std::string_view HTTP_REVISION = "revision.http";
    /** The name of the revision pointer of a source distribution from a local directory. */
    inline constexpr std::string_view LOCAL_REVISION = "revision.rev";

    /** An unpacked wheel in the archive bucket, with the digests of the original file. */
    struct Archive
    {
        std::string id;
        specs::HashDigestList hashes;
    };

    /**
     * A built revision of a source distribution.
     *
     * The wheels built from it live under the ``<id>`` directory of the revision shard.
     */
    struct Revision
    {
        std::string id;
        /** The digests of the source distribution. */
        specs::HashDigestList hashes;

        [[nodiscard]] auto satisfies(const specs::HashPolicy& policy) const -> bool;
    };

    void to_json(nlohmann::json& j, const Archive& archive);
    void from_json(const nlohmann::json& j, Archive& archive);
    void to_json(nlohmann::json& j, const Revision& revision);
    void from_json(const nlohmann::json& j, Revision& revision);

    /** Pointer from a ``<wheel stem>.http`` file to a wheel downloaded from a remote index. */
    struct HttpArchivePointer
    {
        Archive archive;

        static auto read_from(const CacheEntry& entry)
            -> expected_t<std::optional<HttpArchivePointer>>;
        [[nodiscard]] auto write_to(const CacheEntry& entry) const -> expected_t<void>;

        [[nodiscard]] auto into_archive() && -> Archive;
    };

    /** Pointer from a ``<wheel stem>.rev`` file to a wheel copied from a local directory. */
    struct LocalArchivePointer
    {
        /** Modification time of the source file, used to detect stale entries. */
        std::int64_t timestamp = 0;
        Archive archive;

        static auto read_from(const CacheEntry& entry)
            -> expected_t<std::optional<LocalArchivePointer>>;
        [[nodiscard]] auto write_to(const CacheEntry& entry) const -> expected_t<void>;

        [[nodiscard]] auto into_archive() && -> Archive;
    };

    /** Pointer from a ``revision.http`` file to the revision of a remote source distribution. */
    struct HttpRevisionPointer
    {
        Revision revision;

        static auto read_from(const CacheEntry& entry)
            -> expected_t<std::optional<HttpRevisionPointer>>;
        [[nodiscard]] auto write_to(const CacheEntry& entry) const -> expected_t<void>;

        [[nodiscard]] auto into_revision() && -> Revision;
    };

    /** Pointer from a ``revision.rev`` file to the revision of a local source distribution. */
    struct LocalRevisionPointer
    {
        /** Modification time of the source file, used to detect stale entries. */
        std::int64_t timestamp = 0;
        Revision revision;

        static auto read_from(const CacheEntry& entry)
            -> expected_t<std::optional<LocalRevisionPointer>>;
        [[nodiscard]] auto write_to(const CacheEntry& entry) const -> expected_t<void>;

        [[nodiscard]] auto into_revision() && -> Revision;
    };

    void to_json(nlohmann::json& j, const HttpArchivePointer& pointer);
    void from_json(const nlohmann::json& j, HttpArchivePointer& pointer);
    void to_json(nlohmann::json& j, const LocalArchivePointer& pointer);
    void from_json(const nlohmann::json& j, LocalArchivePointer& pointer);
    void to_json(nlohmann::json& j, const HttpRevisionPointer& pointer);
    void from_json(const nlohmann::json& j, HttpRevisionPointer& pointer);
    void to_json(nlohmann::json& j, const LocalRevisionPointer& pointer);
    void from_json(const nlohmann::json& j, LocalRevisionPointer& pointer);
}

#endif
