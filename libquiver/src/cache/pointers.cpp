// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "quiver/cache/pointers.hpp"
#include "quiver/core/logging.hpp"

namespace quiver
{
    namespace
    {
        template <typename Pointer>
        auto read_pointer(const CacheEntry& entry) -> expected_t<std::optional<Pointer>>
        {
            const auto path = entry.path();

            std::ifstream infile(path, std::ios::binary);
            if (!infile)
            {
                std::error_code ec;
                if (!fs::exists(path, ec))
                {
                    return { std::nullopt };
                }
                return make_unexpected(
                    fmt::format("File: {}: Could not open pointer record", path.string()),
                    quiver_error_code::cache_io_failure
                );
            }

            try
            {
                auto j = nlohmann::json::parse(infile);
                return { j.get<Pointer>() };
            }
            catch (const std::exception& e)
            {
                LOG_DEBUG << "Could not parse pointer record " << path.string() << ": " << e.what();
                return make_unexpected(
                    fmt::format(
                        "File: {}: Could not parse pointer record ({})",
                        path.string(),
                        e.what()
                    ),
                    quiver_error_code::cache_record_corrupted
                );
            }
        }

        template <typename Pointer>
        auto write_pointer(const CacheEntry& entry, const Pointer& pointer) -> expected_t<void>
        {
            const auto path = entry.path();
            try
            {
                fs::write_atomic(path, nlohmann::json(pointer).dump());
            }
            catch (const std::exception& e)
            {
                return make_unexpected(
                    fmt::format(
                        "File: {}: Could not write pointer record ({})",
                        path.string(),
                        e.what()
                    ),
                    quiver_error_code::cache_io_failure
                );
            }
            return {};
        }

        // Identifiers name a single directory of the cache
        auto checked_id(const nlohmann::json& j) -> std::string
        {
            auto id = j.at("id").get<std::string>();
            const bool valid = !id.empty() && (id != ".") && (id != "..")
                               && (id.find_first_of("/\\") == std::string::npos);
            if (!valid)
            {
                throw std::invalid_argument(fmt::format("Invalid cache identifier '{}'", id));
            }
            return id;
        }
    }

    auto Revision::satisfies(const specs::HashPolicy& policy) const -> bool
    {
        return specs::satisfies(hashes, policy);
    }

    void to_json(nlohmann::json& j, const Archive& archive)
    {
        j["id"] = archive.id;
        j["hashes"] = archive.hashes;
    }

    void from_json(const nlohmann::json& j, Archive& archive)
    {
        archive.id = checked_id(j);
        archive.hashes = j.value("hashes", specs::HashDigestList());
    }

    void to_json(nlohmann::json& j, const Revision& revision)
    {
        j["id"] = revision.id;
        j["hashes"] = revision.hashes;
    }

    void from_json(const nlohmann::json& j, Revision& revision)
    {
        revision.id = checked_id(j);
        revision.hashes = j.value("hashes", specs::HashDigestList());
    }

    /****************************************
     *  Implementation of archive pointers  *
     ****************************************/

    auto HttpArchivePointer::read_from(const CacheEntry& entry)
        -> expected_t<std::optional<HttpArchivePointer>>
    {
        return read_pointer<HttpArchivePointer>(entry);
    }

    auto HttpArchivePointer::write_to(const CacheEntry& entry) const -> expected_t<void>
    {
        return write_pointer(entry, *this);
    }

    auto HttpArchivePointer::into_archive() && -> Archive
    {
        return std::move(archive);
    }

    auto LocalArchivePointer::read_from(const CacheEntry& entry)
        -> expected_t<std::optional<LocalArchivePointer>>
    {
        return read_pointer<LocalArchivePointer>(entry);
    }

    auto LocalArchivePointer::write_to(const CacheEntry& entry) const -> expected_t<void>
    {
        return write_pointer(entry, *this);
    }

    auto LocalArchivePointer::into_archive() && -> Archive
    {
        return std::move(archive);
    }

    void to_json(nlohmann::json& j, const HttpArchivePointer& pointer)
    {
        j["archive"] = pointer.archive;
    }

    void from_json(const nlohmann::json& j, HttpArchivePointer& pointer)
    {
        pointer.archive = j.at("archive").get<Archive>();
    }

    void to_json(nlohmann::json& j, const LocalArchivePointer& pointer)
    {
        j["timestamp"] = pointer.timestamp;
        j["archive"] = pointer.archive;
    }

    void from_json(const nlohmann::json& j, LocalArchivePointer& pointer)
    {
        pointer.timestamp = j.value("timestamp", std::int64_t(0));
        pointer.archive = j.at("archive").get<Archive>();
    }

    /*****************************************
     *  Implementation of revision pointers  *
     *****************************************/

    auto HttpRevisionPointer::read_from(const CacheEntry& entry)
        -> expected_t<std::optional<HttpRevisionPointer>>
    {
        return read_pointer<HttpRevisionPointer>(entry);
    }

    auto HttpRevisionPointer::write_to(const CacheEntry& entry) const -> expected_t<void>
    {
        return write_pointer(entry, *this);
    }

    auto HttpRevisionPointer::into_revision() && -> Revision
    {
        return std::move(revision);
    }

    auto LocalRevisionPointer::read_from(const CacheEntry& entry)
        -> expected_t<std::optional<LocalRevisionPointer>>
    {
        return read_pointer<LocalRevisionPointer>(entry);
    }

    auto LocalRevisionPointer::write_to(const CacheEntry& entry) const -> expected_t<void>
    {
        return write_pointer(entry, *this);
    }

    auto LocalRevisionPointer::into_revision() && -> Revision
    {
        return std::move(revision);
    }

    void to_json(nlohmann::json& j, const HttpRevisionPointer& pointer)
    {
        j["revision"] = pointer.revision;
    }

    void from_json(const nlohmann::json& j, HttpRevisionPointer& pointer)
    {
        pointer.revision = j.at("revision").get<Revision>();
    }

    void to_json(nlohmann::json& j, const LocalRevisionPointer& pointer)
    {
        j["timestamp"] = pointer.timestamp;
        j["revision"] = pointer.revision;
    }

    void from_json(const nlohmann::json& j, LocalRevisionPointer& pointer)
    {
        pointer.timestamp = j.value("timestamp", std::int64_t(0));
        pointer.revision = j.at("revision").get<Revision>();
    }
}
