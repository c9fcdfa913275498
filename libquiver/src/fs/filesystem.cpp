// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <fstream>
#include <system_error>

#include "quiver/core/logging.hpp"
#include "quiver/fs/filesystem.hpp"

namespace quiver::fs
{
    namespace
    {
        enum class EntryKind
        {
            file,
            directory,
            symlink,
        };

        auto matches(const directory_entry& entry, EntryKind kind, std::error_code& ec) -> bool
        {
            switch (kind)
            {
                case EntryKind::file:
                    return !entry.is_symlink(ec) && entry.is_regular_file(ec);
                case EntryKind::directory:
                    return !entry.is_symlink(ec) && entry.is_directory(ec);
                case EntryKind::symlink:
                    return entry.is_symlink(ec);
            }
            return false;
        }

        auto list_entries(const u8path& dir, EntryKind kind, bool full_path) -> std::vector<u8path>
        {
            auto out = std::vector<u8path>();

            std::error_code ec;
            auto iter = directory_iterator(dir, ec);
            if (ec)
            {
                if (ec != std::errc::no_such_file_or_directory)
                {
                    LOG_WARNING << "Failed to read directory '" << dir.string()
                                << "': " << ec.message();
                }
                return out;
            }

            for (const auto end = directory_iterator(); iter != end; iter.increment(ec))
            {
                if (ec)
                {
                    LOG_WARNING << "Failed to read entry in '" << dir.string()
                                << "': " << ec.message();
                    break;
                }

                std::error_code entry_ec;
                if (matches(*iter, kind, entry_ec))
                {
                    out.push_back(full_path ? iter->path() : iter->path().filename());
                }
                else if (entry_ec)
                {
                    LOG_WARNING << "Failed to read metadata for '" << iter->path().string()
                                << "': " << entry_ec.message();
                }
            }
            if (ec)
            {
                LOG_WARNING << "Failed to read entry in '" << dir.string() << "': " << ec.message();
            }

            std::sort(out.begin(), out.end());
            return out;
        }
    }

    auto files(const u8path& dir) -> std::vector<u8path>
    {
        return list_entries(dir, EntryKind::file, false);
    }

    auto directories(const u8path& dir) -> std::vector<u8path>
    {
        return list_entries(dir, EntryKind::directory, false);
    }

    auto symlinks(const u8path& dir) -> std::vector<u8path>
    {
        return list_entries(dir, EntryKind::symlink, true);
    }

    void write_atomic(const u8path& path, const std::string& content)
    {
        create_directories(path.parent_path());

        auto tmp_path = path;
        tmp_path += ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw filesystem_error(
                    "Could not open file for writing",
                    tmp_path,
                    std::make_error_code(std::errc::io_error)
                );
            }
            out << content;
            out.close();
            if (!out)
            {
                throw filesystem_error(
                    "Could not write file",
                    tmp_path,
                    std::make_error_code(std::errc::io_error)
                );
            }
        }
        rename(tmp_path, path);
    }
}
