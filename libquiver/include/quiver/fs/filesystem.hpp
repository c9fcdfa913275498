// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_FS_FILESYSTEM_HPP
#define QUIVER_FS_FILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace quiver::fs
{
    using u8path = std::filesystem::path;

    using std::filesystem::directory_entry;
    using std::filesystem::directory_iterator;
    using std::filesystem::filesystem_error;

    using std::filesystem::absolute;
    using std::filesystem::create_directories;
    using std::filesystem::create_directory;
    using std::filesystem::create_directory_symlink;
    using std::filesystem::create_symlink;
    using std::filesystem::current_path;
    using std::filesystem::exists;
    using std::filesystem::is_directory;
    using std::filesystem::read_symlink;
    using std::filesystem::remove_all;
    using std::filesystem::rename;
    using std::filesystem::temp_directory_path;

    /**
     * Names of the regular files directly under the directory, sorted.
     *
     * A missing directory has no files. Other errors are logged and end the enumeration.
     */
    [[nodiscard]] auto files(const u8path& dir) -> std::vector<u8path>;

    /**
     * Names of the directories directly under the directory, sorted.
     *
     * Symbolic links are not followed.
     */
    [[nodiscard]] auto directories(const u8path& dir) -> std::vector<u8path>;

    /**
     * Full paths of the symbolic links directly under the directory, sorted.
     */
    [[nodiscard]] auto symlinks(const u8path& dir) -> std::vector<u8path>;

    /**
     * Write the content to a temporary file next to the destination, then move it in place.
     *
     * Parent directories are created as needed.
     */
    void write_atomic(const u8path& path, const std::string& content);
}

#endif
