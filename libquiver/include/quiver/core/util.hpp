// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CORE_UTIL_HPP
#define QUIVER_CORE_UTIL_HPP

#include <optional>
#include <string>
#include <string_view>

#include "quiver/fs/filesystem.hpp"

namespace quiver
{
    /**
     * A uniquely named directory under the system temporary directory.
     *
     * The directory and its content are removed on destruction, unless ``keep`` was called.
     */
    class TemporaryDirectory
    {
    public:

        explicit TemporaryDirectory(std::string_view prefix = "quiver");
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        auto operator=(const TemporaryDirectory&) -> TemporaryDirectory& = delete;

        [[nodiscard]] auto path() const noexcept -> const fs::u8path&;

        /** Leave the directory on disk, to inspect a failing test cache. */
        void keep() noexcept;

    private:

        fs::u8path m_path;
        bool m_keep = false;
    };

    /** The value of the environment variable, nothing if it is not set. */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    void set_env(const std::string& key, const std::string& value);
    void unset_env(const std::string& key);
}

#endif
