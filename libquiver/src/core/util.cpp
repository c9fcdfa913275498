// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <unistd.h>

#include "quiver/core/logging.hpp"
#include "quiver/core/util.hpp"

namespace quiver
{
    TemporaryDirectory::TemporaryDirectory(std::string_view prefix)
    {
        auto name = (fs::temp_directory_path() / fmt::format("{}-XXXXXX", prefix)).string();
        if (::mkdtemp(name.data()) == nullptr)
        {
            throw fs::filesystem_error(
                "Could not create temporary directory",
                name,
                std::error_code(errno, std::generic_category())
            );
        }
        m_path = name;
        LOG_TRACE << "Created temporary directory " << m_path.string();
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        if (m_keep)
        {
            LOG_INFO << "Keeping temporary directory " << m_path.string();
            return;
        }
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_WARNING << "Could not remove temporary directory " << m_path.string() << ": "
                        << ec.message();
        }
    }

    auto TemporaryDirectory::path() const noexcept -> const fs::u8path&
    {
        return m_path;
    }

    void TemporaryDirectory::keep() noexcept
    {
        m_keep = true;
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        if (const char* value = std::getenv(key.c_str()); value != nullptr)
        {
            return std::string(value);
        }
        return std::nullopt;
    }

    void set_env(const std::string& key, const std::string& value)
    {
        if (::setenv(key.c_str(), value.c_str(), 1) != 0)
        {
            throw std::system_error(errno, std::generic_category(), "setenv " + key);
        }
    }

    void unset_env(const std::string& key)
    {
        if (::unsetenv(key.c_str()) != 0)
        {
            throw std::system_error(errno, std::generic_category(), "unsetenv " + key);
        }
    }
}
