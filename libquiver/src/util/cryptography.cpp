// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <openssl/evp.h>

#include "quiver/util/cryptography.hpp"

namespace quiver::util
{
    auto bytes_to_hex(const std::byte* first, const std::byte* last) -> std::string
    {
        constexpr std::string_view hex_chars = "0123456789abcdef";
        auto out = std::string();
        out.reserve(2 * static_cast<std::size_t>(last - first));
        for (; first != last; ++first)
        {
            const auto byte = static_cast<unsigned char>(*first);
            out.push_back(hex_chars[byte >> 4]);
            out.push_back(hex_chars[byte & 0x0F]);
        }
        return out;
    }

    void Sha256Hasher::ContextDeleter::operator()(::EVP_MD_CTX* ptr) const
    {
        ::EVP_MD_CTX_free(ptr);
    }

    Sha256Hasher::Sha256Hasher()
        : m_ctx(::EVP_MD_CTX_new())
    {
        if (m_ctx == nullptr)
        {
            throw std::runtime_error("Could not allocate OpenSSL digest context");
        }
        start();
    }

    void Sha256Hasher::start()
    {
        if (::EVP_DigestInit_ex(m_ctx.get(), ::EVP_sha256(), nullptr) != 1)
        {
            throw std::runtime_error("Could not initialize SHA-256 digest");
        }
    }

    void Sha256Hasher::update(std::string_view data)
    {
        if (::EVP_DigestUpdate(m_ctx.get(), data.data(), data.size()) != 1)
        {
            throw std::runtime_error("Could not update SHA-256 digest");
        }
    }

    auto Sha256Hasher::digest() -> bytes_array
    {
        auto out = bytes_array{};
        auto* bytes = reinterpret_cast<unsigned char*>(out.data());
        if (::EVP_DigestFinal_ex(m_ctx.get(), bytes, nullptr) != 1)
        {
            throw std::runtime_error("Could not finalize SHA-256 digest");
        }
        start();
        return out;
    }

    auto Sha256Hasher::hex_digest() -> std::string
    {
        const auto bytes = digest();
        return bytes_to_hex(bytes.data(), bytes.data() + bytes.size());
    }

    auto Sha256Hasher::str_hex_str(std::string_view data) -> std::string
    {
        start();
        update(data);
        return hex_digest();
    }
}
