// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_UTIL_CRYPTOGRAPHY_HPP
#define QUIVER_UTIL_CRYPTOGRAPHY_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

using EVP_MD_CTX = struct evp_md_ctx_st;  // OpenSSL impl

namespace quiver::util
{
    /** Lowercase hexadecimal encoding of a byte range. */
    [[nodiscard]] auto bytes_to_hex(const std::byte* first, const std::byte* last) -> std::string;

    /**
     * Incremental SHA-256 over an OpenSSL digest context.
     *
     * Data is fed with ``update`` and the digest is read once with ``hex_digest``, after
     * which the hasher is ready for a new message.
     * OpenSSL failures are reported as ``std::runtime_error``.
     */
    class Sha256Hasher
    {
    public:

        static constexpr std::size_t bytes_size = 32;
        static constexpr std::size_t hex_size = 2 * bytes_size;

        using bytes_array = std::array<std::byte, bytes_size>;

        Sha256Hasher();

        void update(std::string_view data);

        [[nodiscard]] auto digest() -> bytes_array;
        [[nodiscard]] auto hex_digest() -> std::string;

        /** Hash a whole string, discarding any pending data. */
        [[nodiscard]] auto str_hex_str(std::string_view data) -> std::string;

    private:

        struct ContextDeleter
        {
            void operator()(::EVP_MD_CTX* ptr) const;
        };

        std::unique_ptr<::EVP_MD_CTX, ContextDeleter> m_ctx;

        void start();
    };
}
#endif
