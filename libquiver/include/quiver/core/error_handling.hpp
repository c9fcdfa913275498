// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CORE_ERROR_HANDLING_HPP
#define QUIVER_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace quiver
{
    enum class quiver_error_code
    {
        unknown,
        internal_failure,
        cache_record_not_found,
        cache_record_corrupted,
        cache_io_failure,
        configuration_error,
        invalid_spec,
        conflicting_indexes,
    };

    [[nodiscard]] auto error_code_name(quiver_error_code ec) -> std::string_view;

    /**
     * Error of the library, with a code and an optional structured payload.
     *
     * Creating an ``internal_failure`` dumps the log backtrace.
     */
    class quiver_error : public std::runtime_error
    {
    public:

        quiver_error(const std::string& msg, quiver_error_code ec, std::any data = {});

        [[nodiscard]] auto error_code() const noexcept -> quiver_error_code;
        [[nodiscard]] auto data() const noexcept -> const std::any&;

    private:

        quiver_error_code m_error_code;
        std::any m_data;
    };

    template <class T, class E = quiver_error>
    using expected_t = tl::expected<T, E>;

    [[nodiscard]] auto make_unexpected(const std::string& msg, quiver_error_code ec)
        -> tl::unexpected<quiver_error>;

    /** Propagate the error of a failed result into a result of another value type. */
    template <class T, class E>
    [[nodiscard]] auto forward_error(const tl::expected<T, E>& exp) -> tl::unexpected<E>
    {
        return tl::unexpected<E>(exp.error());
    }

    /** The value of a result, throwing its error if it has none. */
    template <class Expected>
    auto extract(Expected&& exp) -> decltype(std::forward<Expected>(exp).value())
    {
        if (!exp)
        {
            throw std::forward<Expected>(exp).error();
        }
        return std::forward<Expected>(exp).value();
    }
}

#endif
