// Copyright (c) 2022, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "quiver/core/error_handling.hpp"
#include "quiver/core/logging.hpp"

namespace quiver
{
    auto error_code_name(quiver_error_code ec) -> std::string_view
    {
        switch (ec)
        {
            case quiver_error_code::unknown:
                return "unknown";
            case quiver_error_code::internal_failure:
                return "internal failure";
            case quiver_error_code::cache_record_not_found:
                return "cache record not found";
            case quiver_error_code::cache_record_corrupted:
                return "cache record corrupted";
            case quiver_error_code::cache_io_failure:
                return "cache I/O failure";
            case quiver_error_code::configuration_error:
                return "configuration error";
            case quiver_error_code::invalid_spec:
                return "invalid spec";
            case quiver_error_code::conflicting_indexes:
                return "conflicting indexes";
        }
        return "unknown";
    }

    quiver_error::quiver_error(const std::string& msg, quiver_error_code ec, std::any data)
        : std::runtime_error(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
        if (m_error_code == quiver_error_code::internal_failure)
        {
            logging::log_backtrace();
        }
    }

    auto quiver_error::error_code() const noexcept -> quiver_error_code
    {
        return m_error_code;
    }

    auto quiver_error::data() const noexcept -> const std::any&
    {
        return m_data;
    }

    auto make_unexpected(const std::string& msg, quiver_error_code ec)
        -> tl::unexpected<quiver_error>
    {
        return tl::unexpected<quiver_error>(quiver_error(msg, ec));
    }
}
