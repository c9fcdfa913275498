// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "quiver/core/error_handling.hpp"

using namespace quiver;

namespace
{
    auto half(int value) -> expected_t<int>
    {
        if (value % 2 != 0)
        {
            return make_unexpected("Odd value", quiver_error_code::internal_failure);
        }
        return value / 2;
    }

    auto quarter(int value) -> expected_t<int>
    {
        auto h = half(value);
        if (!h)
        {
            return forward_error(h);
        }
        return half(h.value());
    }

    TEST_CASE("quiver_error", "[quiver::core][quiver::core::error_handling]")
    {
        SECTION("Code and message")
        {
            const auto error = quiver_error("Bad cache", quiver_error_code::cache_io_failure);
            REQUIRE(std::string(error.what()) == "Bad cache");
            REQUIRE(error.error_code() == quiver_error_code::cache_io_failure);
            REQUIRE_FALSE(error.data().has_value());
            REQUIRE(error_code_name(error.error_code()) == "cache I/O failure");
        }

        SECTION("Data")
        {
            const auto error = quiver_error(
                std::string("Conflict"),
                quiver_error_code::conflicting_indexes,
                std::any(std::string("payload"))
            );
            REQUIRE(std::any_cast<std::string>(error.data()) == "payload");
        }
    }

    TEST_CASE("expected_t helpers", "[quiver::core][quiver::core::error_handling]")
    {
        REQUIRE(quarter(8).value() == 2);

        const auto odd = quarter(6);
        REQUIRE_FALSE(odd.has_value());
        REQUIRE(odd.error().error_code() == quiver_error_code::internal_failure);

        auto even = half(4);
        REQUIRE(extract(even) == 2);

        auto failed = half(3);
        REQUIRE_THROWS_AS(extract(failed), quiver_error);
        REQUIRE_THROWS_AS(extract(half(5)), quiver_error);
    }
}
