// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string_view>

#include <catch2/catch_all.hpp>

#include "quiver/core/logging.hpp"

using namespace quiver;

namespace
{
    TEST_CASE("log_level", "[quiver::core][quiver::core::logging]")
    {
        REQUIRE(std::string_view(name_of(log_level::warn)) == "warning");
        REQUIRE(std::string_view(name_of(log_level::err)) == "error");

        REQUIRE(log_level_parse("warning") == log_level::warn);
        REQUIRE(log_level_parse("warn") == log_level::warn);
        REQUIRE(log_level_parse(" Error ") == log_level::err);
        REQUIRE(log_level_parse("err") == log_level::err);
        REQUIRE(log_level_parse("OFF") == log_level::off);
        REQUIRE_FALSE(log_level_parse("verbose").has_value());
        REQUIRE_FALSE(log_level_parse("").has_value());
    }

    TEST_CASE("Logging parameters", "[quiver::core][quiver::core::logging]")
    {
        const auto previous = logging::get_logging_params();

        SECTION("Set level")
        {
            const auto level = logging::get_log_level();
            REQUIRE(logging::set_log_level(log_level::critical) == level);
            REQUIRE(logging::get_log_level() == log_level::critical);
            REQUIRE(logging::set_log_level(level) == log_level::critical);
        }

        SECTION("Set parameters")
        {
            auto params = LoggingParams();
            params.logging_level = log_level::info;
            params.log_backtrace = 8;
            params.log_pattern = "%v";
            logging::set_logging_params(params);
            REQUIRE(logging::get_logging_params() == params);

            // Records below the level are kept in the backtrace
            LOG_DEBUG << "debug record";
            LOG_INFO << "info record";
            logging::log_backtrace();
        }

        logging::set_logging_params(previous);
        REQUIRE(logging::get_logging_params() == previous);
    }
}
