// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <unordered_set>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

#include "quiver/specs/package_name.hpp"

using namespace quiver::specs;

namespace
{
    TEST_CASE("PackageName", "[quiver::specs][quiver::specs::PackageName]")
    {
        using namespace package_name_literals;

        SECTION("Normalization")
        {
            REQUIRE(PackageName::parse("foo").value().str() == "foo");
            REQUIRE(PackageName::parse("Foo").value().str() == "foo");
            REQUIRE(PackageName::parse("Foo.Bar_baz").value().str() == "foo-bar-baz");
            REQUIRE(PackageName::parse("foo__-.bar").value().str() == "foo-bar");
            REQUIRE(PackageName::parse("  numpy ").value().str() == "numpy");
        }

        SECTION("Equivalent spellings")
        {
            REQUIRE("Foo.Bar"_pn == "foo_bar"_pn);
            REQUIRE("foo-bar"_pn == "FOO---BAR"_pn);
            REQUIRE("foo"_pn != "foo-bar"_pn);
            REQUIRE("bar"_pn < "foo"_pn);

            auto names = std::unordered_set<PackageName>{ "Foo_Bar"_pn, "foo.bar"_pn };
            REQUIRE(names.size() == 1);
        }

        SECTION("Dist info name")
        {
            REQUIRE("foo-bar"_pn.as_dist_info_name() == "foo_bar");
            REQUIRE("numpy"_pn.as_dist_info_name() == "numpy");
        }

        SECTION("Format")
        {
            REQUIRE(fmt::format("{}", "Foo.Bar"_pn) == "foo-bar");
        }

        SECTION("Invalid names")
        {
            REQUIRE_FALSE(PackageName::parse("").has_value());
            REQUIRE_FALSE(PackageName::parse("   ").has_value());
            REQUIRE_FALSE(PackageName::parse("-foo").has_value());
            REQUIRE_FALSE(PackageName::parse("foo_").has_value());
            REQUIRE_FALSE(PackageName::parse("foo bar").has_value());
            REQUIRE_FALSE(PackageName::parse("foo/bar").has_value());
        }
    }
}
