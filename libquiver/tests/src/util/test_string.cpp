// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_all.hpp>

#include "quiver/util/string.hpp"

using namespace quiver::util;

namespace
{
    TEST_CASE("to_lower", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(to_lower('A') == 'a');
        REQUIRE(to_lower('-') == '-');
        REQUIRE(to_lower(std::string_view("Hello World")) == "hello world");
        REQUIRE(to_lower(std::string("SHA256")) == "sha256");
    }

    TEST_CASE("starts_with", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(starts_with("https://pypi.org", "https://"));
        REQUIRE(starts_with("https://pypi.org", 'h'));
        REQUIRE(starts_with("abc", ""));
        REQUIRE_FALSE(starts_with("", 'a'));
        REQUIRE_FALSE(starts_with("ab", "abc"));
    }

    TEST_CASE("ends_with", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(ends_with("foo.whl", ".whl"));
        REQUIRE(ends_with("foo/", '/'));
        REQUIRE_FALSE(ends_with("", '/'));
        REQUIRE_FALSE(ends_with("whl", ".whl"));
    }

    TEST_CASE("contains", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(contains("linux darwin", "darwin"));
        REQUIRE(contains("a:b", ':'));
        REQUIRE_FALSE(contains("linux", "win"));
    }

    TEST_CASE("remove_suffix", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(remove_suffix("foo.whl", ".whl") == "foo");
        REQUIRE(remove_suffix("foo.whl", ".tar") == "foo.whl");
        REQUIRE(remove_suffix("foo/", '/') == "foo");
    }

    TEST_CASE("strip", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(strip("  foo \n") == "foo");
        REQUIRE(lstrip("  foo ") == "foo ");
        REQUIRE(rstrip("  foo ") == "  foo");
        REQUIRE(strip("   ") == "");
        REQUIRE(rstrip("https://example.com///", '/') == "https://example.com");
        REQUIRE(lstrip("//host", "/") == "host");
        REQUIRE(strip("-_foo_-", "-_") == "foo");
    }

    TEST_CASE("split_once", "[quiver::util][quiver::util::string]")
    {
        {
            const auto [head, tail] = split_once("3.12", '.');
            REQUIRE(head == "3");
            REQUIRE(tail == "12");
        }
        {
            const auto [head, tail] = split_once("a.b.c", '.');
            REQUIRE(head == "a");
            REQUIRE(tail == "b.c");
        }
        {
            const auto [head, tail] = split_once("312", '.');
            REQUIRE(head == "312");
            REQUIRE_FALSE(tail.has_value());
        }
    }

    TEST_CASE("split", "[quiver::util][quiver::util::string]")
    {
        using list = std::vector<std::string>;

        REQUIRE(split("py2.py3", ".") == list{ "py2", "py3" });
        REQUIRE(split("a--b", "-") == list{ "a", "", "b" });
        REQUIRE(split("abc", "-") == list{ "abc" });
        REQUIRE(split("", "-") == list{ "" });
        REQUIRE(split("a-b-c", "-", 1) == list{ "a", "b-c" });
        REQUIRE(split("a::b", "::") == list{ "a", "b" });
    }

    TEST_CASE("join", "[quiver::util][quiver::util::string]")
    {
        REQUIRE(join(".", std::vector<std::string>{ "py2", "py3" }) == "py2.py3");
        REQUIRE(join(", ", std::vector<std::string>{ "a" }) == "a");
        REQUIRE(join(", ", std::vector<std::string>{}) == "");
    }
}
