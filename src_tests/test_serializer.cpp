/**
 * @file test_serializer.cpp
 * @brief Tests for rendering conditions and properties back to annotation text:
 *        - canonical literal forms per dimension kind
 *        - parenthesisation of nested connectives
 *        - parse(render(x)) gives x back
 */

#include <catch2/catch_test_macros.hpp>

#include "metacollapse/condition_parser.hpp"
#include "metacollapse/serializer.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace metacollapse;

namespace {

DimensionRegistry make_registry() {
    return DimensionRegistry{{
        {"os", DimensionKind::String, {"win", "linux", "mac"}},
        {"version", DimensionKind::String, {"OS X 10.10.5", R"(say "hi")"}},
        {"bits", DimensionKind::Number, {"32", "64"}},
        boolean_dimension("debug"),
    }};
}

}  // namespace

TEST_CASE("Serializer renders literals canonically", "[serializer]") {
    const auto registry = make_registry();
    const Serializer serializer{registry};

    SECTION("strings are quoted, numbers are bare") {
        REQUIRE(serializer.render(*make_compare("os", "win")) == R"(os == "win")");
        REQUIRE(serializer.render(*make_compare("bits", "64")) == "bits == 64");
    }

    SECTION("negated comparisons use !=") {
        REQUIRE(serializer.render(*make_not(make_compare("os", "mac"))) == R"(os != "mac")");
    }

    SECTION("booleans are bare") {
        REQUIRE(serializer.render(*make_compare("debug", "true")) == "debug");
        REQUIRE(serializer.render(*make_not(make_compare("debug", "true"))) == "not debug");
        REQUIRE(serializer.render(*make_compare("debug", "false")) == "not debug");
    }

    SECTION("quotes and backslashes are escaped") {
        REQUIRE(serializer.render(*make_compare("version", R"(say "hi")")) == R"(version == "say \"hi\"")");
    }

    SECTION("always") {
        REQUIRE(serializer.render(*make_true()) == "true");
    }
}

TEST_CASE("Serializer parenthesises nested terms", "[serializer]") {
    const auto registry = make_registry();
    const Serializer serializer{registry};

    const auto win = make_compare("os", "win");
    const auto linux_os = make_compare("os", "linux");
    const auto debug = make_compare("debug", "true");

    SECTION("comparisons next to other terms") {
        REQUIRE(serializer.render(*make_and(win, debug)) == R"((os == "win") and debug)");
        REQUIRE(serializer.render(*make_or(win, linux_os)) == R"((os == "win") or (os == "linux"))");
    }

    SECTION("or inside and") {
        REQUIRE(serializer.render(*make_and(make_or(win, linux_os), debug)) ==
                R"(((os == "win") or (os == "linux")) and debug)");
    }

    SECTION("and inside or needs no extra parentheses") {
        REQUIRE(serializer.render(*make_or(make_and(win, debug), linux_os)) ==
                R"((os == "win") and debug or (os == "linux"))");
    }

    SECTION("negated compound") {
        REQUIRE(serializer.render(*make_not(make_and(win, debug))) == R"(not ((os == "win") and debug))");
    }

    SECTION("long conjunctions stay flat") {
        const auto bits = make_compare("bits", "32");
        REQUIRE(serializer.render(*make_and(make_and(win, debug), bits)) ==
                R"((os == "win") and debug and (bits == 32))");
    }
}

TEST_CASE("Serializer output parses back to the same tree", "[serializer]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};
    const Serializer serializer{registry};

    const std::vector<std::string> texts{
        R"(os == "win")",
        R"(os != "win" and not debug)",
        R"((os == "win" or os == "linux") and bits == 64)",
        R"(not (debug or bits == 32))",
        R"(os == "mac" and debug or os == "linux")",
        R"(version == "OS X 10.10.5")",
        R"(version == "say \"hi\"")",
        "true",
    };
    for (const auto& text : texts) {
        const auto tree = parser.parse(text);
        const auto rendered = serializer.render(*tree);
        INFO(text << " -> " << rendered);
        REQUIRE(same_structure(*parser.parse(rendered), *tree));
    }
}

TEST_CASE("Serializer renders whole properties", "[serializer]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};
    const Serializer serializer{registry};
    const PropertyLayout layout{"  ", "    "};

    SECTION("clauses then default") {
        ClauseList list;
        list.clauses.push_back({parser.parse(R"(os == "win" and debug)"), "FAIL"});
        list.default_outcome = "PASS";
        REQUIRE(serializer.render_property("expected", list, layout) ==
                std::vector<std::string>{"  expected:", R"(    if (os == "win") and debug: FAIL)", "    PASS"});
    }

    SECTION("default only renders inline") {
        ClauseList list;
        list.default_outcome = "TIMEOUT";
        REQUIRE(serializer.render_property("expected", list, layout) ==
                std::vector<std::string>{"  expected: TIMEOUT"});
    }

    SECTION("clauses without default") {
        ClauseList list;
        list.clauses.push_back({parser.parse("bits == 32"), "CRASH"});
        REQUIRE(serializer.render_property("expected", list, layout) ==
                std::vector<std::string>{"  expected:", "    if bits == 32: CRASH"});
    }

    SECTION("empty list is a logic error") {
        REQUIRE_THROWS_AS(serializer.render_property("expected", ClauseList{}, layout), std::logic_error);
    }
}
