/**
 * @file test_evaluator.cpp
 * @brief Tests for condition and clause list evaluation:
 *        - boolean connectives over a configuration point
 *        - first-match-wins ordering and default handling
 *        - missing dimensions are reported, not guessed
 */

#include <catch2/catch_test_macros.hpp>

#include "metacollapse/condition_parser.hpp"
#include "metacollapse/evaluator.hpp"

#include <stdexcept>

using namespace metacollapse;

namespace {

DimensionRegistry make_registry() {
    return DimensionRegistry{{
        {"os", DimensionKind::String, {"win", "linux", "mac"}},
        boolean_dimension("debug"),
    }};
}

ConfigurationPoint point(const std::string& os, bool debug) {
    ConfigurationPoint p;
    p.assign("os", os);
    p.assign("debug", debug ? "true" : "false");
    return p;
}

}  // namespace

TEST_CASE("Conditions evaluate against a point", "[evaluator]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};

    SECTION("comparison and negation") {
        const auto cond = parser.parse(R"(os != "win")");
        REQUIRE_FALSE(evaluate(*cond, point("win", false)));
        REQUIRE(evaluate(*cond, point("mac", false)));
    }

    SECTION("connectives") {
        const auto cond = parser.parse(R"((os == "win" or os == "linux") and not debug)");
        REQUIRE(evaluate(*cond, point("win", false)));
        REQUIRE(evaluate(*cond, point("linux", false)));
        REQUIRE_FALSE(evaluate(*cond, point("linux", true)));
        REQUIRE_FALSE(evaluate(*cond, point("mac", false)));
    }

    SECTION("true ignores the point") {
        const auto cond = parser.parse("true");
        REQUIRE(evaluate(*cond, ConfigurationPoint{}));
    }

    SECTION("a dimension missing from the point is a logic error") {
        const auto cond = parser.parse("debug");
        ConfigurationPoint partial;
        partial.assign("os", "win");
        REQUIRE_THROWS_AS(evaluate(*cond, partial), std::logic_error);
    }
}

TEST_CASE("Clause lists evaluate first match wins", "[evaluator]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};

    ClauseList list;
    list.clauses.push_back({parser.parse(R"(os == "win")"), "FAIL"});
    list.clauses.push_back({parser.parse("debug"), "CRASH"});

    SECTION("earlier clause shadows later ones") {
        REQUIRE(evaluate(list, point("win", true)) == Outcome{"FAIL"});
        REQUIRE(evaluate(list, point("mac", true)) == Outcome{"CRASH"});
    }

    SECTION("no match and no default is the absent outcome") {
        REQUIRE_FALSE(evaluate(list, point("linux", false)).has_value());
    }

    SECTION("default applies when nothing matches") {
        list.default_outcome = "PASS";
        REQUIRE(evaluate(list, point("linux", false)) == Outcome{"PASS"});
        REQUIRE(evaluate(list, point("win", false)) == Outcome{"FAIL"});
    }
}

TEST_CASE("Configuration points print and compare by value", "[evaluator]") {
    const auto a = point("win", true);
    const auto b = point("win", true);
    REQUIRE(a == b);
    REQUIRE(a.to_string() == "{debug=true, os=win}");
    REQUIRE(a.find("arch") == nullptr);
    REQUIRE(*a.find("os") == "win");
}
