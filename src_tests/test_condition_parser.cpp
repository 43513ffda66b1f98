/**
 * @file test_condition_parser.cpp
 * @brief Tests for the condition language parser:
 *        - precedence of not/and/or and parentheses
 *        - boolean shorthand, `!=` sugar, number and string literals
 *        - syntax errors versus registry errors, with offsets
 *
 * © 2025 metacollapse contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "metacollapse/condition_parser.hpp"
#include "metacollapse/dimension_registry.hpp"

#include <variant>

using namespace metacollapse;

namespace {

DimensionRegistry make_registry() {
    return DimensionRegistry{{
        {"os", DimensionKind::String, {"win", "linux", "mac"}},
        {"bits", DimensionKind::Number, {"32", "64"}},
        boolean_dimension("debug"),
    }};
}

ConditionError::Kind error_kind(const ConditionParser& parser, std::string_view text) {
    try {
        (void)parser.parse(text);
    } catch (const ConditionError& err) {
        return err.kind();
    }
    FAIL("expected a ConditionError for: " << text);
    return ConditionError::Kind::Syntax;
}

std::size_t error_offset(const ConditionParser& parser, std::string_view text) {
    try {
        (void)parser.parse(text);
    } catch (const ConditionError& err) {
        return err.offset();
    }
    FAIL("expected a ConditionError for: " << text);
    return 0;
}

}  // namespace

TEST_CASE("Condition parser builds comparison trees", "[condition_parser]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};

    SECTION("string comparison") {
        const auto cond = parser.parse(R"(os == "win")");
        const auto* cmp = std::get_if<Compare>(&cond->node);
        REQUIRE(cmp != nullptr);
        REQUIRE(cmp->dimension == "os");
        REQUIRE(cmp->value == "win");
    }

    SECTION("number comparison keeps the literal text") {
        const auto cond = parser.parse("bits == 64");
        const auto* cmp = std::get_if<Compare>(&cond->node);
        REQUIRE(cmp != nullptr);
        REQUIRE(cmp->dimension == "bits");
        REQUIRE(cmp->value == "64");
    }

    SECTION("bare boolean is a comparison against true") {
        const auto cond = parser.parse("debug");
        const auto* cmp = std::get_if<Compare>(&cond->node);
        REQUIRE(cmp != nullptr);
        REQUIRE(cmp->dimension == "debug");
        REQUIRE(cmp->value == "true");
    }

    SECTION("!= is negated equality") {
        const auto cond = parser.parse(R"(os != "mac")");
        const auto* neg = std::get_if<Not>(&cond->node);
        REQUIRE(neg != nullptr);
        const auto* cmp = std::get_if<Compare>(&neg->operand->node);
        REQUIRE(cmp != nullptr);
        REQUIRE(cmp->value == "mac");
    }

    SECTION("true matches everything") {
        const auto cond = parser.parse("true");
        REQUIRE(std::holds_alternative<Always>(cond->node));
    }
}

TEST_CASE("Condition parser precedence", "[condition_parser]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};

    SECTION("and binds tighter than or") {
        const auto cond = parser.parse(R"(os == "win" or os == "linux" and debug)");
        const auto* top = std::get_if<Or>(&cond->node);
        REQUIRE(top != nullptr);
        REQUIRE(std::holds_alternative<Compare>(top->lhs->node));
        REQUIRE(std::holds_alternative<And>(top->rhs->node));
    }

    SECTION("not binds tighter than and") {
        const auto cond = parser.parse(R"(not debug and os == "mac")");
        const auto* top = std::get_if<And>(&cond->node);
        REQUIRE(top != nullptr);
        REQUIRE(std::holds_alternative<Not>(top->lhs->node));
    }

    SECTION("parentheses override precedence") {
        const auto cond = parser.parse(R"((os == "win" or os == "linux") and debug)");
        const auto* top = std::get_if<And>(&cond->node);
        REQUIRE(top != nullptr);
        REQUIRE(std::holds_alternative<Or>(top->lhs->node));
    }

    SECTION("operators are left associative") {
        const auto cond = parser.parse(R"(os == "win" or os == "linux" or os == "mac")");
        const auto* top = std::get_if<Or>(&cond->node);
        REQUIRE(top != nullptr);
        REQUIRE(std::holds_alternative<Or>(top->lhs->node));
        REQUIRE(std::holds_alternative<Compare>(top->rhs->node));
    }

    SECTION("same text gives the same tree") {
        const auto a = parser.parse(R"(not (os == "win" or debug))");
        const auto b = parser.parse(R"(not(os=="win" or debug))");
        REQUIRE(same_structure(*a, *b));
    }
}

TEST_CASE("Condition parser reports errors", "[condition_parser]") {
    const auto registry = make_registry();
    const ConditionParser parser{registry};

    SECTION("syntax errors") {
        REQUIRE(error_kind(parser, R"(os ==)") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, R"((os == "win")") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, R"(os == "win")") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, R"(os == "win" and)") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, R"(os == "win)") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, "bits == 6.") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, "debug debug") == ConditionError::Kind::Syntax);
        REQUIRE(error_kind(parser, "") == ConditionError::Kind::Syntax);
    }

    SECTION("single '=' is rejected where it stands") {
        REQUIRE(error_kind(parser, R"(os = "win")") == ConditionError::Kind::Syntax);
        REQUIRE(error_offset(parser, R"(os = "win")") == 3);
    }

    SECTION("unknown dimension") {
        REQUIRE(error_kind(parser, R"(arch == "arm")") == ConditionError::Kind::UnknownDimension);
        REQUIRE(error_offset(parser, R"(arch == "arm")") == 0);
    }

    SECTION("value outside the domain") {
        REQUIRE(error_kind(parser, R"(os == "beos")") == ConditionError::Kind::UnknownValue);
        REQUIRE(error_offset(parser, R"(os == "beos")") == 6);
        REQUIRE(error_kind(parser, "bits == 16") == ConditionError::Kind::UnknownValue);
    }

    SECTION("bare non-boolean dimension") {
        REQUIRE(error_kind(parser, "os") == ConditionError::Kind::NotBoolean);
    }

    SECTION("syntax errors win over registry errors") {
        const auto kind = error_kind(parser, R"(arch == "arm" and)");
        REQUIRE(kind == ConditionError::Kind::Syntax);
    }
}
