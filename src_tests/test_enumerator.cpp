/**
 * @file test_enumerator.cpp
 * @brief Tests for configuration space enumeration:
 *        - cross product of referenced dimensions in a stable order
 *        - constraint filtering and projection
 *        - the enumeration guard
 */

#include <catch2/catch_test_macros.hpp>

#include "metacollapse/condition_parser.hpp"
#include "metacollapse/enumerator.hpp"

#include <algorithm>
#include <stdexcept>

using namespace metacollapse;

namespace {

std::vector<Dimension> small_dimensions() {
    return {
        {"os", DimensionKind::String, {"win", "linux", "mac"}},
        boolean_dimension("debug"),
        {"bits", DimensionKind::Number, {"32", "64"}},
    };
}

DimensionRegistry with_constraints(const std::vector<std::string>& texts) {
    const DimensionRegistry bare{small_dimensions()};
    const ConditionParser parser{bare};
    std::vector<ConditionPtr> constraints;
    for (const auto& text : texts) {
        constraints.push_back(parser.parse(text));
    }
    return DimensionRegistry{small_dimensions(), std::move(constraints)};
}

bool contains(const ConfigurationSpace& space, const std::string& os, const std::string& bits) {
    return std::any_of(space.points.begin(), space.points.end(), [&](const ConfigurationPoint& p) {
        return p.at("os") == os && p.at("bits") == bits;
    });
}

}  // namespace

TEST_CASE("Enumerator spans the referenced dimensions only", "[enumerator]") {
    const DimensionRegistry registry{small_dimensions()};
    const Enumerator enumerator{registry};

    SECTION("cross product, last dimension fastest") {
        const auto space = enumerator.enumerate({"os", "debug"});
        REQUIRE(space.dimensions.size() == 2);
        REQUIRE(space.dimensions[0]->name == "os");
        REQUIRE(space.dimensions[1]->name == "debug");
        REQUIRE(space.points.size() == 6);
        REQUIRE(space.points[0].at("os") == "win");
        REQUIRE(space.points[0].at("debug") == "true");
        REQUIRE(space.points[1].at("os") == "win");
        REQUIRE(space.points[1].at("debug") == "false");
        REQUIRE(space.points[5].at("os") == "mac");
        REQUIRE(space.points[0].find("bits") == nullptr);
    }

    SECTION("no referenced dimension gives one empty point") {
        const auto space = enumerator.enumerate(std::set<std::string>{});
        REQUIRE(space.dimensions.empty());
        REQUIRE(space.points.size() == 1);
        REQUIRE(space.points[0].values().empty());
    }

    SECTION("unknown dimension is rejected") {
        REQUIRE_THROWS_AS(enumerator.enumerate({"arch"}), std::invalid_argument);
    }

    SECTION("clause lists enumerate what they reference") {
        const ConditionParser parser{registry};
        ClauseList list;
        list.clauses.push_back({parser.parse("bits == 32 and debug"), "FAIL"});
        const auto space = enumerator.enumerate(list);
        REQUIRE(space.points.size() == 4);
    }
}

TEST_CASE("Enumerator applies constraints", "[enumerator]") {
    SECTION("invalid combinations are dropped") {
        const auto registry = with_constraints({R"(os != "mac" or bits == 64)"});
        const auto space = Enumerator{registry}.enumerate({"os", "bits"});
        REQUIRE(space.points.size() == 5);
        REQUIRE_FALSE(contains(space, "mac", "32"));
        REQUIRE(contains(space, "mac", "64"));
    }

    SECTION("constraints can be switched off") {
        const auto registry = with_constraints({R"(os != "mac" or bits == 64)"});
        Enumerator::Options options;
        options.apply_constraints = false;
        const auto space = Enumerator{registry, options}.enumerate({"os", "bits"});
        REQUIRE(space.points.size() == 6);
    }

    SECTION("connected dimensions restrict the projection") {
        // Only os is referenced, but mac needs 64 bits and 64 bits cannot be satisfied.
        const auto registry = with_constraints(
            {R"(os != "mac" or bits == 64)", "bits != 64 or debug", "bits != 64 or not debug"});
        const auto space = Enumerator{registry}.enumerate({"os"});
        REQUIRE(space.dimensions.size() == 1);
        REQUIRE(space.points.size() == 2);
        REQUIRE(space.points[0].find("bits") == nullptr);
    }

    SECTION("projection drops points no configuration reaches") {
        const auto registry = with_constraints({R"(os != "mac")"});
        const auto space = Enumerator{registry}.enumerate({"os"});
        REQUIRE(space.points.size() == 2);
        REQUIRE(space.points[0].at("os") == "win");
        REQUIRE(space.points[1].at("os") == "linux");
    }

    SECTION("unrelated constraints are ignored") {
        const auto registry = with_constraints({"bits != 32 or debug"});
        const auto space = Enumerator{registry}.enumerate({"os"});
        REQUIRE(space.points.size() == 3);
    }
}

TEST_CASE("Enumerator on the default platform matrix", "[enumerator]") {
    const auto registry = default_registry();
    const auto space = Enumerator{registry}.enumerate({"os", "bits"});
    REQUIRE(space.points.size() == 7);
    REQUIRE_FALSE(contains(space, "mac", "32"));
    REQUIRE(contains(space, "win", "32"));
    REQUIRE(contains(space, "android", "64"));
}

TEST_CASE("Enumerator guard", "[enumerator]") {
    const DimensionRegistry registry{small_dimensions()};
    Enumerator::Options options;
    options.max_combinations = 4;
    const Enumerator enumerator{registry, options};

    REQUIRE_NOTHROW(enumerator.enumerate({"debug", "bits"}));
    REQUIRE_THROWS_AS(enumerator.enumerate({"os", "debug"}), EnumerationLimitError);
}
