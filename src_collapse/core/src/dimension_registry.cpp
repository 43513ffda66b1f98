#include "metacollapse/dimension_registry.hpp"

#include "metacollapse/condition_parser.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

// Platform implications of the test configuration matrix. Every valid
// configuration satisfies all of them.
constexpr const char* kDefaultConstraints[] = {
    // mac
    R"(os != "mac" or version == "OS X 10.10.5")",
    R"(os != "mac" or processor == "x86_64")",
    R"(os != "mac" or bits == 64)",
    R"(os != "mac" or e10s)",
    R"(os != "mac" or not webrender)",
    // Windows 7
    R"(os != "win" or version != "6.1.7601" or e10s)",
    R"(os != "win" or version != "6.1.7601" or not webrender)",
    R"(os != "win" or version != "6.1.7601" or processor == "x86")",
    R"(os != "win" or version != "6.1.7601" or bits == 32)",
    // Windows 10
    R"(os != "win" or version != "10.0.15063" or e10s)",
    R"(os != "win" or version != "10.0.15063" or processor == "x86_64")",
    R"(os != "win" or version != "10.0.15063" or bits == 64)",
    R"(os != "win" or not webrender or version == "10.0.15063")",
    R"(os != "win" or version == "6.1.7601" or version == "10.0.15063")",
    // linux
    R"(os != "linux" or version == "Ubuntu 16.04")",
    R"(os != "linux" or processor != "x86_64" or bits == 64)",
    R"(os != "linux" or processor != "x86" or bits == 32)",
    R"(os != "linux" or processor != "x86" or not webrender)",
    R"(os != "linux" or not webrender or processor == "x86_64")",
    R"(os != "linux" or not webrender or e10s)",
    // android
    R"(os != "android" or not webrender)",
    R"(os != "android" or not e10s)",
};

}  // namespace

namespace metacollapse {

std::string_view to_string(DimensionKind kind) noexcept {
    switch (kind) {
        case DimensionKind::Boolean: return "bool";
        case DimensionKind::String:  return "string";
        case DimensionKind::Number:  return "number";
    }
    return "unknown";
}

std::optional<std::size_t> Dimension::index_of(std::string_view token) const {
    const auto it = std::find(values.begin(), values.end(), token);
    if (it == values.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(values.begin(), it));
}

Dimension boolean_dimension(std::string name) {
    return Dimension{std::move(name), DimensionKind::Boolean, {"true", "false"}};
}

DimensionRegistry::DimensionRegistry(std::vector<Dimension> dimensions,
                                     std::vector<ConditionPtr> constraints)
    : dimensions_{std::move(dimensions)}, constraints_{std::move(constraints)} {
    std::set<std::string> names;
    for (auto& dimension : dimensions_) {
        if (dimension.name.empty()) {
            throw std::invalid_argument("Dimension with empty name");
        }
        if (!names.insert(dimension.name).second) {
            throw std::invalid_argument("Duplicate dimension '" + dimension.name + "'");
        }
        if (dimension.kind == DimensionKind::Boolean) {
            dimension.values = {"true", "false"};
        }
        if (dimension.values.empty()) {
            throw std::invalid_argument("Dimension '" + dimension.name + "' has an empty domain");
        }
        std::set<std::string> seen;
        for (const auto& value : dimension.values) {
            if (!seen.insert(value).second) {
                throw std::invalid_argument("Dimension '" + dimension.name +
                                            "' lists value '" + value + "' twice");
            }
        }
    }

    for (const auto& constraint : constraints_) {
        if (!constraint) {
            throw std::invalid_argument("Null constraint");
        }
        for (const auto& name : referenced_dimensions(*constraint)) {
            if (names.count(name) == 0) {
                throw std::invalid_argument("Constraint references unknown dimension '" + name + "'");
            }
        }
    }
}

const Dimension* DimensionRegistry::find(std::string_view name) const {
    for (const auto& dimension : dimensions_) {
        if (dimension.name == name) {
            return &dimension;
        }
    }
    return nullptr;
}

std::optional<std::size_t> DimensionRegistry::position_of(std::string_view name) const {
    for (std::size_t i = 0; i < dimensions_.size(); ++i) {
        if (dimensions_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

DimensionRegistry default_registry() {
    std::vector<Dimension> dimensions{
        {"os", DimensionKind::String, {"win", "linux", "mac", "android"}},
        {"version", DimensionKind::String, {"6.1.7601", "10.0.15063", "OS X 10.10.5", "Ubuntu 16.04"}},
        {"processor", DimensionKind::String, {"x86", "x86_64"}},
        {"bits", DimensionKind::Number, {"32", "64"}},
        boolean_dimension("debug"),
        boolean_dimension("e10s"),
        boolean_dimension("webrender"),
    };

    // Constraints are parsed against the bare dimension set first.
    const DimensionRegistry bare{dimensions};
    const ConditionParser parser{bare};
    std::vector<ConditionPtr> constraints;
    for (const char* text : kDefaultConstraints) {
        constraints.push_back(parser.parse(text));
    }
    return DimensionRegistry{std::move(dimensions), std::move(constraints)};
}

}  // namespace metacollapse
