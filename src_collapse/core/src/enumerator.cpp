#include "metacollapse/enumerator.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

// Constraints connected to `names`, growing `names` with every dimension they pull in.
std::vector<const metacollapse::Condition*> connected_constraints(
    const metacollapse::DimensionRegistry& registry, std::set<std::string>& names) {
    const auto& constraints = registry.constraints();
    std::vector<bool> taken(constraints.size(), false);
    std::vector<const metacollapse::Condition*> picked;

    bool grew = true;
    while (grew) {
        grew = false;
        for (std::size_t i = 0; i < constraints.size(); ++i) {
            if (taken[i]) {
                continue;
            }
            const auto dims = metacollapse::referenced_dimensions(*constraints[i]);
            const bool touches = std::any_of(dims.begin(), dims.end(),
                                             [&](const std::string& d) { return names.count(d) > 0; });
            if (!touches) {
                continue;
            }
            taken[i] = true;
            picked.push_back(constraints[i].get());
            for (const auto& d : dims) {
                if (names.insert(d).second) {
                    grew = true;
                }
            }
        }
    }

    // Keep registry order so evaluation order is stable.
    std::vector<const metacollapse::Condition*> ordered;
    for (const auto& constraint : constraints) {
        if (std::find(picked.begin(), picked.end(), constraint.get()) != picked.end()) {
            ordered.push_back(constraint.get());
        }
    }
    return ordered;
}

}  // namespace

namespace metacollapse {

Enumerator::Enumerator(const DimensionRegistry& registry) : Enumerator(registry, Options{}) {}

Enumerator::Enumerator(const DimensionRegistry& registry, Options options)
    : registry_{registry}, options_{options} {}

ConfigurationSpace Enumerator::enumerate(const std::set<std::string>& referenced) const {
    for (const auto& name : referenced) {
        if (!registry_.contains(name)) {
            throw std::invalid_argument("Cannot enumerate unknown dimension '" + name + "'");
        }
    }

    std::set<std::string> names = referenced;
    std::vector<const Condition*> constraints;
    if (options_.apply_constraints) {
        constraints = connected_constraints(registry_, names);
    }

    ConfigurationSpace space;
    std::vector<const Dimension*> dims;
    for (const auto& dimension : registry_.dimensions()) {
        if (names.count(dimension.name) > 0) {
            dims.push_back(&dimension);
            if (referenced.count(dimension.name) > 0) {
                space.dimensions.push_back(&dimension);
            }
        }
    }

    std::size_t combinations = 1;
    for (const auto* dimension : dims) {
        combinations *= dimension->values.size();
        if (combinations > options_.max_combinations) {
            throw EnumerationLimitError("Configuration space over " + std::to_string(dims.size()) +
                                        " dimensions exceeds the limit of " +
                                        std::to_string(options_.max_combinations) + " points");
        }
    }

    // Odometer over `dims`; the last dimension varies fastest.
    std::vector<std::size_t> digits(dims.size(), 0);
    std::set<ConfigurationPoint> seen;
    for (std::size_t n = 0; n < combinations; ++n) {
        ConfigurationPoint full;
        for (std::size_t i = 0; i < dims.size(); ++i) {
            full.assign(dims[i]->name, dims[i]->values[digits[i]]);
        }

        const bool valid = std::all_of(constraints.begin(), constraints.end(),
                                       [&](const Condition* c) { return evaluate(*c, full); });
        if (valid) {
            ConfigurationPoint projected;
            for (const auto* dimension : space.dimensions) {
                projected.assign(dimension->name, full.at(dimension->name));
            }
            if (seen.insert(projected).second) {
                space.points.push_back(std::move(projected));
            }
        }

        for (std::size_t i = dims.size(); i-- > 0;) {
            if (++digits[i] < dims[i]->values.size()) {
                break;
            }
            digits[i] = 0;
        }
    }

    return space;
}

}  // namespace metacollapse
