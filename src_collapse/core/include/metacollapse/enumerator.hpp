#pragma once

#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "clause_list.hpp"
#include "dimension_registry.hpp"
#include "evaluator.hpp"

namespace metacollapse {

/**
 * \brief Bounded configuration space of one clause list.
 *
 * `dimensions` lists the referenced dimensions in registry order; every point
 * assigns exactly those dimensions.
 */
struct ConfigurationSpace {
    std::vector<const Dimension*> dimensions;
    std::vector<ConfigurationPoint> points;
};

/// Raised when the cross product would exceed the configured guard.
class EnumerationLimitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Produces the configuration points a clause list is evaluated against.
 *
 * The space is the cross product of the referenced dimensions only. Registry
 * constraints restrict it to valid configurations: constraints that share a
 * dimension with the referenced set (directly or through other constraints) are
 * enumerated together with it, failing combinations are dropped and the rest is
 * projected back onto the referenced dimensions, keeping first-seen order.
 */
class Enumerator {
public:
    struct Options {
        std::size_t max_combinations{65536};
        bool apply_constraints{true};
    };

    explicit Enumerator(const DimensionRegistry& registry);
    Enumerator(const DimensionRegistry& registry, Options options);

    /// Throws `std::invalid_argument` for names missing from the registry.
    [[nodiscard]] ConfigurationSpace enumerate(const std::set<std::string>& referenced) const;

    [[nodiscard]] ConfigurationSpace enumerate(const ClauseList& list) const {
        return enumerate(list.referenced_dimensions());
    }

private:
    const DimensionRegistry& registry_;
    Options options_;
};

}  // namespace metacollapse
