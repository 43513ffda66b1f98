#pragma once

#include <memory>
#include <set>
#include <string>
#include <variant>

namespace metacollapse {

struct Condition;

/// Conditions are immutable once built, so subtrees are shared freely.
using ConditionPtr = std::shared_ptr<const Condition>;

/// `dimension == value`. Boolean dimensions compare against "true"/"false".
struct Compare {
    std::string dimension;
    std::string value;
};

struct And {
    ConditionPtr lhs;
    ConditionPtr rhs;
};

struct Or {
    ConditionPtr lhs;
    ConditionPtr rhs;
};

struct Not {
    ConditionPtr operand;
};

/// Matches every configuration.
struct Always {};

/**
 * \brief Boolean condition over configuration dimensions.
 *
 * The node set is closed; consumers visit `node` with `std::visit` so that a new
 * shape cannot be added without every evaluator and renderer noticing.
 */
struct Condition {
    std::variant<Always, Compare, And, Or, Not> node;
};

[[nodiscard]] ConditionPtr make_true();
[[nodiscard]] ConditionPtr make_compare(std::string dimension, std::string value);
[[nodiscard]] ConditionPtr make_and(ConditionPtr lhs, ConditionPtr rhs);
[[nodiscard]] ConditionPtr make_or(ConditionPtr lhs, ConditionPtr rhs);
[[nodiscard]] ConditionPtr make_not(ConditionPtr operand);

/// Names of every dimension compared anywhere inside `condition`.
[[nodiscard]] std::set<std::string> referenced_dimensions(const Condition& condition);

/// Number of `Compare` leaves.
[[nodiscard]] std::size_t literal_count(const Condition& condition);

/// Structural equality; `a or b` and `b or a` are different trees.
[[nodiscard]] bool same_structure(const Condition& a, const Condition& b);

}  // namespace metacollapse
