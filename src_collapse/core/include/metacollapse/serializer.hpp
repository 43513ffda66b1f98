#pragma once

#include <string>
#include <vector>

#include "clause_list.hpp"
#include "condition.hpp"
#include "dimension_registry.hpp"

namespace metacollapse {

/// Indentation of a property's key line and of its clause lines.
struct PropertyLayout {
    std::string key_indent;
    std::string body_indent{"  "};
};

/**
 * \brief Renders clause lists back into the annotation dialect.
 *
 * Output is canonical: boolean dimensions bare (`debug`, `not debug`), strings
 * quoted, numbers bare, negated comparisons as `!=`, and comparisons wrapped in
 * parentheses when they sit next to other terms:
 * \code{.txt}
 * expected:
 *   if (os == "win") and not debug: FAIL
 *   if os == "linux": PASS
 *   TIMEOUT
 * \endcode
 * Rendering text produced by `ConditionParser` yields the same tree again.
 */
class Serializer {
public:
    explicit Serializer(const DimensionRegistry& registry);

    [[nodiscard]] std::string render(const Condition& condition) const;

    /// `if <condition>: <outcome>`
    [[nodiscard]] std::string render_clause(const Clause& clause) const;

    /**
     * Lines (without terminators) for `key` holding `list`. A list with only a
     * default renders inline (`key: value`). Throws `std::logic_error` for a list
     * with neither clauses nor default.
     */
    [[nodiscard]] std::vector<std::string> render_property(const std::string& key, const ClauseList& list,
                                                           const PropertyLayout& layout) const;

private:
    enum class Context { Top, AndOperand, OrOperand, NotOperand };

    [[nodiscard]] std::string render(const Condition& condition, Context context) const;
    [[nodiscard]] std::string render_comparison(const Compare& compare, bool negated, Context context) const;
    [[nodiscard]] std::string render_literal(const std::string& dimension, const std::string& value) const;

    const DimensionRegistry& registry_;
};

}  // namespace metacollapse
