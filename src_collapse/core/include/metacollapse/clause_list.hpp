#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "condition.hpp"

namespace metacollapse {

/// Result of evaluating a clause list; `std::nullopt` means no clause matched and
/// the list has no default.
using Outcome = std::optional<std::string>;

struct Clause {
    ConditionPtr condition;
    std::string outcome;
};

/**
 * \brief Ordered `condition: outcome` entries plus an optional default.
 *
 * Evaluation is first-match-wins; the default applies when nothing matches.
 */
struct ClauseList {
    std::vector<Clause> clauses;
    std::optional<std::string> default_outcome;

    /// Clauses plus the default line, i.e. the number of lines the list renders to.
    [[nodiscard]] std::size_t entry_count() const noexcept {
        return clauses.size() + (default_outcome ? 1 : 0);
    }

    [[nodiscard]] std::size_t literal_count() const;

    [[nodiscard]] std::set<std::string> referenced_dimensions() const;
};

/// Same clauses (structurally), same outcomes, same default.
[[nodiscard]] bool same_structure(const ClauseList& a, const ClauseList& b);

}  // namespace metacollapse
