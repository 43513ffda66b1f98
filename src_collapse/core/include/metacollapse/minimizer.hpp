#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "clause_list.hpp"
#include "dimension_registry.hpp"
#include "enumerator.hpp"
#include "evaluator.hpp"

namespace metacollapse {

/**
 * \brief Rewrites a clause list into a shorter one with identical outcomes on
 *        every point of its configuration space.
 *
 * The list is materialised into a truth table over the enumerated space and the
 * points are grouped by outcome. The largest group becomes the default (an absent
 * default stays absent when some points matched nothing originally). Every other
 * group is covered by conjunctions of `==`/`!=` literals, each grown from a seed
 * point by an exhaustive, deterministically ordered search over the literal
 * subsets; points owned by earlier groups are don't-cares because evaluation is
 * first-match-wins. The group order is searched as well when there are few
 * groups. The winner is re-checked point by point against the input and only
 * accepted when it has strictly fewer entries. Accepted output is minimised
 * again over its own, smaller space until nothing shrinks, so a second run over
 * the result finds nothing to do. A list whose clauses match no valid point is
 * kept as is.
 *
 * A minimizer holds no mutable state; one instance may serve any number of lists
 * concurrently as long as the registry outlives it.
 */
class Minimizer {
public:
    struct Options {
        Enumerator::Options enumeration{};
        /// Outcome groups up to this count have every emission order tried.
        std::size_t max_permutation_classes{4};
        /// Above this many literal combinations per seed the search turns greedy.
        std::size_t max_cube_candidates{4096};
    };

    enum class Status {
        Collapsed,
        Unchanged,
        ValidationFailed,
    };

    struct Result {
        Status status{Status::Unchanged};
        ClauseList clauses;
        std::size_t entries_before{0};
        std::size_t entries_after{0};
        ConfigurationSpace space;
        std::string message;
    };

    explicit Minimizer(const DimensionRegistry& registry);
    Minimizer(const DimensionRegistry& registry, Options options);

    /**
     * Minimise `original`. Lists without conditional entries come back unchanged.
     * Throws `EnumerationLimitError` when the space exceeds the enumeration guard.
     */
    [[nodiscard]] Result minimize(const ClauseList& original) const;

    /// Candidate list for `original` over `space`, not yet verified.
    [[nodiscard]] ClauseList synthesize(const ClauseList& original,
                                        const ConfigurationSpace& space) const;

    /**
     * Accepts `candidate` only if it agrees with `reference` on every point and has
     * strictly fewer entries. On disagreement the result carries `reference` and
     * `Status::ValidationFailed`.
     */
    [[nodiscard]] Result verify(const ClauseList& reference, ClauseList candidate,
                                const ConfigurationSpace& space) const;

    /// First point where the two lists disagree, if any.
    [[nodiscard]] static std::optional<ConfigurationPoint> first_difference(
        const ClauseList& a, const ClauseList& b, const ConfigurationSpace& space);

private:
    const DimensionRegistry& registry_;
    Options options_;
};

[[nodiscard]] std::string_view to_string(Minimizer::Status status) noexcept;

}  // namespace metacollapse
