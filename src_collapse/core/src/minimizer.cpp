#include "metacollapse/minimizer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using metacollapse::ClauseList;
using metacollapse::ConfigurationSpace;
using metacollapse::Outcome;

enum class LiteralKind : std::uint8_t { Any, Equal, NotEqual };

struct Literal {
    LiteralKind kind{LiteralKind::Any};
    std::size_t value{0};
};

/// One conjunction; entry `d` constrains space dimension `d`.
using Cube = std::vector<Literal>;

struct PlannedClause {
    Cube cube;
    std::string outcome;
};

struct Plan {
    std::vector<PlannedClause> clauses;
    Outcome default_outcome;
};

struct OutcomeClass {
    std::string outcome;
    std::vector<std::size_t> points;
};

/// Index view of the space: value positions instead of strings.
struct Table {
    std::vector<std::vector<std::size_t>> coords;
    std::vector<std::size_t> domain;
    std::vector<Outcome> outcomes;
};

Table build_table(const ClauseList& list, const ConfigurationSpace& space) {
    Table table;
    table.domain.reserve(space.dimensions.size());
    for (const auto* dimension : space.dimensions) {
        table.domain.push_back(dimension->values.size());
    }
    table.coords.reserve(space.points.size());
    table.outcomes.reserve(space.points.size());
    for (const auto& point : space.points) {
        std::vector<std::size_t> coord;
        coord.reserve(space.dimensions.size());
        for (const auto* dimension : space.dimensions) {
            coord.push_back(*dimension->index_of(point.at(dimension->name)));
        }
        table.coords.push_back(std::move(coord));
        table.outcomes.push_back(metacollapse::evaluate(list, point));
    }
    return table;
}

bool matches(const Cube& cube, const std::vector<std::size_t>& coord) {
    for (std::size_t d = 0; d < cube.size(); ++d) {
        switch (cube[d].kind) {
            case LiteralKind::Any:
                break;
            case LiteralKind::Equal:
                if (coord[d] != cube[d].value) return false;
                break;
            case LiteralKind::NotEqual:
                if (coord[d] == cube[d].value) return false;
                break;
        }
    }
    return true;
}

std::size_t literals_of(const Cube& cube) {
    return static_cast<std::size_t>(std::count_if(
        cube.begin(), cube.end(), [](const Literal& l) { return l.kind != LiteralKind::Any; }));
}

std::size_t negations_of(const Cube& cube) {
    return static_cast<std::size_t>(std::count_if(
        cube.begin(), cube.end(), [](const Literal& l) { return l.kind == LiteralKind::NotEqual; }));
}

/// (entries, literals, negations): the order in which plans are compared.
std::tuple<std::size_t, std::size_t, std::size_t> cost_of(const Plan& plan) {
    std::size_t literals = 0;
    std::size_t negations = 0;
    for (const auto& clause : plan.clauses) {
        literals += literals_of(clause.cube);
        negations += negations_of(clause.cube);
    }
    return {plan.clauses.size() + (plan.default_outcome ? 1 : 0), literals, negations};
}

Outcome plan_outcome(const Plan& plan, const std::vector<std::size_t>& coord) {
    for (const auto& clause : plan.clauses) {
        if (matches(clause.cube, coord)) {
            return clause.outcome;
        }
    }
    return plan.default_outcome;
}

bool plan_agrees(const Plan& plan, const Table& table) {
    for (std::size_t p = 0; p < table.coords.size(); ++p) {
        if (plan_outcome(plan, table.coords[p]) != table.outcomes[p]) {
            return false;
        }
    }
    return true;
}

/**
 * Picks the outcome that needs no clause. When the list had no default and some
 * points matched nothing, those points can only keep their meaning through an
 * absent default. Otherwise the largest group wins; ties go to the previous
 * default, then to the smallest token (map order).
 */
Outcome choose_default(const std::map<Outcome, std::vector<std::size_t>>& groups,
                       const Outcome& previous_default) {
    if (!previous_default && groups.count(std::nullopt) > 0) {
        return std::nullopt;
    }
    const std::pair<const Outcome, std::vector<std::size_t>>* best = nullptr;
    for (const auto& entry : groups) {
        if (best == nullptr || entry.second.size() > best->second.size() ||
            (entry.second.size() == best->second.size() && entry.first == previous_default)) {
            best = &entry;
        }
    }
    return best == nullptr ? Outcome{} : best->first;
}

class PlanBuilder {
public:
    PlanBuilder(const Table& table, std::size_t max_candidates)
        : table_{table}, max_candidates_{max_candidates} {}

    Plan build(const std::vector<const OutcomeClass*>& order, const Outcome& default_outcome) const {
        Plan plan;
        plan.default_outcome = default_outcome;
        std::vector<char> claimed(table_.coords.size(), 0);

        for (const auto* group : order) {
            std::vector<char> covered(table_.coords.size(), 0);
            for (const auto seed : group->points) {
                if (covered[seed]) {
                    continue;
                }
                Cube cube = best_cube(seed, *group, claimed, covered);
                for (const auto q : group->points) {
                    if (!covered[q] && matches(cube, table_.coords[q])) {
                        covered[q] = 1;
                    }
                }
                plan.clauses.push_back({std::move(cube), group->outcome});
            }
            for (const auto q : group->points) {
                claimed[q] = 1;
            }
        }
        return plan;
    }

private:
    // A cube may only reach points of its own group or points an earlier clause
    // already decides.
    bool admissible(const Cube& cube, const OutcomeClass& group, const std::vector<char>& claimed) const {
        for (std::size_t q = 0; q < table_.coords.size(); ++q) {
            if (claimed[q] || !matches(cube, table_.coords[q])) {
                continue;
            }
            if (table_.outcomes[q] != group.outcome) {
                return false;
            }
        }
        return true;
    }

    std::size_t gain(const Cube& cube, const OutcomeClass& group, const std::vector<char>& covered) const {
        std::size_t count = 0;
        for (const auto q : group.points) {
            if (!covered[q] && matches(cube, table_.coords[q])) {
                ++count;
            }
        }
        return count;
    }

    Cube best_cube(std::size_t seed, const OutcomeClass& group, const std::vector<char>& claimed,
                   const std::vector<char>& covered) const {
        const auto& coord = table_.coords[seed];
        const std::size_t dims = coord.size();

        // Per dimension: no literal, `== seed value`, and `!= v` for the other
        // values when the domain has three or more of them.
        std::vector<std::vector<Literal>> choices(dims);
        std::size_t total = 1;
        for (std::size_t d = 0; d < dims; ++d) {
            choices[d].push_back({LiteralKind::Any, 0});
            choices[d].push_back({LiteralKind::Equal, coord[d]});
            if (table_.domain[d] >= 3) {
                for (std::size_t v = 0; v < table_.domain[d]; ++v) {
                    if (v != coord[d]) {
                        choices[d].push_back({LiteralKind::NotEqual, v});
                    }
                }
            }
            total = total > max_candidates_ ? total : total * choices[d].size();
        }

        if (total > max_candidates_) {
            return greedy_cube(coord, group, claimed);
        }

        Cube best;
        std::tuple<std::size_t, std::size_t, std::size_t> best_key{};
        bool found = false;
        std::vector<std::size_t> digits(dims, 0);
        for (std::size_t n = 0; n < total; ++n) {
            Cube cube(dims);
            for (std::size_t d = 0; d < dims; ++d) {
                cube[d] = choices[d][digits[d]];
            }
            if (admissible(cube, group, claimed)) {
                // Larger gain first, then fewer literals, then fewer negations.
                const auto g = gain(cube, group, covered);
                const std::tuple<std::size_t, std::size_t, std::size_t> key{
                    ~g, literals_of(cube), negations_of(cube)};
                if (!found || key < best_key) {
                    best = std::move(cube);
                    best_key = key;
                    found = true;
                }
            }
            for (std::size_t d = dims; d-- > 0;) {
                if (++digits[d] < choices[d].size()) {
                    break;
                }
                digits[d] = 0;
            }
        }

        // The full point cube is always admissible, so something was found.
        return found ? best : greedy_cube(coord, group, claimed);
    }

    Cube greedy_cube(const std::vector<std::size_t>& coord, const OutcomeClass& group,
                     const std::vector<char>& claimed) const {
        Cube cube(coord.size());
        for (std::size_t d = 0; d < coord.size(); ++d) {
            cube[d] = {LiteralKind::Equal, coord[d]};
        }
        for (std::size_t d = 0; d < coord.size(); ++d) {
            const Literal saved = cube[d];
            cube[d] = {LiteralKind::Any, 0};
            if (!admissible(cube, group, claimed)) {
                cube[d] = saved;
            }
        }
        return cube;
    }

    const Table& table_;
    std::size_t max_candidates_;
};

/// Drops whole clauses, then single literals, while the plan keeps agreeing.
void prune(Plan& plan, const Table& table) {
    for (std::size_t i = plan.clauses.size(); i-- > 0;) {
        PlannedClause removed = std::move(plan.clauses[i]);
        plan.clauses.erase(plan.clauses.begin() + static_cast<std::ptrdiff_t>(i));
        if (!plan_agrees(plan, table)) {
            plan.clauses.insert(plan.clauses.begin() + static_cast<std::ptrdiff_t>(i), std::move(removed));
        }
    }
    for (auto& clause : plan.clauses) {
        for (auto& literal : clause.cube) {
            if (literal.kind == LiteralKind::Any) {
                continue;
            }
            const Literal saved = literal;
            literal = {LiteralKind::Any, 0};
            if (!plan_agrees(plan, table)) {
                literal = saved;
            }
        }
    }
}

metacollapse::ConditionPtr cube_to_condition(const Cube& cube, const ConfigurationSpace& space) {
    metacollapse::ConditionPtr result;
    for (std::size_t d = 0; d < cube.size(); ++d) {
        if (cube[d].kind == LiteralKind::Any) {
            continue;
        }
        const auto& dimension = *space.dimensions[d];
        metacollapse::ConditionPtr literal;
        if (dimension.kind == metacollapse::DimensionKind::Boolean) {
            // Boolean literals are canonically `name` or `not name`.
            const bool wants_true = (dimension.values[cube[d].value] == "true") ==
                                    (cube[d].kind == LiteralKind::Equal);
            literal = metacollapse::make_compare(dimension.name, "true");
            if (!wants_true) {
                literal = metacollapse::make_not(std::move(literal));
            }
        } else {
            literal = metacollapse::make_compare(dimension.name, dimension.values[cube[d].value]);
            if (cube[d].kind == LiteralKind::NotEqual) {
                literal = metacollapse::make_not(std::move(literal));
            }
        }
        result = result ? metacollapse::make_and(std::move(result), std::move(literal)) : std::move(literal);
    }
    return result ? result : metacollapse::make_true();
}

std::string describe(const Outcome& outcome) {
    return outcome ? *outcome : std::string("<no match>");
}

}  // namespace

namespace metacollapse {

std::string_view to_string(Minimizer::Status status) noexcept {
    switch (status) {
        case Minimizer::Status::Collapsed:        return "collapsed";
        case Minimizer::Status::Unchanged:        return "unchanged";
        case Minimizer::Status::ValidationFailed: return "validation-failed";
    }
    return "unknown";
}

Minimizer::Minimizer(const DimensionRegistry& registry) : Minimizer(registry, Options{}) {}

Minimizer::Minimizer(const DimensionRegistry& registry, Options options)
    : registry_{registry}, options_{options} {}

ClauseList Minimizer::synthesize(const ClauseList& original, const ConfigurationSpace& space) const {
    const Table table = build_table(original, space);

    std::map<Outcome, std::vector<std::size_t>> groups;
    for (std::size_t p = 0; p < table.outcomes.size(); ++p) {
        groups[table.outcomes[p]].push_back(p);
    }
    const Outcome default_outcome = choose_default(groups, original.default_outcome);

    std::vector<OutcomeClass> classes;
    for (auto& [outcome, points] : groups) {
        if (outcome == default_outcome) {
            continue;
        }
        // Only the default can be "no match"; see choose_default().
        classes.push_back({*outcome, points});
    }

    std::vector<const OutcomeClass*> order;
    order.reserve(classes.size());
    for (const auto& group : classes) {
        order.push_back(&group);
    }

    const PlanBuilder builder{table, options_.max_cube_candidates};
    Plan best;
    bool have_best = false;
    auto consider = [&](const std::vector<const OutcomeClass*>& candidate_order) {
        Plan plan = builder.build(candidate_order, default_outcome);
        prune(plan, table);
        if (!have_best || cost_of(plan) < cost_of(best)) {
            best = std::move(plan);
            have_best = true;
        }
    };

    if (classes.size() <= options_.max_permutation_classes) {
        // `order` starts sorted by address, which follows token order.
        do {
            consider(order);
        } while (std::next_permutation(order.begin(), order.end()));
    } else {
        std::stable_sort(order.begin(), order.end(), [](const OutcomeClass* a, const OutcomeClass* b) {
            return a->points.size() < b->points.size();
        });
        consider(order);
    }

    ClauseList result;
    result.default_outcome = best.default_outcome;
    for (const auto& clause : best.clauses) {
        result.clauses.push_back({cube_to_condition(clause.cube, space), clause.outcome});
    }
    return result;
}

std::optional<ConfigurationPoint> Minimizer::first_difference(const ClauseList& a, const ClauseList& b,
                                                              const ConfigurationSpace& space) {
    for (const auto& point : space.points) {
        if (evaluate(a, point) != evaluate(b, point)) {
            return point;
        }
    }
    return std::nullopt;
}

Minimizer::Result Minimizer::verify(const ClauseList& reference, ClauseList candidate,
                                    const ConfigurationSpace& space) const {
    Result result;
    result.entries_before = reference.entry_count();

    if (const auto diff = first_difference(reference, candidate, space)) {
        result.status = Status::ValidationFailed;
        result.clauses = reference;
        result.entries_after = reference.entry_count();
        result.message = "candidate disagrees at " + diff->to_string() + ": expected " +
                         describe(evaluate(reference, *diff)) + ", got " +
                         describe(evaluate(candidate, *diff));
        return result;
    }

    if (candidate.entry_count() == 0) {
        // A key needs at least one entry to be written back.
        result.status = Status::Unchanged;
        result.clauses = reference;
        result.message = "no clause matches a valid configuration";
    } else if (candidate.entry_count() < reference.entry_count()) {
        result.status = Status::Collapsed;
        result.clauses = std::move(candidate);
    } else {
        result.status = Status::Unchanged;
        result.clauses = reference;
    }
    result.entries_after = result.clauses.entry_count();
    return result;
}

Minimizer::Result Minimizer::minimize(const ClauseList& original) const {
    Result result;
    result.clauses = original;
    result.entries_before = original.entry_count();
    result.entries_after = result.entries_before;

    if (original.clauses.empty()) {
        result.message = "no conditional entries";
        return result;
    }

    const Enumerator enumerator{registry_, options_.enumeration};
    result.space = enumerator.enumerate(original);
    if (result.space.points.empty()) {
        result.message = "no valid configuration";
        return result;
    }

    // Each pass works over the space of the list it rewrites, so the accepted
    // output minimises to itself. Entry counts strictly drop, so this ends.
    ClauseList current = original;
    bool changed = false;
    std::string unchanged_note;
    while (true) {
        const ConfigurationSpace space = changed ? enumerator.enumerate(current) : result.space;
        auto step = verify(current, synthesize(current, space), space);
        if (step.status == Status::ValidationFailed) {
            result.status = Status::ValidationFailed;
            result.message = std::move(step.message);
            return result;
        }
        if (step.status == Status::Unchanged) {
            unchanged_note = std::move(step.message);
            break;
        }
        current = std::move(step.clauses);
        changed = true;
    }

    if (!changed) {
        result.message = unchanged_note.empty() ? std::string("already minimal") : std::move(unchanged_note);
        return result;
    }

    // Passes chain; check the end result against the input once more.
    if (const auto diff = first_difference(original, current, result.space)) {
        result.status = Status::ValidationFailed;
        result.message = "collapsed list disagrees at " + diff->to_string();
        return result;
    }

    result.status = Status::Collapsed;
    result.entries_after = current.entry_count();
    result.message = std::to_string(result.entries_before) + " -> " + std::to_string(result.entries_after) +
                     " entries over " + std::to_string(result.space.points.size()) + " configurations";
    result.clauses = std::move(current);
    return result;
}

}  // namespace metacollapse
