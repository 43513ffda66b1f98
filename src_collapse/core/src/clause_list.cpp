#include "metacollapse/clause_list.hpp"

namespace metacollapse {

std::size_t ClauseList::literal_count() const {
    std::size_t total = 0;
    for (const auto& clause : clauses) {
        total += metacollapse::literal_count(*clause.condition);
    }
    return total;
}

std::set<std::string> ClauseList::referenced_dimensions() const {
    std::set<std::string> out;
    for (const auto& clause : clauses) {
        auto names = metacollapse::referenced_dimensions(*clause.condition);
        out.insert(names.begin(), names.end());
    }
    return out;
}

bool same_structure(const ClauseList& a, const ClauseList& b) {
    if (a.default_outcome != b.default_outcome || a.clauses.size() != b.clauses.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.clauses.size(); ++i) {
        if (a.clauses[i].outcome != b.clauses[i].outcome ||
            !same_structure(*a.clauses[i].condition, *b.clauses[i].condition)) {
            return false;
        }
    }
    return true;
}

}  // namespace metacollapse
