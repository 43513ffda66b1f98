#include "metacollapse/evaluator.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

namespace metacollapse {

void ConfigurationPoint::assign(const std::string& dimension, std::string value) {
    values_[dimension] = std::move(value);
}

const std::string* ConfigurationPoint::find(std::string_view dimension) const {
    const auto it = values_.find(dimension);
    return it == values_.end() ? nullptr : &it->second;
}

const std::string& ConfigurationPoint::at(std::string_view dimension) const {
    const auto* value = find(dimension);
    if (value == nullptr) {
        throw std::logic_error("Configuration point " + to_string() + " does not cover dimension '" +
                               std::string(dimension) + "'");
    }
    return *value;
}

std::string ConfigurationPoint::to_string() const {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [name, value] : values_) {
        if (!first) {
            oss << ", ";
        }
        first = false;
        oss << name << '=' << value;
    }
    oss << '}';
    return oss.str();
}

bool evaluate(const Condition& condition, const ConfigurationPoint& point) {
    return std::visit(overloaded{
                          [](const Always&) { return true; },
                          [&](const Compare& cmp) { return point.at(cmp.dimension) == cmp.value; },
                          [&](const And& node) {
                              return evaluate(*node.lhs, point) && evaluate(*node.rhs, point);
                          },
                          [&](const Or& node) {
                              return evaluate(*node.lhs, point) || evaluate(*node.rhs, point);
                          },
                          [&](const Not& node) { return !evaluate(*node.operand, point); },
                      },
                      condition.node);
}

Outcome evaluate(const ClauseList& list, const ConfigurationPoint& point) {
    for (const auto& clause : list.clauses) {
        if (evaluate(*clause.condition, point)) {
            return clause.outcome;
        }
    }
    return list.default_outcome;
}

}  // namespace metacollapse
