#include "metacollapse/condition.hpp"

#include <type_traits>
#include <utility>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void collect_dimensions(const metacollapse::Condition& condition, std::set<std::string>& out) {
    using namespace metacollapse;
    std::visit(overloaded{
                   [](const Always&) {},
                   [&](const Compare& cmp) { out.insert(cmp.dimension); },
                   [&](const And& node) {
                       collect_dimensions(*node.lhs, out);
                       collect_dimensions(*node.rhs, out);
                   },
                   [&](const Or& node) {
                       collect_dimensions(*node.lhs, out);
                       collect_dimensions(*node.rhs, out);
                   },
                   [&](const Not& node) { collect_dimensions(*node.operand, out); },
               },
               condition.node);
}

}  // namespace

namespace metacollapse {

ConditionPtr make_true() {
    return std::make_shared<const Condition>(Condition{Always{}});
}

ConditionPtr make_compare(std::string dimension, std::string value) {
    return std::make_shared<const Condition>(
        Condition{Compare{std::move(dimension), std::move(value)}});
}

ConditionPtr make_and(ConditionPtr lhs, ConditionPtr rhs) {
    return std::make_shared<const Condition>(Condition{And{std::move(lhs), std::move(rhs)}});
}

ConditionPtr make_or(ConditionPtr lhs, ConditionPtr rhs) {
    return std::make_shared<const Condition>(Condition{Or{std::move(lhs), std::move(rhs)}});
}

ConditionPtr make_not(ConditionPtr operand) {
    return std::make_shared<const Condition>(Condition{Not{std::move(operand)}});
}

std::set<std::string> referenced_dimensions(const Condition& condition) {
    std::set<std::string> out;
    collect_dimensions(condition, out);
    return out;
}

std::size_t literal_count(const Condition& condition) {
    return std::visit(overloaded{
                          [](const Always&) -> std::size_t { return 0; },
                          [](const Compare&) -> std::size_t { return 1; },
                          [](const And& node) -> std::size_t {
                              return literal_count(*node.lhs) + literal_count(*node.rhs);
                          },
                          [](const Or& node) -> std::size_t {
                              return literal_count(*node.lhs) + literal_count(*node.rhs);
                          },
                          [](const Not& node) -> std::size_t { return literal_count(*node.operand); },
                      },
                      condition.node);
}

bool same_structure(const Condition& a, const Condition& b) {
    if (a.node.index() != b.node.index()) {
        return false;
    }
    return std::visit(
        [&](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b.node);
            if constexpr (std::is_same_v<T, Always>) {
                return true;
            } else if constexpr (std::is_same_v<T, Compare>) {
                return lhs.dimension == rhs.dimension && lhs.value == rhs.value;
            } else if constexpr (std::is_same_v<T, Not>) {
                return same_structure(*lhs.operand, *rhs.operand);
            } else {
                return same_structure(*lhs.lhs, *rhs.lhs) && same_structure(*lhs.rhs, *rhs.rhs);
            }
        },
        a.node);
}

}  // namespace metacollapse
