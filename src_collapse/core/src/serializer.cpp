#include "metacollapse/serializer.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace {

using metacollapse::Condition;

void flatten_and(const Condition& condition, std::vector<const Condition*>& out) {
    if (const auto* node = std::get_if<metacollapse::And>(&condition.node)) {
        flatten_and(*node->lhs, out);
        flatten_and(*node->rhs, out);
    } else {
        out.push_back(&condition);
    }
}

void flatten_or(const Condition& condition, std::vector<const Condition*>& out) {
    if (const auto* node = std::get_if<metacollapse::Or>(&condition.node)) {
        flatten_or(*node->lhs, out);
        flatten_or(*node->rhs, out);
    } else {
        out.push_back(&condition);
    }
}

std::string quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

}  // namespace

namespace metacollapse {

Serializer::Serializer(const DimensionRegistry& registry) : registry_{registry} {}

std::string Serializer::render(const Condition& condition) const {
    return render(condition, Context::Top);
}

std::string Serializer::render_literal(const std::string& dimension, const std::string& value) const {
    const auto* found = registry_.find(dimension);
    if (found != nullptr && found->kind == DimensionKind::Number) {
        return value;
    }
    return quote(value);
}

std::string Serializer::render_comparison(const Compare& compare, bool negated, Context context) const {
    const auto* dimension = registry_.find(compare.dimension);
    if (dimension != nullptr && dimension->kind == DimensionKind::Boolean) {
        const bool positive = (compare.value == "true") != negated;
        return positive ? compare.dimension : "not " + compare.dimension;
    }

    std::string text = compare.dimension + (negated ? " != " : " == ") +
                       render_literal(compare.dimension, compare.value);
    if (context != Context::Top) {
        text = "(" + text + ")";
    }
    return text;
}

std::string Serializer::render(const Condition& condition, Context context) const {
    return std::visit(
        [&](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Always>) {
                return "true";
            } else if constexpr (std::is_same_v<T, Compare>) {
                return render_comparison(node, false, context);
            } else if constexpr (std::is_same_v<T, Not>) {
                if (const auto* cmp = std::get_if<Compare>(&node.operand->node)) {
                    return render_comparison(*cmp, true, context);
                }
                const bool compound = std::holds_alternative<And>(node.operand->node) ||
                                      std::holds_alternative<Or>(node.operand->node);
                const auto inner = render(*node.operand, Context::NotOperand);
                return "not " + (compound ? "(" + inner + ")" : inner);
            } else if constexpr (std::is_same_v<T, And>) {
                std::vector<const Condition*> terms;
                flatten_and(condition, terms);
                std::string text;
                for (const auto* term : terms) {
                    if (!text.empty()) {
                        text += " and ";
                    }
                    const auto rendered = render(*term, Context::AndOperand);
                    text += std::holds_alternative<Or>(term->node) ? "(" + rendered + ")" : rendered;
                }
                return text;
            } else {
                std::vector<const Condition*> terms;
                flatten_or(condition, terms);
                std::string text;
                for (const auto* term : terms) {
                    if (!text.empty()) {
                        text += " or ";
                    }
                    text += render(*term, Context::OrOperand);
                }
                return text;
            }
        },
        condition.node);
}

std::string Serializer::render_clause(const Clause& clause) const {
    return "if " + render(*clause.condition) + ": " + clause.outcome;
}

std::vector<std::string> Serializer::render_property(const std::string& key, const ClauseList& list,
                                                     const PropertyLayout& layout) const {
    if (list.clauses.empty()) {
        if (!list.default_outcome) {
            throw std::logic_error("Property '" + key + "' has neither clauses nor a default");
        }
        return {layout.key_indent + key + ": " + *list.default_outcome};
    }

    std::vector<std::string> lines;
    lines.reserve(list.entry_count() + 1);
    lines.push_back(layout.key_indent + key + ":");
    for (const auto& clause : list.clauses) {
        lines.push_back(layout.body_indent + render_clause(clause));
    }
    if (list.default_outcome) {
        lines.push_back(layout.body_indent + *list.default_outcome);
    }
    return lines;
}

}  // namespace metacollapse
