#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "condition.hpp"
#include "dimension_registry.hpp"

namespace metacollapse {

/**
 * \brief Failure to turn condition text into a `Condition`.
 *
 * `Syntax` errors mean the text is malformed and are fatal for the file that
 * carries it. The remaining kinds mean the text is well formed but talks about
 * something the registry does not know; only the affected key is skipped.
 */
class ConditionError : public std::runtime_error {
public:
    enum class Kind {
        Syntax,
        UnknownDimension,
        UnknownValue,
        NotBoolean,
    };

    ConditionError(Kind kind, std::size_t offset, const std::string& message);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// Byte offset inside the condition text.
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

    [[nodiscard]] bool is_syntax() const noexcept { return kind_ == Kind::Syntax; }

private:
    Kind kind_;
    std::size_t offset_;
};

/**
 * \brief Recursive-descent parser for the condition language.
 *
 * Grammar:
 * \code{.txt}
 * expr    := or_expr
 * or_expr := and_expr ("or" and_expr)*
 * and_expr:= unary ("and" unary)*
 * unary   := "not" unary | atom
 * atom    := "(" expr ")" | "true" | name ("==" | "!=") literal | name
 * literal := "quoted string" | number
 * \endcode
 *
 * A bare `name` is shorthand for `name == true` and is only valid for boolean
 * dimensions. `a != b` parses as `not (a == b)`. Literals are checked against the
 * dimension's domain. Syntax errors win over registry errors: the whole text is
 * scanned before an unknown dimension or value is reported.
 */
class ConditionParser {
public:
    explicit ConditionParser(const DimensionRegistry& registry);

    [[nodiscard]] ConditionPtr parse(std::string_view text) const;

private:
    const DimensionRegistry& registry_;
};

}  // namespace metacollapse
