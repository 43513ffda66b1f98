#include "metacollapse/condition_parser.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using metacollapse::ConditionError;

enum class TokenType {
    Identifier,
    String,
    Number,
    LParen,
    RParen,
    Equal,
    NotEqual,
    And,
    Or,
    Not,
    True,
    End,
};

struct Token {
    TokenType type{TokenType::End};
    std::string text;
    std::size_t offset{0};
};

std::string describe(const Token& token) {
    switch (token.type) {
        case TokenType::End: return "end of condition";
        case TokenType::String: return "\"" + token.text + "\"";
        default: return "'" + token.text + "'";
    }
}

bool is_identifier_start(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
}

bool is_identifier_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char ch = text[pos];
        if (std::isspace(static_cast<unsigned char>(ch))) {
            ++pos;
            continue;
        }

        const std::size_t start = pos;
        if (ch == '(') {
            tokens.push_back({TokenType::LParen, "(", start});
            ++pos;
        } else if (ch == ')') {
            tokens.push_back({TokenType::RParen, ")", start});
            ++pos;
        } else if (ch == '=' || ch == '!') {
            if (pos + 1 >= text.size() || text[pos + 1] != '=') {
                throw ConditionError(ConditionError::Kind::Syntax, start,
                                     std::string("Unexpected character '") + ch + "'");
            }
            tokens.push_back({ch == '=' ? TokenType::Equal : TokenType::NotEqual,
                              std::string(text.substr(pos, 2)), start});
            pos += 2;
        } else if (ch == '"') {
            std::string value;
            ++pos;
            bool closed = false;
            while (pos < text.size()) {
                const char c = text[pos];
                if (c == '\\') {
                    if (pos + 1 >= text.size()) {
                        break;
                    }
                    value.push_back(text[pos + 1]);
                    pos += 2;
                    continue;
                }
                if (c == '"') {
                    closed = true;
                    ++pos;
                    break;
                }
                value.push_back(c);
                ++pos;
            }
            if (!closed) {
                throw ConditionError(ConditionError::Kind::Syntax, start, "Unterminated string literal");
            }
            tokens.push_back({TokenType::String, std::move(value), start});
        } else if (is_digit(ch)) {
            while (pos < text.size() && (is_digit(text[pos]) || text[pos] == '.')) {
                ++pos;
            }
            const auto literal = text.substr(start, pos - start);
            if (literal.back() == '.' || literal.find("..") != std::string_view::npos) {
                throw ConditionError(ConditionError::Kind::Syntax, start,
                                     "Malformed number '" + std::string(literal) + "'");
            }
            if (pos < text.size() && is_identifier_char(text[pos])) {
                throw ConditionError(ConditionError::Kind::Syntax, pos,
                                     "Unexpected character '" + std::string(1, text[pos]) + "'");
            }
            tokens.push_back({TokenType::Number, std::string(literal), start});
        } else if (is_identifier_start(ch)) {
            while (pos < text.size() && is_identifier_char(text[pos])) {
                ++pos;
            }
            std::string word{text.substr(start, pos - start)};
            TokenType type = TokenType::Identifier;
            if (word == "and") {
                type = TokenType::And;
            } else if (word == "or") {
                type = TokenType::Or;
            } else if (word == "not") {
                type = TokenType::Not;
            } else if (word == "true") {
                type = TokenType::True;
            }
            tokens.push_back({type, std::move(word), start});
        } else {
            throw ConditionError(ConditionError::Kind::Syntax, start,
                                 std::string("Unexpected character '") + ch + "'");
        }
    }
    tokens.push_back({TokenType::End, {}, text.size()});
    return tokens;
}

class Cursor {
public:
    Cursor(const metacollapse::DimensionRegistry& registry, std::vector<Token> tokens)
        : registry_{registry}, tokens_{std::move(tokens)} {}

    metacollapse::ConditionPtr parse_all() {
        auto result = parse_or();
        if (peek().type != TokenType::End) {
            throw ConditionError(ConditionError::Kind::Syntax, peek().offset,
                                 "Unexpected " + describe(peek()) + " after condition");
        }
        if (deferred_) {
            throw *deferred_;
        }
        return result;
    }

private:
    const Token& peek() const { return tokens_[index_]; }

    const Token& advance() { return tokens_[index_++]; }

    bool accept(TokenType type) {
        if (peek().type == type) {
            ++index_;
            return true;
        }
        return false;
    }

    // Registry problems are remembered and reported only once the text is known
    // to be well formed.
    void defer(ConditionError::Kind kind, std::size_t offset, const std::string& message) {
        if (!deferred_) {
            deferred_.emplace(kind, offset, message);
        }
    }

    metacollapse::ConditionPtr parse_or() {
        auto lhs = parse_and();
        while (accept(TokenType::Or)) {
            lhs = metacollapse::make_or(std::move(lhs), parse_and());
        }
        return lhs;
    }

    metacollapse::ConditionPtr parse_and() {
        auto lhs = parse_unary();
        while (accept(TokenType::And)) {
            lhs = metacollapse::make_and(std::move(lhs), parse_unary());
        }
        return lhs;
    }

    metacollapse::ConditionPtr parse_unary() {
        if (accept(TokenType::Not)) {
            return metacollapse::make_not(parse_unary());
        }
        return parse_atom();
    }

    metacollapse::ConditionPtr parse_atom() {
        const Token& token = advance();
        switch (token.type) {
            case TokenType::LParen: {
                auto inner = parse_or();
                if (!accept(TokenType::RParen)) {
                    throw ConditionError(ConditionError::Kind::Syntax, peek().offset,
                                         "Expected ')' to close '(' at offset " +
                                             std::to_string(token.offset) + ", found " +
                                             describe(peek()));
                }
                return inner;
            }
            case TokenType::True:
                return metacollapse::make_true();
            case TokenType::Identifier:
                return parse_reference(token);
            default:
                throw ConditionError(ConditionError::Kind::Syntax, token.offset,
                                     "Unexpected " + describe(token));
        }
    }

    metacollapse::ConditionPtr parse_reference(const Token& name) {
        const auto* dimension = registry_.find(name.text);
        if (dimension == nullptr) {
            defer(ConditionError::Kind::UnknownDimension, name.offset,
                  "Unknown dimension '" + name.text + "'");
        }

        const bool negated = peek().type == TokenType::NotEqual;
        if (peek().type != TokenType::Equal && !negated) {
            if (dimension != nullptr && dimension->kind != metacollapse::DimensionKind::Boolean) {
                defer(ConditionError::Kind::NotBoolean, name.offset,
                      "Dimension '" + name.text + "' is " +
                          std::string(metacollapse::to_string(dimension->kind)) +
                          " and needs a comparison");
            }
            return metacollapse::make_compare(name.text, "true");
        }
        advance();

        const Token& literal = advance();
        if (literal.type != TokenType::String && literal.type != TokenType::Number) {
            throw ConditionError(ConditionError::Kind::Syntax, literal.offset,
                                 "Expected a literal after '" + name.text + "', found " +
                                     describe(literal));
        }
        if (dimension != nullptr && !dimension->index_of(literal.text)) {
            defer(ConditionError::Kind::UnknownValue, literal.offset,
                  "Value " + describe(literal) + " is not in the domain of '" + name.text + "'");
        }

        auto comparison = metacollapse::make_compare(name.text, literal.text);
        return negated ? metacollapse::make_not(std::move(comparison)) : comparison;
    }

    const metacollapse::DimensionRegistry& registry_;
    std::vector<Token> tokens_;
    std::size_t index_{0};
    std::optional<ConditionError> deferred_;
};

}  // namespace

namespace metacollapse {

ConditionError::ConditionError(Kind kind, std::size_t offset, const std::string& message)
    : std::runtime_error(message), kind_{kind}, offset_{offset} {}

ConditionParser::ConditionParser(const DimensionRegistry& registry) : registry_{registry} {}

ConditionPtr ConditionParser::parse(std::string_view text) const {
    Cursor cursor{registry_, tokenize(text)};
    return cursor.parse_all();
}

}  // namespace metacollapse
