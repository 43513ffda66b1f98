#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "annotation.hpp"

namespace metacollapse {

/**
 * \brief Malformed annotation file. Fatal for the whole file.
 *
 * `line` and `column` are 1-based.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(std::size_t line, std::size_t column, const std::string& message);

    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

    /// Message without the `line:column:` prefix.
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::size_t line_;
    std::size_t column_;
    std::string detail_;
};

/**
 * \brief Structural parser for expectation annotation files.
 *
 * The format is indentation based. Sections name tests, nested sections name
 * subtests, and keys hold either one literal value or a list of conditional
 * values evaluated top to bottom:
 * \code{.txt}
 * [test.html]
 *   expected: TIMEOUT
 *   [first subtest]
 *     expected:
 *       if (os == "win") and debug: FAIL
 *       if os == "linux": PASS
 *       FAIL
 * \endcode
 *
 * Blank lines and lines starting with `#` are kept but carry no meaning.
 * Condition text is not interpreted here; see `ConditionParser`. Structural
 * problems throw `ParseError`:
 *   - a line that is neither a section header, a key, a comment nor a body line,
 *   - sections nested deeper than test/subtest,
 *   - a key without value or body,
 *   - a conditional line without `:` or with an empty outcome,
 *   - a conditional line after the default line, or a second default line.
 */
class AnnotationParser {
public:
    AnnotationParser() = default;

    [[nodiscard]] AnnotationDocument parse(std::string_view content) const;

    /// Reads the whole file; I/O problems throw `std::runtime_error`.
    [[nodiscard]] AnnotationDocument load(const std::filesystem::path& file) const;
};

/// Reads a file byte for byte.
[[nodiscard]] std::string read_file(const std::filesystem::path& file);

}  // namespace metacollapse
