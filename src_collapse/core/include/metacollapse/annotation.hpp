#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace metacollapse {

/**
 * \brief One `if <condition>: <outcome>` line, kept as text.
 *
 * `column` is the 1-based column of the first character of the condition.
 */
struct RawClause {
    std::string condition;
    std::string outcome;
    std::size_t line{0};
    std::size_t column{0};
};

/**
 * \brief A key inside a section, e.g. `expected`.
 *
 * Either `inline_value` is set (`key: value`), or the key owns an indented body
 * of conditional lines with an optional trailing default. Line numbers are
 * 0-based indices into `AnnotationDocument::lines`; `last_line` is the last body
 * line (or the key line for inline values).
 */
struct Property {
    std::string key;
    std::size_t line{0};
    std::size_t last_line{0};
    std::string key_indent;
    std::string body_indent;
    std::optional<std::string> inline_value;
    std::vector<RawClause> clauses;
    std::optional<std::string> default_outcome;
    std::size_t default_line{0};
};

/**
 * \brief Properties of one test, or of one subtest when `subtest` is set.
 *
 * Keys placed before the first section belong to a record with an empty `test`.
 */
struct TestRecord {
    std::string test;
    std::optional<std::string> subtest;
    std::size_t line{0};
    std::vector<Property> properties;
};

/**
 * \brief A parsed annotation file together with its raw text.
 *
 * `lines` hold the content without terminators; `crlf[i]` tells whether line `i`
 * ended with CR LF. `final_newline` is false when the last line was not
 * terminated. Reassembly from these fields gives back the original bytes.
 */
struct AnnotationDocument {
    std::vector<std::string> lines;
    std::vector<bool> crlf;
    bool final_newline{true};
    std::vector<TestRecord> records;
};

/// Joins lines back with their original terminators.
[[nodiscard]] std::string assemble(const std::vector<std::string>& lines, const std::vector<bool>& crlf,
                                   bool final_newline);

}  // namespace metacollapse
