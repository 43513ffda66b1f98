#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace metacollapse {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

/// How much of the diagnostic stream a caller wants to see.
enum class Verbosity {
    Quiet,    ///< errors only
    Normal,   ///< errors and warnings
    Verbose,  ///< plus per-key results
    Debug,    ///< plus enumeration and search details
};

/**
 * \brief One message about a file or one of its keys.
 *
 * `line` and `column` are 1-based; 0 means "not tied to a position".
 */
struct Diagnostic {
    Severity severity{Severity::Info};
    std::size_t line{0};
    std::size_t column{0};
    std::string test;
    std::optional<std::string> subtest;
    std::string key;
    std::string message;
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

[[nodiscard]] bool is_visible(Severity severity, Verbosity verbosity) noexcept;

/// `<source>:<line>:<column>: <severity>: [<test> / <subtest>] <key>: <message>`
[[nodiscard]] std::string format(const Diagnostic& diagnostic, std::string_view source);

}  // namespace metacollapse
