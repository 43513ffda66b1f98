#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "diagnostics.hpp"
#include "dimension_registry.hpp"
#include "minimizer.hpp"

namespace metacollapse {

enum class KeyStatus {
    Collapsed,         ///< rewritten with fewer entries
    Unchanged,         ///< already minimal
    ValidationFailed,  ///< candidate rejected; original text kept
    Rejected,          ///< conditions mention unknown dimensions/values, or the space is too large
};

enum class FileStatus {
    Collapsed,
    Unchanged,
    ParseFailed,
};

[[nodiscard]] std::string_view to_string(KeyStatus status) noexcept;
[[nodiscard]] std::string_view to_string(FileStatus status) noexcept;

struct KeyOutcome {
    std::string test;
    std::optional<std::string> subtest;
    std::string key;
    std::size_t line{0};  ///< 1-based line of the key
    KeyStatus status{KeyStatus::Unchanged};
    std::size_t entries_before{0};
    std::size_t entries_after{0};
    std::size_t configurations{0};
    std::string message;
};

/**
 * \brief Result of collapsing one file.
 *
 * `content` holds the complete output unless the file failed to parse, in which
 * case nothing may be written back.
 */
struct FileOutcome {
    std::string source;
    FileStatus status{FileStatus::Unchanged};
    std::optional<std::string> content;
    std::vector<KeyOutcome> keys;
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] std::size_t count(KeyStatus status) const;
};

/**
 * \brief Collapses every conditional key of an annotation file.
 *
 * The file is parsed as a whole, every key with conditional values is minimised
 * on its own, and the output is the input with only the collapsed key regions
 * replaced; every other byte, line terminators included, is kept. A structural
 * or condition syntax error fails the whole file. Unknown dimensions or values,
 * an oversized configuration space and failed validation only leave that key
 * untouched and add a diagnostic.
 */
class Transformer {
public:
    struct Config {
        DimensionRegistry registry{default_registry()};
        Minimizer::Options minimizer{};
    };

    explicit Transformer(Config config);

    [[nodiscard]] FileOutcome transform(std::string_view content, std::string source = {}) const;

    /// Reads `file` completely first; I/O problems throw `std::runtime_error`.
    [[nodiscard]] FileOutcome transform_file(const std::filesystem::path& file) const;

    [[nodiscard]] const DimensionRegistry& registry() const noexcept { return config_.registry; }

private:
    Config config_;
};

}  // namespace metacollapse
