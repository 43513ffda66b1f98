#pragma once

#include "transformer.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace metacollapse {

/**
 * \brief Emits machine-readable and human-friendly reports for a collapse run.
 *
 * - summary() / write_summary(): JSON document with per-file status, per-key entry
 *   counts and diagnostics, plus aggregate counts by file and key status.
 * - render_detailed() / write_detailed(): HTML report with one table row per key.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    [[nodiscard]] nlohmann::json summary(const std::vector<FileOutcome>& outcomes) const;

    [[nodiscard]] std::string render_detailed(const std::vector<FileOutcome>& outcomes) const;

    void write_summary(const std::filesystem::path& destination,
                       const std::vector<FileOutcome>& outcomes) const;

    void write_detailed(const std::filesystem::path& destination,
                        const std::vector<FileOutcome>& outcomes) const;
};

}  // namespace metacollapse
