#include "metacollapse/report_writer.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using nlohmann::json;

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json key_to_json(const metacollapse::KeyOutcome& key) {
    return json{
        {"test", key.test},
        {"subtest", optional_to_json(key.subtest)},
        {"key", key.key},
        {"line", key.line},
        {"status", std::string{metacollapse::to_string(key.status)}},
        {"entries_before", key.entries_before},
        {"entries_after", key.entries_after},
        {"configurations", key.configurations},
        {"message", key.message},
    };
}

json diagnostic_to_json(const metacollapse::Diagnostic& diagnostic) {
    return json{
        {"severity", std::string{metacollapse::to_string(diagnostic.severity)}},
        {"line", diagnostic.line},
        {"column", diagnostic.column},
        {"test", diagnostic.test},
        {"subtest", optional_to_json(diagnostic.subtest)},
        {"key", diagnostic.key},
        {"message", diagnostic.message},
    };
}

json file_to_json(const metacollapse::FileOutcome& outcome) {
    json keys = json::array();
    std::size_t before = 0;
    std::size_t after = 0;
    for (const auto& key : outcome.keys) {
        keys.push_back(key_to_json(key));
        before += key.entries_before;
        after += key.entries_after;
    }
    json diagnostics = json::array();
    for (const auto& diagnostic : outcome.diagnostics) {
        diagnostics.push_back(diagnostic_to_json(diagnostic));
    }
    return json{
        {"source", outcome.source},
        {"status", std::string{metacollapse::to_string(outcome.status)}},
        {"entries_before", before},
        {"entries_after", after},
        {"keys", std::move(keys)},
        {"diagnostics", std::move(diagnostics)},
    };
}

void increment(json& counters, std::string_view status) {
    auto& counter = counters[std::string{status}];
    if (!counter.is_number()) {
        counter = 0;
    }
    counter = counter.get<std::size_t>() + 1;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string section_to_html(const metacollapse::KeyOutcome& key) {
    if (key.test.empty()) {
        return {};
    }
    return key.subtest ? escape_html(key.test) + " / " + escape_html(*key.subtest) : escape_html(key.test);
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace metacollapse {

nlohmann::json ReportWriter::summary(const std::vector<FileOutcome>& outcomes) const {
    json summary = {
        {"files", outcomes.size()},
        {"by_file_status", json::object()},
        {"by_key_status", json::object()},
        {"results", json::array()},
    };

    for (const auto& outcome : outcomes) {
        summary["results"].push_back(file_to_json(outcome));
        increment(summary["by_file_status"], to_string(outcome.status));
        for (const auto& key : outcome.keys) {
            increment(summary["by_key_status"], to_string(key.status));
        }
    }
    return summary;
}

std::string ReportWriter::render_detailed(const std::vector<FileOutcome>& outcomes) const {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Metadata Collapse Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << ".status-collapsed{color:#0a7c2f;font-weight:bold;}"
        << ".status-unchanged{color:#7a7a7a;}"
        << ".status-rejected{color:#ff8800;font-weight:bold;}"
        << ".status-validation-failed{color:#c1121f;font-weight:bold;}"
        << ".status-parse-failed{color:#b000b5;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Metadata Collapse Report</h1>";

    std::map<std::string, std::size_t> file_counts;
    std::map<std::string, std::size_t> key_counts;
    for (const auto& outcome : outcomes) {
        ++file_counts[std::string{to_string(outcome.status)}];
        for (const auto& key : outcome.keys) {
            ++key_counts[std::string{to_string(key.status)}];
        }
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total files: " << outcomes.size() << "</li>";
    for (const auto& [status, count] : file_counts) {
        oss << "<li>files " << escape_html(status) << ": " << count << "</li>";
    }
    for (const auto& [status, count] : key_counts) {
        oss << "<li>keys " << escape_html(status) << ": " << count << "</li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Keys</h2><table>";
    oss << "<thead><tr>"
        << "<th>File</th>"
        << "<th>Line</th>"
        << "<th>Section</th>"
        << "<th>Key</th>"
        << "<th>Status</th>"
        << "<th>Entries</th>"
        << "<th>Message</th>"
        << "</tr></thead><tbody>";

    for (const auto& outcome : outcomes) {
        if (outcome.status == FileStatus::ParseFailed) {
            const auto error = std::find_if(outcome.diagnostics.begin(), outcome.diagnostics.end(),
                                            [](const Diagnostic& d) { return d.severity == Severity::Error; });
            const bool found = error != outcome.diagnostics.end();
            const std::string message = found ? error->message : std::string{};
            const std::size_t line = found ? error->line : 0;
            oss << "<tr>";
            oss << "<td>" << escape_html(outcome.source) << "</td>";
            oss << "<td>" << line << "</td>";
            oss << "<td></td><td></td>";
            oss << "<td class=\"status-parse-failed\">parse-failed</td>";
            oss << "<td></td>";
            oss << "<td>" << escape_html(message) << "</td>";
            oss << "</tr>";
            continue;
        }
        for (const auto& key : outcome.keys) {
            const std::string status{to_string(key.status)};
            oss << "<tr>";
            oss << "<td>" << escape_html(outcome.source) << "</td>";
            oss << "<td>" << key.line << "</td>";
            oss << "<td>" << section_to_html(key) << "</td>";
            oss << "<td>" << escape_html(key.key) << "</td>";
            oss << "<td class=\"status-" << status << "\">" << status << "</td>";
            oss << "<td>" << key.entries_before << " &rarr; " << key.entries_after << "</td>";
            oss << "<td>" << escape_html(key.message) << "</td>";
            oss << "</tr>";
        }
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<FileOutcome>& outcomes) const {
    write_file(destination, summary(outcomes).dump(2));
}

void ReportWriter::write_detailed(const std::filesystem::path& destination,
                                  const std::vector<FileOutcome>& outcomes) const {
    write_file(destination, render_detailed(outcomes));
}

}  // namespace metacollapse
