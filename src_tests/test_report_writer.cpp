/**
 * @file test_report_writer.cpp
 * @brief Tests for the JSON summary and HTML report of a collapse run.
 */

#include <catch2/catch_test_macros.hpp>

#include "metacollapse/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace metacollapse;

namespace {

std::vector<FileOutcome> sample_outcomes() {
    Transformer::Config config;
    config.registry = DimensionRegistry{{
        {"os", DimensionKind::String, {"win", "linux", "mac"}},
        boolean_dimension("debug"),
    }};
    const Transformer transformer{config};

    std::vector<FileOutcome> outcomes;
    outcomes.push_back(transformer.transform(
        "[a.html]\n"
        "  expected:\n"
        "    if debug: FAIL\n"
        "    if not debug: FAIL\n"
        "  [<sub>]\n"
        "    expected:\n"
        "      if arch == \"arm\": FAIL\n",
        "a.html.ini"));
    outcomes.push_back(transformer.transform("[b.html]\n  expected:\n    if os = \"win\": FAIL\n", "b.html.ini"));
    return outcomes;
}

std::string read_back(const std::filesystem::path& file) {
    std::ifstream input(file, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

}  // namespace

TEST_CASE("Report summary counts files and keys", "[report_writer]") {
    const auto outcomes = sample_outcomes();
    const auto summary = ReportWriter{}.summary(outcomes);

    REQUIRE(summary["files"] == 2);
    REQUIRE(summary["by_file_status"]["collapsed"] == 1);
    REQUIRE(summary["by_file_status"]["parse-failed"] == 1);
    REQUIRE(summary["by_key_status"]["collapsed"] == 1);
    REQUIRE(summary["by_key_status"]["rejected"] == 1);

    const auto& first = summary["results"][0];
    REQUIRE(first["source"] == "a.html.ini");
    REQUIRE(first["entries_before"] == 3);
    REQUIRE(first["entries_after"] == 2);
    REQUIRE(first["keys"][0]["key"] == "expected");
    REQUIRE(first["keys"][0]["subtest"].is_null());
    REQUIRE(first["keys"][1]["subtest"] == "<sub>");
    REQUIRE(first["keys"][1]["status"] == "rejected");

    const auto& second = summary["results"][1];
    REQUIRE(second["status"] == "parse-failed");
    REQUIRE(second["keys"].empty());
    REQUIRE(second["diagnostics"].back()["severity"] == "error");
    REQUIRE(second["diagnostics"].back()["line"] == 3);
}

TEST_CASE("Report HTML lists every key and escapes text", "[report_writer]") {
    const auto html = ReportWriter{}.render_detailed(sample_outcomes());

    REQUIRE(html.find("<title>Metadata Collapse Report</title>") != std::string::npos);
    REQUIRE(html.find("a.html / &lt;sub&gt;") != std::string::npos);
    REQUIRE(html.find("<sub>") == std::string::npos);
    REQUIRE(html.find("class=\"status-collapsed\"") != std::string::npos);
    REQUIRE(html.find("class=\"status-parse-failed\"") != std::string::npos);
    REQUIRE(html.find("Total files: 2") != std::string::npos);
}

TEST_CASE("Report files are written to disk", "[report_writer]") {
    const auto root = std::filesystem::temp_directory_path() / "metacollapse_report_test";
    std::filesystem::remove_all(root);

    const auto outcomes = sample_outcomes();
    const ReportWriter writer{};
    writer.write_summary(root / "nested" / "summary.json", outcomes);
    writer.write_detailed(root / "report.html", outcomes);

    const auto json_text = read_back(root / "nested" / "summary.json");
    REQUIRE(nlohmann::json::parse(json_text) == writer.summary(outcomes));
    REQUIRE(read_back(root / "report.html") == writer.render_detailed(outcomes));

    std::filesystem::remove_all(root);
}
