#include "metacollapse/transformer.hpp"

#include "metacollapse/annotation_parser.hpp"
#include "metacollapse/condition_parser.hpp"
#include "metacollapse/serializer.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

using metacollapse::Diagnostic;
using metacollapse::KeyOutcome;
using metacollapse::Severity;

struct Replacement {
    std::size_t first;
    std::size_t last;
    std::vector<std::string> lines;
};

Diagnostic key_diagnostic(Severity severity, const KeyOutcome& key, std::string message,
                          std::size_t column = 0) {
    Diagnostic diagnostic;
    diagnostic.severity = severity;
    diagnostic.line = key.line;
    diagnostic.column = column;
    diagnostic.test = key.test;
    diagnostic.subtest = key.subtest;
    diagnostic.key = key.key;
    diagnostic.message = std::move(message);
    return diagnostic;
}

std::string describe_space(const metacollapse::ConfigurationSpace& space) {
    std::string names;
    for (const auto* dimension : space.dimensions) {
        names += names.empty() ? "" : ", ";
        names += dimension->name;
    }
    return std::to_string(space.points.size()) + " configurations over {" + names + "}";
}

}  // namespace

namespace metacollapse {

std::string_view to_string(KeyStatus status) noexcept {
    switch (status) {
        case KeyStatus::Collapsed:        return "collapsed";
        case KeyStatus::Unchanged:        return "unchanged";
        case KeyStatus::ValidationFailed: return "validation-failed";
        case KeyStatus::Rejected:         return "rejected";
    }
    return "unknown";
}

std::string_view to_string(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Collapsed:   return "collapsed";
        case FileStatus::Unchanged:   return "unchanged";
        case FileStatus::ParseFailed: return "parse-failed";
    }
    return "unknown";
}

std::size_t FileOutcome::count(KeyStatus status) const {
    return static_cast<std::size_t>(
        std::count_if(keys.begin(), keys.end(), [&](const KeyOutcome& k) { return k.status == status; }));
}

Transformer::Transformer(Config config) : config_{std::move(config)} {}

FileOutcome Transformer::transform(std::string_view content, std::string source) const {
    FileOutcome outcome;
    outcome.source = std::move(source);

    AnnotationDocument doc;
    try {
        doc = AnnotationParser{}.parse(content);
    } catch (const ParseError& err) {
        outcome.status = FileStatus::ParseFailed;
        outcome.diagnostics.push_back({Severity::Error, err.line(), err.column(), {}, std::nullopt, {}, err.detail()});
        return outcome;
    }

    const ConditionParser conditions{config_.registry};
    const Minimizer minimizer{config_.registry, config_.minimizer};
    const Serializer serializer{config_.registry};
    std::vector<Replacement> replacements;

    for (const auto& record : doc.records) {
        std::set<std::string> seen_keys;
        for (const auto& property : record.properties) {
            KeyOutcome key;
            key.test = record.test;
            key.subtest = record.subtest;
            key.key = property.key;
            key.line = property.line + 1;

            if (!seen_keys.insert(property.key).second) {
                outcome.diagnostics.push_back(
                    key_diagnostic(Severity::Warning, key, "key appears more than once in this section"));
            }
            if (property.clauses.empty()) {
                continue;
            }

            ClauseList list;
            list.default_outcome = property.default_outcome;
            // Every clause is parsed so a later syntax error still fails the file;
            // only the first registry error is reported for the key.
            std::optional<Diagnostic> rejection;
            for (const auto& raw : property.clauses) {
                try {
                    list.clauses.push_back({conditions.parse(raw.condition), raw.outcome});
                } catch (const ConditionError& err) {
                    if (err.is_syntax()) {
                        outcome.status = FileStatus::ParseFailed;
                        outcome.keys.clear();
                        Diagnostic diagnostic = key_diagnostic(Severity::Error, key, err.what(),
                                                               raw.column + err.offset());
                        diagnostic.line = raw.line + 1;
                        outcome.diagnostics.push_back(std::move(diagnostic));
                        return outcome;
                    }
                    if (!rejection) {
                        key.status = KeyStatus::Rejected;
                        key.message = err.what();
                        rejection = key_diagnostic(Severity::Warning, key, "left unchanged: " + key.message,
                                                   raw.column + err.offset());
                        rejection->line = raw.line + 1;
                    }
                }
            }
            key.entries_before = property.clauses.size() + (property.default_outcome ? 1 : 0);
            key.entries_after = key.entries_before;
            if (rejection) {
                outcome.diagnostics.push_back(std::move(*rejection));
                outcome.keys.push_back(std::move(key));
                continue;
            }

            Minimizer::Result result;
            try {
                result = minimizer.minimize(list);
            } catch (const EnumerationLimitError& err) {
                key.status = KeyStatus::Rejected;
                key.message = err.what();
                outcome.diagnostics.push_back(
                    key_diagnostic(Severity::Warning, key, "left unchanged: " + key.message));
                outcome.keys.push_back(std::move(key));
                continue;
            }
            key.configurations = result.space.points.size();
            key.message = result.message;
            outcome.diagnostics.push_back(key_diagnostic(Severity::Debug, key, describe_space(result.space)));

            switch (result.status) {
                case Minimizer::Status::ValidationFailed:
                    key.status = KeyStatus::ValidationFailed;
                    outcome.diagnostics.push_back(
                        key_diagnostic(Severity::Warning, key, "validation failed, left unchanged: " + key.message));
                    break;
                case Minimizer::Status::Unchanged:
                    key.status = KeyStatus::Unchanged;
                    outcome.diagnostics.push_back(key_diagnostic(Severity::Info, key, key.message));
                    break;
                case Minimizer::Status::Collapsed: {
                    // The rendered text must read back as the same list.
                    ClauseList reread;
                    reread.default_outcome = result.clauses.default_outcome;
                    for (const auto& clause : result.clauses.clauses) {
                        reread.clauses.push_back({conditions.parse(serializer.render(*clause.condition)), clause.outcome});
                    }
                    if (Minimizer::first_difference(list, reread, result.space)) {
                        key.status = KeyStatus::ValidationFailed;
                        key.message = "rendered conditions do not read back equivalently";
                        outcome.diagnostics.push_back(
                            key_diagnostic(Severity::Warning, key, "validation failed, left unchanged: " + key.message));
                        break;
                    }
                    key.status = KeyStatus::Collapsed;
                    key.entries_after = result.entries_after;
                    replacements.push_back(
                        {property.line, property.last_line,
                         serializer.render_property(property.key, result.clauses,
                                                    PropertyLayout{property.key_indent, property.body_indent})});
                    outcome.diagnostics.push_back(key_diagnostic(Severity::Info, key, "collapsed " + key.message));
                    break;
                }
            }
            outcome.keys.push_back(std::move(key));
        }
    }

    if (replacements.empty()) {
        outcome.status = FileStatus::Unchanged;
        outcome.content = std::string(content);
        return outcome;
    }

    std::sort(replacements.begin(), replacements.end(),
              [](const Replacement& a, const Replacement& b) { return a.first < b.first; });

    std::vector<std::string> lines;
    std::vector<bool> crlf;
    std::size_t next = 0;
    for (auto& replacement : replacements) {
        for (; next < replacement.first; ++next) {
            lines.push_back(doc.lines[next]);
            crlf.push_back(doc.crlf[next]);
        }
        const bool cr = doc.crlf[replacement.first];
        for (auto& line : replacement.lines) {
            lines.push_back(std::move(line));
            crlf.push_back(cr);
        }
        next = replacement.last + 1;
    }
    for (; next < doc.lines.size(); ++next) {
        lines.push_back(doc.lines[next]);
        crlf.push_back(doc.crlf[next]);
    }

    auto collapsed = assemble(lines, crlf, doc.final_newline);
    try {
        (void)AnnotationParser{}.parse(collapsed);
    } catch (const ParseError& err) {
        throw std::logic_error("Collapsed output of " + outcome.source + " no longer parses: " + err.what());
    }

    outcome.status = FileStatus::Collapsed;
    outcome.content = std::move(collapsed);
    return outcome;
}

FileOutcome Transformer::transform_file(const std::filesystem::path& file) const {
    return transform(read_file(file), file.string());
}

}  // namespace metacollapse
