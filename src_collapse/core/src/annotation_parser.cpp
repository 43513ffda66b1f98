#include "metacollapse/annotation_parser.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string leading_whitespace(std::string_view line) {
    const auto begin = line.find_first_not_of(kWhitespace);
    return std::string{line.substr(0, begin == std::string_view::npos ? line.size() : begin)};
}

bool is_key_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
}

std::string unescape_section(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size()) {
            out.push_back(raw[++i]);
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

// First ':' that is not inside a double-quoted literal.
std::size_t find_separator(std::string_view text) {
    bool quoted = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (quoted) {
            if (ch == '\\') {
                ++i;
            } else if (ch == '"') {
                quoted = false;
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ':') {
            return i;
        }
    }
    return std::string_view::npos;
}

struct SectionFrame {
    std::size_t indent;
    std::size_t record;
};

class DocumentBuilder {
public:
    explicit DocumentBuilder(metacollapse::AnnotationDocument& doc) : doc_{doc} {}

    void feed(std::size_t index) {
        const std::string& line = doc_.lines[index];
        const auto trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            return;
        }

        const std::string indent = leading_whitespace(line);
        if (open_ && indent.size() > current().key_indent.size()) {
            feed_body(index, indent, trimmed);
            return;
        }
        close_property();

        if (trimmed.front() == '[' && trimmed.back() == ']' && trimmed.size() >= 2) {
            open_section(index, indent.size(), trimmed);
            return;
        }
        open_key(index, indent, trimmed);
    }

    void finish() { close_property(); }

private:
    metacollapse::Property& current() {
        return doc_.records[open_->first].properties[open_->second];
    }

    void open_section(std::size_t index, std::size_t indent, const std::string& trimmed) {
        while (!sections_.empty() && sections_.back().indent >= indent) {
            sections_.pop_back();
        }
        if (sections_.size() >= 2) {
            throw metacollapse::ParseError(index + 1, indent + 1,
                                           "Sections nest at most two levels (test and subtest)");
        }
        auto name = unescape_section(std::string_view(trimmed).substr(1, trimmed.size() - 2));
        if (name.empty()) {
            throw metacollapse::ParseError(index + 1, indent + 1, "Empty section name");
        }

        metacollapse::TestRecord record;
        record.line = index;
        if (sections_.empty()) {
            record.test = std::move(name);
        } else {
            record.test = doc_.records[sections_.front().record].test;
            record.subtest = std::move(name);
        }
        doc_.records.push_back(std::move(record));
        sections_.push_back({indent, doc_.records.size() - 1});
    }

    void open_key(std::size_t index, const std::string& indent, const std::string& trimmed) {
        const auto colon = trimmed.find(':');
        const auto key = colon == std::string::npos ? std::string{} : trim_copy(std::string_view(trimmed).substr(0, colon));
        bool valid = !key.empty();
        for (char ch : key) {
            valid = valid && is_key_char(ch);
        }
        if (!valid) {
            throw metacollapse::ParseError(index + 1, indent.size() + 1,
                                           "Expected 'key: value' or '[section]', found '" + trimmed + "'");
        }

        while (!sections_.empty() && sections_.back().indent >= indent.size()) {
            sections_.pop_back();
        }
        std::size_t record_index = 0;
        if (sections_.empty()) {
            if (!root_record_) {
                doc_.records.push_back(metacollapse::TestRecord{});
                doc_.records.back().line = index;
                root_record_ = doc_.records.size() - 1;
            }
            record_index = *root_record_;
        } else {
            record_index = sections_.back().record;
        }

        metacollapse::Property property;
        property.key = key;
        property.line = index;
        property.last_line = index;
        property.key_indent = indent;
        auto value = trim_copy(std::string_view(trimmed).substr(colon + 1));
        auto& properties = doc_.records[record_index].properties;
        if (!value.empty()) {
            property.inline_value = std::move(value);
            properties.push_back(std::move(property));
            return;
        }
        properties.push_back(std::move(property));
        open_ = std::make_pair(record_index, properties.size() - 1);
    }

    void feed_body(std::size_t index, const std::string& indent, const std::string& trimmed) {
        auto& property = current();
        if (property.body_indent.empty()) {
            property.body_indent = indent;
        }
        property.last_line = index;

        if (trimmed.rfind("if ", 0) == 0) {
            if (property.default_outcome) {
                throw metacollapse::ParseError(index + 1, indent.size() + 1,
                                               "Conditional value after the default value of '" +
                                                   property.key + "'");
            }
            const std::string_view rest = std::string_view(trimmed).substr(3);
            const auto separator = find_separator(rest);
            if (separator == std::string_view::npos) {
                throw metacollapse::ParseError(index + 1, indent.size() + 1,
                                               "Conditional value without ':' separator");
            }
            metacollapse::RawClause clause;
            const auto lead = rest.find_first_not_of(kWhitespace);
            clause.condition = trim_copy(rest.substr(0, separator));
            clause.outcome = trim_copy(rest.substr(separator + 1));
            clause.line = index;
            clause.column = indent.size() + 3 + (lead == std::string_view::npos ? 0 : lead) + 1;
            if (clause.outcome.empty()) {
                throw metacollapse::ParseError(index + 1, indent.size() + 1,
                                               "Conditional value with an empty outcome");
            }
            property.clauses.push_back(std::move(clause));
            return;
        }

        if (property.default_outcome) {
            throw metacollapse::ParseError(index + 1, indent.size() + 1,
                                           "Second default value for '" + property.key + "'");
        }
        property.default_outcome = trimmed;
        property.default_line = index;
    }

    void close_property() {
        if (!open_) {
            return;
        }
        const auto& property = current();
        if (property.clauses.empty() && !property.default_outcome) {
            throw metacollapse::ParseError(property.line + 1, property.key_indent.size() + 1,
                                           "Key '" + property.key + "' has no value");
        }
        open_.reset();
    }

    metacollapse::AnnotationDocument& doc_;
    std::vector<SectionFrame> sections_;
    std::optional<std::size_t> root_record_;
    std::optional<std::pair<std::size_t, std::size_t>> open_;
};

}  // namespace

namespace metacollapse {

ParseError::ParseError(std::size_t line, std::size_t column, const std::string& message)
    : std::runtime_error(std::to_string(line) + ":" + std::to_string(column) + ": " + message),
      line_{line},
      column_{column},
      detail_{message} {}

AnnotationDocument AnnotationParser::parse(std::string_view content) const {
    AnnotationDocument doc;

    std::size_t start = 0;
    while (start < content.size()) {
        const auto newline = content.find('\n', start);
        if (newline == std::string_view::npos) {
            doc.lines.emplace_back(content.substr(start));
            doc.crlf.push_back(false);
            doc.final_newline = false;
            break;
        }
        std::string line{content.substr(start, newline - start)};
        const bool cr = !line.empty() && line.back() == '\r';
        if (cr) {
            line.pop_back();
        }
        doc.lines.push_back(std::move(line));
        doc.crlf.push_back(cr);
        start = newline + 1;
    }

    DocumentBuilder builder{doc};
    for (std::size_t i = 0; i < doc.lines.size(); ++i) {
        builder.feed(i);
    }
    builder.finish();
    return doc;
}

AnnotationDocument AnnotationParser::load(const std::filesystem::path& file) const {
    return parse(read_file(file));
}

std::string read_file(const std::filesystem::path& file) {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Annotation file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Annotation path is not a regular file: " + file.string());
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open annotation file: " + file.string());
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::string assemble(const std::vector<std::string>& lines, const std::vector<bool>& crlf,
                     bool final_newline) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out += lines[i];
        if (i + 1 < lines.size() || final_newline) {
            out += (i < crlf.size() && crlf[i]) ? "\r\n" : "\n";
        }
    }
    return out;
}

}  // namespace metacollapse
