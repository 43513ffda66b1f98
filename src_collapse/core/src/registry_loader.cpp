#include "metacollapse/registry_loader.hpp"

#include "metacollapse/annotation_parser.hpp"
#include "metacollapse/condition_parser.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string location(const std::string& source, std::size_t line_no) {
    return source + ":" + std::to_string(line_no);
}

metacollapse::DimensionKind parse_kind(const std::string& raw, const std::string& where) {
    using metacollapse::DimensionKind;
    if (raw == "string") {
        return DimensionKind::String;
    }
    if (raw == "number") {
        return DimensionKind::Number;
    }
    if (raw == "bool") {
        return DimensionKind::Boolean;
    }
    throw std::runtime_error("Unknown dimension kind '" + raw + "' at " + where);
}

std::vector<std::string> split_values(std::string_view raw, const std::string& where) {
    std::vector<std::string> values;
    std::size_t start = 0;
    while (start <= raw.size()) {
        const auto comma = raw.find(',', start);
        const auto end = comma == std::string_view::npos ? raw.size() : comma;
        auto value = trim_copy(raw.substr(start, end - start));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (value.empty()) {
            throw std::runtime_error("Empty dimension value at " + where);
        }
        values.push_back(std::move(value));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return values;
}

struct PendingConstraint {
    std::string text;
    std::string where;
};

}  // namespace

namespace metacollapse {

DimensionRegistry RegistryLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Registry file does not exist: " + file.string());
    }
    return parse(read_file(file), file.string());
}

DimensionRegistry RegistryLoader::parse(std::string_view content, const std::string& source) const {
    std::vector<Dimension> dimensions;
    std::vector<PendingConstraint> pending;

    std::istringstream input{std::string{content}};
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        const auto where = location(source, line_no);

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key = value' entry at " + where);
        }
        const auto key = trim_copy(std::string_view(trimmed).substr(0, delimiter));
        const auto value = trim_copy(std::string_view(trimmed).substr(delimiter + 1));

        if (key == "constraint") {
            if (value.empty()) {
                throw std::runtime_error("Empty constraint at " + where);
            }
            pending.push_back({value, where});
            continue;
        }
        if (key.rfind("dimension.", 0) != 0) {
            throw std::runtime_error("Unknown registry key '" + key + "' at " + where);
        }

        Dimension dimension;
        dimension.name = key.substr(10);
        if (dimension.name.empty()) {
            throw std::runtime_error("Empty dimension name at " + where);
        }
        const auto colon = value.find(':');
        dimension.kind = parse_kind(trim_copy(std::string_view(value).substr(0, colon)), where);
        const auto values = colon == std::string::npos ? std::string{} : trim_copy(std::string_view(value).substr(colon + 1));
        if (dimension.kind == DimensionKind::Boolean) {
            if (!values.empty()) {
                throw std::runtime_error("Boolean dimension '" + dimension.name + "' takes no values at " + where);
            }
        } else {
            if (values.empty()) {
                throw std::runtime_error("Dimension '" + dimension.name + "' has no values at " + where);
            }
            dimension.values = split_values(values, where);
        }
        dimensions.push_back(std::move(dimension));
    }

    if (dimensions.empty()) {
        throw std::runtime_error("Registry " + source + " declares no dimensions");
    }

    try {
        const DimensionRegistry bare{dimensions};
        const ConditionParser parser{bare};
        std::vector<ConditionPtr> constraints;
        for (const auto& constraint : pending) {
            try {
                constraints.push_back(parser.parse(constraint.text));
            } catch (const ConditionError& err) {
                throw std::runtime_error("Invalid constraint at " + constraint.where + ": " + err.what());
            }
        }
        return DimensionRegistry{std::move(dimensions), std::move(constraints)};
    } catch (const std::invalid_argument& err) {
        throw std::runtime_error("Invalid registry " + source + ": " + err.what());
    }
}

}  // namespace metacollapse
