#include "metacollapse/diagnostics.hpp"

#include <sstream>

namespace metacollapse {

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

bool is_visible(Severity severity, Verbosity verbosity) noexcept {
    switch (verbosity) {
        case Verbosity::Quiet:   return severity == Severity::Error;
        case Verbosity::Normal:  return severity == Severity::Error || severity == Severity::Warning;
        case Verbosity::Verbose: return severity != Severity::Debug;
        case Verbosity::Debug:   return true;
    }
    return true;
}

std::string format(const Diagnostic& diagnostic, std::string_view source) {
    std::ostringstream oss;
    oss << (source.empty() ? std::string_view("<input>") : source);
    if (diagnostic.line > 0) {
        oss << ':' << diagnostic.line;
        if (diagnostic.column > 0) {
            oss << ':' << diagnostic.column;
        }
    }
    oss << ": " << to_string(diagnostic.severity) << ": ";
    if (!diagnostic.test.empty()) {
        oss << '[' << diagnostic.test;
        if (diagnostic.subtest) {
            oss << " / " << *diagnostic.subtest;
        }
        oss << "] ";
    }
    if (!diagnostic.key.empty()) {
        oss << diagnostic.key << ": ";
    }
    oss << diagnostic.message;
    return oss.str();
}

}  // namespace metacollapse
