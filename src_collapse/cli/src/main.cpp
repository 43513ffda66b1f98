#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "metacollapse/diagnostics.hpp"
#include "metacollapse/registry_loader.hpp"
#include "metacollapse/report_writer.hpp"
#include "metacollapse/transformer.hpp"

using metacollapse::FileOutcome;
using metacollapse::FileStatus;
using metacollapse::RegistryLoader;
using metacollapse::ReportWriter;
using metacollapse::Transformer;
using metacollapse::Verbosity;

namespace {

struct Args {
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> registry_path;
    std::filesystem::path output_path{};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    bool in_place{false};
    bool check{false};
    Verbosity verbosity{Verbosity::Normal};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Test metadata condition collapser\n"
        << "Usage:\n"
        << "  " << argv0 << " [options] <file>...\n"
        << "\n"
        << "Options:\n"
        << "  --registry <file>  Dimension registry (default: built-in test platform matrix).\n"
        << "  -o, --output <f>   Write the collapsed file here (single input only).\n"
        << "  --in-place         Replace every input with its collapsed form.\n"
        << "  --check            Write nothing; exit 1 when any input would change.\n"
        << "  --summary <path>   Write a JSON summary of the run.\n"
        << "  --html <path>      Write an HTML report of the run.\n"
        << "  -q, --quiet        Report errors only.\n"
        << "  -v, --verbose      Report per-key results; repeat for search details.\n"
        << "  -h, --help         Show this help message.\n"
        << "\n"
        << "Without --output, --in-place or --check a single input is written to stdout.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--registry")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--registry expects a value");
            }
            args.registry_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "-o") || arg_eq(tok, "--output")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--output expects a value");
            }
            args.output_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--summary")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--summary expects a value");
            }
            args.summary_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--html")) {
            if (i + 1 >= argc) {
                throw std::runtime_error("--html expects a value");
            }
            args.html_path = std::filesystem::path(argv[++i]);
        } else if (arg_eq(tok, "--in-place")) {
            args.in_place = true;
        } else if (arg_eq(tok, "--check")) {
            args.check = true;
        } else if (arg_eq(tok, "-q") || arg_eq(tok, "--quiet")) {
            args.verbosity = Verbosity::Quiet;
        } else if (arg_eq(tok, "-v") || arg_eq(tok, "--verbose")) {
            args.verbosity = args.verbosity == Verbosity::Verbose ? Verbosity::Debug : Verbosity::Verbose;
        } else if (arg_eq(tok, "-vv")) {
            args.verbosity = Verbosity::Debug;
        } else if (!tok.empty() && tok.front() == '-') {
            throw std::runtime_error("Unknown option '" + std::string(tok) + "'");
        } else {
            args.files.emplace_back(std::string(tok));
        }
    }
    if (args.help) {
        return args;
    }

    if (args.files.empty()) {
        throw std::runtime_error("No input files");
    }
    const bool to_output = !args.output_path.empty();
    if (static_cast<int>(to_output) + static_cast<int>(args.in_place) + static_cast<int>(args.check) > 1) {
        throw std::runtime_error("--output, --in-place and --check are mutually exclusive");
    }
    if (!args.in_place && !args.check && args.files.size() != 1) {
        throw std::runtime_error("Several inputs need --in-place or --check");
    }
    return args;
}

void write_atomically(const std::filesystem::path& destination, const std::string& content) {
    auto temporary = destination;
    temporary += ".metacollapse.tmp";
    {
        std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("Unable to open output file: " + temporary.string());
        }
        output << content;
        output.close();
        if (!output) {
            throw std::runtime_error("Unable to write output file: " + temporary.string());
        }
    }
    std::filesystem::rename(temporary, destination);
}

void report(const FileOutcome& outcome, Verbosity verbosity) {
    for (const auto& diagnostic : outcome.diagnostics) {
        if (metacollapse::is_visible(diagnostic.severity, verbosity)) {
            std::cerr << metacollapse::format(diagnostic, outcome.source) << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        Transformer::Config config;
        if (args.registry_path) {
            config.registry = RegistryLoader{}.load(*args.registry_path);
        }
        const Transformer transformer(std::move(config));

        std::vector<FileOutcome> outcomes;
        bool any_failed = false;
        bool any_changed = false;
        for (const auto& file : args.files) {
            auto outcome = transformer.transform_file(file);
            report(outcome, args.verbosity);

            if (outcome.status == FileStatus::ParseFailed) {
                any_failed = true;
            } else if (outcome.status == FileStatus::Collapsed) {
                any_changed = true;
                if (args.in_place) {
                    write_atomically(file, *outcome.content);
                }
            }
            if (outcome.content && !args.in_place && !args.check) {
                if (!args.output_path.empty()) {
                    write_atomically(args.output_path, *outcome.content);
                } else {
                    std::cout << *outcome.content;
                }
            }
            outcomes.push_back(std::move(outcome));
        }

        ReportWriter writer;
        if (!args.summary_path.empty()) {
            writer.write_summary(args.summary_path, outcomes);
        }
        if (!args.html_path.empty()) {
            writer.write_detailed(args.html_path, outcomes);
        }

        if (args.verbosity != Verbosity::Quiet && (args.in_place || args.check)) {
            std::size_t collapsed = 0;
            std::size_t failed = 0;
            for (const auto& o : outcomes) {
                if (o.status == FileStatus::Collapsed) ++collapsed;
                else if (o.status == FileStatus::ParseFailed) ++failed;
            }
            std::cerr << "Files: " << outcomes.size() << "  collapsed: " << collapsed
                      << "  unchanged: " << (outcomes.size() - collapsed - failed)
                      << "  parse failures: " << failed << "\n";
        }

        if (any_failed || (args.check && any_changed)) {
            return 1;
        }
        return 0;
    } catch (const std::logic_error& ex) {
        std::cerr << "INTERNAL ERROR: " << ex.what() << "\n";
        return 3;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
