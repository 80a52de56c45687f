// =============================================================================
// redactor CLI - Command-Line Interface
// =============================================================================
//
// Usage:
//   redactor [global options] <command> [options]
//
// Commands:
//   redact      Redact a document and write the validated result
//   scan        Report what would be redacted, without writing output
//   status      Show detector availability
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   redactor redact contract.pdf -o contract.redacted.pdf
//   redactor -c redactor.yaml redact letter.docx --entities PERSON,EMAIL_ADDRESS
//   redactor scan --json letter.docx
//   redactor status
//
// =============================================================================

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>
#include <string>

#include "redactor/config.hpp"
#include "redactor/detect/detector_set.hpp"
#include "redactor/engine.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"
#include "redactor/report_json.hpp"
#include "redactor/staging.hpp"

namespace redactor::cli {
    int cmd_redact(int argc, char* argv[]);
    int cmd_scan(int argc, char* argv[]);
    int cmd_status(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define REDACTOR_VERSION_MAJOR 1
#define REDACTOR_VERSION_MINOR 0
#define REDACTOR_VERSION_PATCH 0
#define REDACTOR_VERSION_STRING "1.0.0"

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitSecurityViolation = 2;

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"redact",  "Redact a document and write the validated result", redactor::cli::cmd_redact},
    {"scan",    "Report detected entities without writing output", redactor::cli::cmd_scan},
    {"status",  "Show detector availability", redactor::cli::cmd_status},
    {"version", "Show version information", redactor::cli::cmd_version},
    {"help",    "Show this help message", redactor::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "redactor.yaml";
    std::string log_level;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace redactor::cli {

namespace {

RedactorConfig load_effective_config() {
    RedactorConfig config = load_config(g_options.config_file);

    if (!g_options.log_level.empty()) {
        LogLevel level;
        if (!parse_log_level(g_options.log_level, level)) {
            throw ConfigError("Unknown log level", g_options.log_level,
                              "Use trace, debug, info, warn, error, critical or off");
        }
        config.logging.level = level;
    } else if (g_options.verbose) {
        config.logging.level = LogLevel::DEBUG;
    } else if (g_options.quiet) {
        config.logging.level = LogLevel::ERROR;
    }

    init_logging(config.logging.level, config.logging.file);
    return config;
}

ByteBuffer read_document(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Cannot open input document", path);
    }
    return ByteBuffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string default_output_path(const std::string& input) {
    std::filesystem::path path(input);
    std::filesystem::path out = path.parent_path() / path.stem();
    out += ".redacted";
    out += path.extension();
    return out.string();
}

// Comma separated entity names; throws InvalidArgumentError on an unknown name
std::set<EntityType> parse_entity_list(const std::string& list) {
    std::set<EntityType> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto type = parse_entity_type(item);
        if (!type) {
            throw InvalidArgumentError("Unknown entity type", item);
        }
        out.insert(*type);
    }
    return out;
}

struct DocumentOptions {
    std::string input;
    std::string output;
    std::string report_file;
    bool json = false;
};

// Shared option parsing for redact / scan. Returns false on a usage error.
bool parse_document_options(int argc, char* argv[], const RedactorConfig& config,
                            DocumentOptions& opts, DocumentRequest& request) {
    request.detection = config.detection;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output = argv[++i];
        } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
            request.format = parse_document_format(argv[++i]);
            if (!request.format) {
                std::cerr << "Unknown format: " << argv[i] << "\n";
                return false;
            }
        } else if ((arg == "-e" || arg == "--entities") && i + 1 < argc) {
            request.detection.enterprise_entity_allowlist = parse_entity_list(argv[++i]);
        } else if (arg == "--report" && i + 1 < argc) {
            opts.report_file = argv[++i];
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--no-pattern") {
            request.detection.enable_pattern = false;
        } else if (arg == "--no-statistical") {
            request.detection.enable_statistical = false;
        } else if (arg == "--no-enterprise") {
            request.detection.enable_enterprise = false;
        } else if (!arg.empty() && arg[0] != '-' && opts.input.empty()) {
            opts.input = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (opts.input.empty()) {
        std::cerr << "Missing input document\n";
        return false;
    }
    request.filename = opts.input;
    request.bytes = read_document(opts.input);
    return true;
}

void print_report(const RedactionReport& report) {
    std::cout << "Format:            " << to_string(report.format) << "\n";
    std::cout << "Pages/sections:    " << report.pages_or_sections_processed << "\n";
    std::cout << "Blocks:            " << report.blocks_processed << "\n";
    std::cout << "Findings:          " << report.total_findings << "\n";
    for (const auto& [type, count] : report.entity_counts) {
        std::cout << "  " << to_string(type);
        for (size_t i = std::strlen(to_string(type)); i < 17; ++i) std::cout << ' ';
        std::cout << count << "\n";
    }
    if (report.final_state == DocumentState::Validated) {
        std::cout << "Tokens emitted:    " << report.tokens_emitted << "\n";
    }
    std::cout << "Methods used:     ";
    for (DetectionMethod m : report.methods_used) std::cout << " " << to_string(m);
    std::cout << "\n";
    if (report.reduced_coverage) {
        std::cout << "WARNING: reduced coverage, unavailable:";
        for (DetectionMethod m : report.degraded_methods) std::cout << " " << to_string(m);
        std::cout << "\n";
    }
    std::cout << "Confidence:        " << report.confidence_score << "\n";
}

int report_failure(const PipelineError& error, bool json) {
    if (json) {
        std::cout << error_to_json(error) << "\n";
    } else {
        std::cerr << "FAILED (" << to_string(error.kind) << " in " << to_string(error.failed_in)
                  << "): " << error.reason << "\n";
        if (error.kind == PipelineErrorKind::SecurityViolation) {
            std::cerr << "No output was written.\n";
        }
    }
    return error.kind == PipelineErrorKind::SecurityViolation ? kExitSecurityViolation : kExitError;
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text << "\n";
    if (!out) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot write report", path);
    }
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "redactor - Secure document redaction\n";
    std::cout << "Version " << REDACTOR_VERSION_STRING << "\n\n";
    std::cout << "Usage: redactor [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: redactor.yaml)\n";
    std::cout << "  -l, --log-level <lvl>   trace, debug, info, warn, error, critical, off\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nDocument Options (redact, scan):\n";
    std::cout << "  -o, --output <file>     Output path (default: <name>.redacted.<ext>)\n";
    std::cout << "  -f, --format <fmt>      pdf or docx (default: from extension / signature)\n";
    std::cout << "  -e, --entities <list>   Enterprise entity allowlist, comma separated\n";
    std::cout << "  --no-pattern            Disable pattern detection\n";
    std::cout << "  --no-statistical        Disable statistical detection\n";
    std::cout << "  --no-enterprise         Disable enterprise detection\n";
    std::cout << "  --report <file>         Write the JSON report to a file\n";
    std::cout << "  --json                  Print the report as JSON\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  REDACTOR_LOG_LEVEL, REDACTOR_LOG_FILE, REDACTOR_WORKERS, REDACTOR_STAGING_DIR,\n";
    std::cout << "  REDACTOR_NER_MODEL, REDACTOR_ENTERPRISE_PROFILE\n";
    std::cout << "\nExit status: 0 success, 1 error, 2 residual sensitive text (output discarded)\n";

    return kExitOk;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "redactor " << REDACTOR_VERSION_STRING << "\n";
    std::cout << "Formats: pdf, docx\n";
    return kExitOk;
}

// =============================================================================
// Status Command
// =============================================================================

int cmd_status(int argc, char* argv[]) {
    bool json = false;
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) json = true;
    }

    RedactorConfig config = load_effective_config();
    DetectorSet detectors = DetectorSet::from_config(config.models);
    auto status = detectors.status();

    if (json) {
        std::cout << status_to_json(status) << "\n";
        return kExitOk;
    }

    std::cout << "Detectors:\n";
    for (const auto& entry : status) {
        std::cout << "  " << entry.name;
        for (size_t i = entry.name.size(); i < 14; ++i) std::cout << ' ';
        std::cout << (entry.available ? "available    " : "UNAVAILABLE  ") << entry.source << "\n";
    }
    return kExitOk;
}

// =============================================================================
// Scan Command
// =============================================================================

int cmd_scan(int argc, char* argv[]) {
    RedactorConfig config = load_effective_config();

    DocumentOptions opts;
    DocumentRequest request;
    if (!parse_document_options(argc, argv, config, opts, request)) {
        return kExitError;
    }

    DetectorSet detectors = DetectorSet::from_config(config.models);
    RedactionEngine engine(detectors, config);
    RedactionOutcome outcome = engine.scan(request);
    if (!outcome) {
        return report_failure(outcome.error(), opts.json);
    }

    const RedactionReport& report = outcome.document().report;
    if (!opts.report_file.empty()) write_text_file(opts.report_file, report_to_json(report));
    if (opts.json) {
        std::cout << report_to_json(report) << "\n";
    } else {
        print_report(report);
    }
    return kExitOk;
}

// =============================================================================
// Redact Command
// =============================================================================

int cmd_redact(int argc, char* argv[]) {
    RedactorConfig config = load_effective_config();

    DocumentOptions opts;
    DocumentRequest request;
    if (!parse_document_options(argc, argv, config, opts, request)) {
        return kExitError;
    }
    if (opts.output.empty()) opts.output = default_output_path(opts.input);

    purge_stale_staging(config.pipeline.staging_dir, std::chrono::hours(config.pipeline.retention_hours));

    DetectorSet detectors = DetectorSet::from_config(config.models);
    RedactionEngine engine(detectors, config);
    RedactionOutcome outcome = engine.redact(request);
    if (!outcome) {
        return report_failure(outcome.error(), opts.json);
    }

    RedactedDocument document = outcome.take_document();
    deliver_document(document, config.pipeline, opts.output);

    if (!opts.report_file.empty()) write_text_file(opts.report_file, report_to_json(document.report));
    if (opts.json) {
        std::cout << report_to_json(document.report) << "\n";
    } else {
        print_report(document.report);
        std::cout << "Output:            " << opts.output << "\n";
    }
    return kExitOk;
}

}  // namespace redactor::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            g_options.log_level = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        redactor::cli::cmd_help(0, nullptr);
        return kExitError;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const redactor::RedactorException& e) {
                std::cerr << e.what() << "\n";
                return kExitError;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return kExitError;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'redactor help' for usage.\n";
    return kExitError;
}
