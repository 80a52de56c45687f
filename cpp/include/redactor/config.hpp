#pragma once

#include <cstdint>
#include <string>

#include "redactor/logging.hpp"
#include "redactor/types.hpp"

namespace redactor {

enum class TokenStyle : uint8_t {
    LengthCappedMask,   // mask sized min(len, cap): leaks approximate length
    FixedWidth          // constant-width mask, length is not revealed
};

const char* to_string(TokenStyle style) noexcept;

struct ModelConfig {
    std::string ner_model_path;             // statistical method; empty = unavailable
    std::string enterprise_profile_path;    // enterprise method; empty = unavailable
};

struct RedactionConfig {
    TokenStyle token_style = TokenStyle::LengthCappedMask;
    uint32_t mask_cap = 20;
    uint32_t fixed_mask_width = 8;
};

struct PipelineConfig {
    uint32_t worker_threads = 4;
    uint64_t max_document_bytes = 100ull * 1024 * 1024;
    std::string staging_dir = ".redactor-staging";
    uint32_t retention_hours = 24;
};

struct PdfLayoutConfig {
    double font_size = 11.0;
    double min_font_size = 5.0;
    double margin = 50.0;
    double line_spacing = 2.0;     // extra leading in points
};

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;
};

struct RedactorConfig {
    DetectionConfig detection;
    ModelConfig models;
    RedactionConfig redaction;
    PipelineConfig pipeline;
    PdfLayoutConfig pdf;
    LoggingConfig logging;
    std::string config_file;
};

/**
 * Load configuration: defaults, then the YAML file (if it exists), then
 * REDACTOR_* environment overrides.
 *
 * A missing file yields defaults. A malformed file or an out-of-range value
 * raises ConfigError.
 */
RedactorConfig load_config(const std::string& config_file = "redactor.yaml");

// Parse configuration from YAML text (no environment overrides applied)
RedactorConfig parse_config(const std::string& yaml_text);

// Apply REDACTOR_* environment variables on top of an existing configuration
void apply_env_overrides(RedactorConfig& config);

// Throws ConfigError describing the first invalid value
void validate_config(const RedactorConfig& config);

} // namespace redactor
