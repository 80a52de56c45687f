#include "redactor/config.hpp"
#include "redactor/error.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace redactor {

namespace {

std::string resolve_relative(const std::string& path, const fs::path& base_dir) {
    if (path.empty() || base_dir.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return path;
    return (base_dir / p).lexically_normal().string();
}

TokenStyle parse_token_style(const std::string& name) {
    if (name == "length_capped" || name == "length_capped_mask") return TokenStyle::LengthCappedMask;
    if (name == "fixed_width" || name == "fixed") return TokenStyle::FixedWidth;
    throw ConfigError("Unknown token style '" + name + "'", "redaction.token_style",
                      "Use 'length_capped' or 'fixed_width'");
}

void apply_yaml(RedactorConfig& config, const YAML::Node& yaml, const fs::path& base_dir) {
    if (const auto& det = yaml["detection"]) {
        if (det["enable_pattern"]) config.detection.enable_pattern = det["enable_pattern"].as<bool>();
        if (det["enable_statistical"]) config.detection.enable_statistical = det["enable_statistical"].as<bool>();
        if (det["enable_enterprise"]) config.detection.enable_enterprise = det["enable_enterprise"].as<bool>();
        if (const auto& allow = det["enterprise_entity_allowlist"]) {
            config.detection.enterprise_entity_allowlist.clear();
            for (const auto& item : allow) {
                const auto name = item.as<std::string>();
                auto type = parse_entity_type(name);
                if (!type) {
                    throw ConfigError("Unknown entity type '" + name + "'",
                                      "detection.enterprise_entity_allowlist");
                }
                config.detection.enterprise_entity_allowlist.insert(*type);
            }
        }
    }

    if (const auto& models = yaml["models"]) {
        if (models["ner_model"]) {
            config.models.ner_model_path = resolve_relative(models["ner_model"].as<std::string>(), base_dir);
        }
        if (models["enterprise_profile"]) {
            config.models.enterprise_profile_path =
                resolve_relative(models["enterprise_profile"].as<std::string>(), base_dir);
        }
    }

    if (const auto& red = yaml["redaction"]) {
        if (red["token_style"]) config.redaction.token_style = parse_token_style(red["token_style"].as<std::string>());
        if (red["mask_cap"]) config.redaction.mask_cap = red["mask_cap"].as<uint32_t>();
        if (red["fixed_mask_width"]) config.redaction.fixed_mask_width = red["fixed_mask_width"].as<uint32_t>();
    }

    if (const auto& pipe = yaml["pipeline"]) {
        if (pipe["worker_threads"]) config.pipeline.worker_threads = pipe["worker_threads"].as<uint32_t>();
        if (pipe["max_document_bytes"]) config.pipeline.max_document_bytes = pipe["max_document_bytes"].as<uint64_t>();
        if (pipe["staging_dir"]) config.pipeline.staging_dir = resolve_relative(pipe["staging_dir"].as<std::string>(), base_dir);
        if (pipe["retention_hours"]) config.pipeline.retention_hours = pipe["retention_hours"].as<uint32_t>();
    }

    if (const auto& pdf = yaml["pdf"]) {
        if (pdf["font_size"]) config.pdf.font_size = pdf["font_size"].as<double>();
        if (pdf["min_font_size"]) config.pdf.min_font_size = pdf["min_font_size"].as<double>();
        if (pdf["margin"]) config.pdf.margin = pdf["margin"].as<double>();
        if (pdf["line_spacing"]) config.pdf.line_spacing = pdf["line_spacing"].as<double>();
    }

    if (const auto& log = yaml["logging"]) {
        if (log["level"]) {
            const auto name = log["level"].as<std::string>();
            if (!parse_log_level(name, config.logging.level)) {
                throw ConfigError("Unknown log level '" + name + "'", "logging.level");
            }
        }
        if (log["file"]) config.logging.file = resolve_relative(log["file"].as<std::string>(), base_dir);
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

const char* to_string(TokenStyle style) noexcept {
    switch (style) {
        case TokenStyle::LengthCappedMask: return "length_capped";
        case TokenStyle::FixedWidth:       return "fixed_width";
    }
    return "unknown";
}

RedactorConfig parse_config(const std::string& yaml_text) {
    RedactorConfig config;
    try {
        apply_yaml(config, YAML::Load(yaml_text), fs::path());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed configuration", e.what());
    }
    validate_config(config);
    return config;
}

RedactorConfig load_config(const std::string& config_file) {
    RedactorConfig config;
    config.config_file = config_file;

    if (!config_file.empty() && fs::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);
            apply_yaml(config, yaml, fs::path(config_file).parent_path());
        } catch (const YAML::Exception& e) {
            throw ConfigError("Malformed configuration file", config_file + ": " + e.what());
        }
        LOG_DEBUG("Loaded configuration from file: ", config_file);
    } else if (!config_file.empty()) {
        LOG_DEBUG("Configuration file not found, using defaults: ", config_file);
    }

    apply_env_overrides(config);
    validate_config(config);
    return config;
}

void apply_env_overrides(RedactorConfig& config) {
    if (const char* v = env("REDACTOR_LOG_LEVEL")) {
        if (!parse_log_level(v, config.logging.level)) {
            throw ConfigError(std::string("Unknown log level '") + v + "'", "REDACTOR_LOG_LEVEL");
        }
    }
    if (const char* v = env("REDACTOR_LOG_FILE")) config.logging.file = v;
    if (const char* v = env("REDACTOR_STAGING_DIR")) config.pipeline.staging_dir = v;
    if (const char* v = env("REDACTOR_NER_MODEL")) config.models.ner_model_path = v;
    if (const char* v = env("REDACTOR_ENTERPRISE_PROFILE")) config.models.enterprise_profile_path = v;
    if (const char* v = env("REDACTOR_WORKERS")) {
        try {
            config.pipeline.worker_threads = static_cast<uint32_t>(std::stoul(v));
        } catch (const std::exception&) {
            throw ConfigError(std::string("Invalid worker count '") + v + "'", "REDACTOR_WORKERS");
        }
    }
}

void validate_config(const RedactorConfig& config) {
    if (config.pipeline.worker_threads == 0) {
        throw ConfigError("worker_threads must be at least 1", "pipeline.worker_threads");
    }
    if (config.pipeline.max_document_bytes == 0) {
        throw ConfigError("max_document_bytes must be positive", "pipeline.max_document_bytes");
    }
    if (config.pipeline.staging_dir.empty()) {
        throw ConfigError("staging_dir must not be empty", "pipeline.staging_dir");
    }
    if (config.redaction.mask_cap == 0 || config.redaction.fixed_mask_width == 0) {
        throw ConfigError("mask widths must be positive", "redaction");
    }
    if (config.pdf.min_font_size <= 0.0 || config.pdf.font_size < config.pdf.min_font_size) {
        throw ConfigError("font_size must be >= min_font_size > 0", "pdf");
    }
    if (config.pdf.margin < 0.0) {
        throw ConfigError("margin must not be negative", "pdf.margin");
    }
    if (!config.detection.enable_pattern && !config.detection.enable_statistical &&
        !config.detection.enable_enterprise) {
        throw ConfigError("At least one detection method must be enabled", "detection");
    }
}

} // namespace redactor
