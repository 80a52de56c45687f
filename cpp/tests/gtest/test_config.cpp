// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/config.hpp"
#include "redactor/error.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace redactor;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnv) unsetenv(name);
    }

    void TearDown() override {
        for (const char* name : kEnv) unsetenv(name);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& text) {
        std::filesystem::create_directories(dir_);
        auto path = dir_ / name;
        std::ofstream(path) << text;
        return path.string();
    }

    static constexpr const char* kEnv[] = {
        "REDACTOR_LOG_LEVEL", "REDACTOR_LOG_FILE", "REDACTOR_WORKERS", "REDACTOR_STAGING_DIR",
        "REDACTOR_NER_MODEL", "REDACTOR_ENTERPRISE_PROFILE"};

    std::filesystem::path dir_ = std::filesystem::temp_directory_path() / "redactor_config_test";
};

TEST_F(ConfigTest, DefaultsWhenFileMissing) {
    RedactorConfig config = load_config((dir_ / "missing.yaml").string());
    EXPECT_TRUE(config.detection.enable_pattern);
    EXPECT_TRUE(config.detection.enable_statistical);
    EXPECT_TRUE(config.detection.enable_enterprise);
    EXPECT_TRUE(config.detection.enterprise_entity_allowlist.empty());
    EXPECT_EQ(config.redaction.token_style, TokenStyle::LengthCappedMask);
    EXPECT_EQ(config.redaction.mask_cap, 20u);
    EXPECT_EQ(config.pipeline.max_document_bytes, 100ull * 1024 * 1024);
    EXPECT_EQ(config.pipeline.retention_hours, 24u);
    EXPECT_EQ(config.logging.level, LogLevel::INFO);
    EXPECT_TRUE(config.models.ner_model_path.empty());
}

TEST_F(ConfigTest, ParsesEverySection) {
    RedactorConfig config = parse_config(R"(
detection:
  enable_statistical: false
  enterprise_entity_allowlist: [CREDIT_CARD, iban_code]
redaction:
  token_style: fixed_width
  fixed_mask_width: 6
pipeline:
  worker_threads: 2
  retention_hours: 1
pdf:
  font_size: 10
  min_font_size: 6
logging:
  level: debug
)");
    EXPECT_FALSE(config.detection.enable_statistical);
    EXPECT_EQ(config.detection.enterprise_entity_allowlist,
              (std::set<EntityType>{EntityType::CREDIT_CARD, EntityType::IBAN_CODE}));
    EXPECT_EQ(config.redaction.token_style, TokenStyle::FixedWidth);
    EXPECT_EQ(config.redaction.fixed_mask_width, 6u);
    EXPECT_EQ(config.pipeline.worker_threads, 2u);
    EXPECT_EQ(config.pipeline.retention_hours, 1u);
    EXPECT_DOUBLE_EQ(config.pdf.font_size, 10.0);
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
}

TEST_F(ConfigTest, ModelPathsResolveAgainstConfigDirectory) {
    const std::string path = write_file("redactor.yaml",
        "models:\n  ner_model: models/ner.yaml\n  enterprise_profile: /abs/profile.yaml\n");
    RedactorConfig config = load_config(path);
    EXPECT_EQ(config.models.ner_model_path, (dir_ / "models/ner.yaml").lexically_normal().string());
    EXPECT_EQ(config.models.enterprise_profile_path, "/abs/profile.yaml");
}

TEST_F(ConfigTest, InvalidValuesRaiseConfigError) {
    EXPECT_THROW(parse_config("redaction:\n  token_style: sparkle\n"), ConfigError);
    EXPECT_THROW(parse_config("detection:\n  enterprise_entity_allowlist: [SHOE_SIZE]\n"), ConfigError);
    EXPECT_THROW(parse_config("pipeline:\n  worker_threads: 0\n"), ConfigError);
    EXPECT_THROW(parse_config("pdf:\n  font_size: 4\n  min_font_size: 5\n"), ConfigError);
    EXPECT_THROW(parse_config("logging:\n  level: chatty\n"), ConfigError);
    EXPECT_THROW(parse_config(
        "detection:\n  enable_pattern: false\n  enable_statistical: false\n  enable_enterprise: false\n"),
        ConfigError);
}

TEST_F(ConfigTest, MalformedYamlRaisesConfigError) {
    EXPECT_THROW(parse_config("detection: [unclosed"), ConfigError);
    const std::string path = write_file("broken.yaml", "pipeline:\n  worker_threads: [1, 2\n");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    const std::string path = write_file("redactor.yaml", "pipeline:\n  worker_threads: 2\n");
    setenv("REDACTOR_WORKERS", "7", 1);
    setenv("REDACTOR_LOG_LEVEL", "warn", 1);
    setenv("REDACTOR_NER_MODEL", "/models/ner.yaml", 1);

    RedactorConfig config = load_config(path);
    EXPECT_EQ(config.pipeline.worker_threads, 7u);
    EXPECT_EQ(config.logging.level, LogLevel::WARNING);
    EXPECT_EQ(config.models.ner_model_path, "/models/ner.yaml");
}

TEST_F(ConfigTest, InvalidEnvironmentValueRaisesConfigError) {
    setenv("REDACTOR_WORKERS", "many", 1);
    EXPECT_THROW(load_config((dir_ / "missing.yaml").string()), ConfigError);
}
