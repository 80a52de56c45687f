// =============================================================================
// Detector Set Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/detect/detector_set.hpp"
#include "redactor/error.hpp"
#include "test_documents.hpp"

#include <algorithm>

using namespace redactor;

namespace {

// Reports a fixed list of findings regardless of input
class FixedDetector : public Detector {
public:
    FixedDetector(DetectionMethod method, FindingSet findings, bool available = true)
        : method_(method), findings_(std::move(findings)), available_(available) {}

    std::string name() const override { return "fixed"; }
    DetectionMethod method() const override { return method_; }
    bool available() const override { return available_; }

    DetectorResult detect(std::string_view, const DetectionConfig&) const override {
        if (!available_) return DetectorResult::unavailable();
        return DetectorResult::ok(findings_);
    }

private:
    DetectionMethod method_;
    FindingSet findings_;
    bool available_;
};

Finding make(EntityType type, size_t start, size_t end, DetectionMethod method) {
    Finding f;
    f.entity_type = type;
    f.start = start;
    f.end = end;
    f.text = std::string(end - start, 'x');
    f.confidence = 0.8;
    f.method = method;
    return f;
}

} // namespace

class DetectorSetTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ner_ = NerModel::load(fixtures::models_dir() + "/ner_lexicon.yaml");
        profile_ = EnterpriseProfile::load(fixtures::models_dir() + "/enterprise_profile.yaml");
    }

    static void TearDownTestSuite() {
        ner_.reset();
        profile_.reset();
    }

    static std::shared_ptr<const NerModel> ner_;
    static std::shared_ptr<const EnterpriseProfile> profile_;
};

std::shared_ptr<const NerModel> DetectorSetTest::ner_;
std::shared_ptr<const EnterpriseProfile> DetectorSetTest::profile_;

TEST_F(DetectorSetTest, AllMethodsMergeIntoOneSet) {
    DetectorSet detectors(ner_, profile_);
    EXPECT_EQ(detectors.size(), 3u);

    const std::string text = "Contact john@example.com or 555-123-4567";
    BlockDetection result = detectors.detect(text, DetectionConfig{});

    ASSERT_EQ(result.findings.size(), 2u);
    EXPECT_EQ(result.findings[0].entity_type, EntityType::EMAIL_ADDRESS);
    EXPECT_EQ(result.findings[0].text, "john@example.com");
    EXPECT_EQ(result.findings[1].entity_type, EntityType::PHONE_NUMBER);
    EXPECT_EQ(result.findings[1].text, "555-123-4567");
    // identical spans resolve to the enterprise finding
    EXPECT_EQ(result.findings[0].method, DetectionMethod::Enterprise);
    EXPECT_EQ(result.findings[1].method, DetectionMethod::Enterprise);

    EXPECT_EQ(result.methods_used.size(), 3u);
    EXPECT_TRUE(result.degraded_methods.empty());
}

TEST_F(DetectorSetTest, MissingProfileDegradesEnterprise) {
    DetectorSet detectors(ner_, nullptr);
    EXPECT_FALSE(detectors.is_available(DetectionMethod::Enterprise));
    EXPECT_TRUE(detectors.is_available(DetectionMethod::Statistical));

    BlockDetection result = detectors.detect("Contact john@example.com", DetectionConfig{});
    EXPECT_EQ(result.degraded_methods, std::set<DetectionMethod>{DetectionMethod::Enterprise});
    EXPECT_EQ(result.methods_used,
              (std::set<DetectionMethod>{DetectionMethod::Pattern, DetectionMethod::Statistical}));
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].method, DetectionMethod::Pattern);
}

TEST_F(DetectorSetTest, DisabledMethodIsNotDegradation) {
    DetectorSet detectors(ner_, nullptr);
    DetectionConfig config;
    config.enable_enterprise = false;
    config.enable_statistical = false;

    BlockDetection result = detectors.detect("Dr John Smith", config);
    EXPECT_TRUE(result.degraded_methods.empty());
    EXPECT_EQ(result.methods_used, std::set<DetectionMethod>{DetectionMethod::Pattern});
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(DetectorSetTest, StatusDescribesSources) {
    DetectorSet detectors(ner_, profile_);
    auto entries = detectors.status();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].source, "built-in");
    EXPECT_EQ(entries[1].source, "ner-lexicon-en v1.2");
    EXPECT_EQ(entries[2].source, "enterprise-default v2.0");
    for (const auto& entry : entries) EXPECT_TRUE(entry.available);
}

TEST_F(DetectorSetTest, FromConfigReportsLoadFailures) {
    ModelConfig models;
    models.ner_model_path = "/nonexistent/ner.yaml";

    DetectorSet detectors = DetectorSet::from_config(models);
    EXPECT_TRUE(detectors.is_available(DetectionMethod::Pattern));
    EXPECT_FALSE(detectors.is_available(DetectionMethod::Statistical));
    EXPECT_FALSE(detectors.is_available(DetectionMethod::Enterprise));

    auto entries = detectors.status();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].source, "NER model file not found");
    EXPECT_EQ(entries[2].source, "no profile configured");
}

TEST_F(DetectorSetTest, FromConfigLoadsBothModels) {
    ModelConfig models;
    models.ner_model_path = fixtures::models_dir() + "/ner_lexicon.yaml";
    models.enterprise_profile_path = fixtures::models_dir() + "/enterprise_profile.yaml";

    DetectorSet detectors = DetectorSet::from_config(models);
    EXPECT_TRUE(detectors.is_available(DetectionMethod::Statistical));
    EXPECT_TRUE(detectors.is_available(DetectionMethod::Enterprise));
}

TEST_F(DetectorSetTest, CustomDetectorsAreMerged) {
    std::vector<std::unique_ptr<Detector>> list;
    list.push_back(std::make_unique<FixedDetector>(DetectionMethod::Pattern, FindingSet{
        make(EntityType::PHONE_NUMBER, 0, 12, DetectionMethod::Pattern)}));
    list.push_back(std::make_unique<FixedDetector>(DetectionMethod::Enterprise, FindingSet{
        make(EntityType::PERSON, 0, 20, DetectionMethod::Enterprise)}));
    list.push_back(std::make_unique<FixedDetector>(DetectionMethod::Statistical, FindingSet{}, false));

    DetectorSet detectors(std::move(list));
    BlockDetection result = detectors.detect(std::string(24, ' '), DetectionConfig{});

    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].entity_type, EntityType::PERSON);
    EXPECT_EQ(result.degraded_methods, std::set<DetectionMethod>{DetectionMethod::Statistical});
}

TEST_F(DetectorSetTest, NullDetectorRejected) {
    std::vector<std::unique_ptr<Detector>> list;
    list.push_back(nullptr);
    EXPECT_THROW(DetectorSet(std::move(list)), InvalidArgumentError);
}
