// =============================================================================
// Enterprise Detector Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/detect/enterprise_detector.hpp"
#include "redactor/error.hpp"
#include "test_documents.hpp"

#include <algorithm>

using namespace redactor;

class EnterpriseDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile_ = EnterpriseProfile::load(fixtures::models_dir() + "/enterprise_profile.yaml");
    }

    static const Finding* find(const FindingSet& findings, EntityType type, const std::string& text) {
        auto it = std::find_if(findings.begin(), findings.end(),
            [&](const Finding& f) { return f.entity_type == type && f.text == text; });
        return it == findings.end() ? nullptr : &*it;
    }

    std::shared_ptr<const EnterpriseProfile> profile_;
};

TEST_F(EnterpriseDetectorTest, LuhnChecksum) {
    EXPECT_TRUE(EnterpriseDetector::luhn_valid("4111111111111111"));
    EXPECT_TRUE(EnterpriseDetector::luhn_valid("5500005555555559"));
    EXPECT_FALSE(EnterpriseDetector::luhn_valid("4111111111111112"));
    EXPECT_FALSE(EnterpriseDetector::luhn_valid("4111"));
    EXPECT_FALSE(EnterpriseDetector::luhn_valid("4111x11111111111"));
}

TEST_F(EnterpriseDetectorTest, SsnStructure) {
    EXPECT_TRUE(EnterpriseDetector::ssn_valid("123", "45", "6789"));
    EXPECT_FALSE(EnterpriseDetector::ssn_valid("000", "45", "6789"));
    EXPECT_FALSE(EnterpriseDetector::ssn_valid("666", "45", "6789"));
    EXPECT_FALSE(EnterpriseDetector::ssn_valid("912", "45", "6789"));
    EXPECT_FALSE(EnterpriseDetector::ssn_valid("123", "00", "6789"));
    EXPECT_FALSE(EnterpriseDetector::ssn_valid("123", "45", "0000"));
}

TEST_F(EnterpriseDetectorTest, Ipv4Range) {
    EXPECT_TRUE(EnterpriseDetector::ipv4_valid("192.168.0.1"));
    EXPECT_TRUE(EnterpriseDetector::ipv4_valid("0.0.0.0"));
    EXPECT_FALSE(EnterpriseDetector::ipv4_valid("256.1.1.1"));
    EXPECT_FALSE(EnterpriseDetector::ipv4_valid("1.2.3"));
    EXPECT_FALSE(EnterpriseDetector::ipv4_valid("1..2.3"));
}

TEST_F(EnterpriseDetectorTest, IbanMod97) {
    EXPECT_TRUE(EnterpriseDetector::iban_valid("GB82WEST12345698765432"));
    EXPECT_TRUE(EnterpriseDetector::iban_valid("DE89370400440532013000"));
    EXPECT_FALSE(EnterpriseDetector::iban_valid("GB82WEST12345698765431"));
    EXPECT_FALSE(EnterpriseDetector::iban_valid("GB82"));
}

TEST_F(EnterpriseDetectorTest, DetectsValidatedIdentifiers) {
    EnterpriseDetector detector(profile_);
    const std::string text =
        "Card 4111 1111 1111 1111, SSN 123-45-6789, IBAN GB82 WEST 1234 5698 7654 32, host 10.0.0.1.";
    auto result = detector.detect(text, DetectionConfig{});
    ASSERT_TRUE(result.is_available());

    const Finding* card = find(result.findings, EntityType::CREDIT_CARD, "4111 1111 1111 1111");
    ASSERT_NE(card, nullptr);
    EXPECT_DOUBLE_EQ(card->confidence, 0.99);
    EXPECT_EQ(card->method, DetectionMethod::Enterprise);
    EXPECT_EQ(text.substr(card->start, card->end - card->start), card->text);

    EXPECT_NE(find(result.findings, EntityType::SSN, "123-45-6789"), nullptr);
    EXPECT_NE(find(result.findings, EntityType::IBAN_CODE, "GB82 WEST 1234 5698 7654 32"), nullptr);
    EXPECT_NE(find(result.findings, EntityType::IP_ADDRESS, "10.0.0.1"), nullptr);
}

TEST_F(EnterpriseDetectorTest, RejectsStructurallyInvalidCandidates) {
    EnterpriseDetector detector(profile_);
    auto result = detector.detect("Card 4111 1111 1111 1112, SSN 000-12-3456, host 300.1.1.1",
                                  DetectionConfig{});
    for (const auto& f : result.findings) {
        EXPECT_NE(f.entity_type, EntityType::CREDIT_CARD);
        EXPECT_NE(f.entity_type, EntityType::SSN);
        EXPECT_NE(f.entity_type, EntityType::IP_ADDRESS);
    }
}

TEST_F(EnterpriseDetectorTest, AllowlistRestrictsEntities) {
    EnterpriseDetector detector(profile_);
    DetectionConfig config;
    config.enterprise_entity_allowlist = {EntityType::CREDIT_CARD};

    EXPECT_EQ(detector.effective_entities(config), config.enterprise_entity_allowlist);
    EXPECT_EQ(detector.effective_entities(DetectionConfig{}), profile_->default_entities);

    auto result = detector.detect("Card 4111 1111 1111 1111, SSN 123-45-6789", config);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].entity_type, EntityType::CREDIT_CARD);
}

TEST_F(EnterpriseDetectorTest, PhoneContextRaisesConfidence) {
    EnterpriseDetector detector(profile_);

    auto with_context = detector.detect("Call me on 555-123-4567", DetectionConfig{});
    const Finding* boosted = find(with_context.findings, EntityType::PHONE_NUMBER, "555-123-4567");
    ASSERT_NE(boosted, nullptr);
    EXPECT_NEAR(boosted->confidence, 0.95, 1e-9);

    auto without = detector.detect("Reference 555-123-4567", DetectionConfig{});
    const Finding* plain = find(without.findings, EntityType::PHONE_NUMBER, "555-123-4567");
    ASSERT_NE(plain, nullptr);
    EXPECT_NEAR(plain->confidence, 0.6, 1e-9);
}

TEST_F(EnterpriseDetectorTest, PersonDenyListMatchesWholeWords) {
    auto profile = EnterpriseProfile::parse(R"(
default_entities: [PERSON]
persons:
  deny_list: ["Jane Roe"]
)");
    EnterpriseDetector detector(profile);
    const std::string text = "Memo from JANE ROE and Jane Roeberg";
    auto result = detector.detect(text, DetectionConfig{});
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].text, "JANE ROE");
    EXPECT_EQ(result.findings[0].start, text.find("JANE ROE"));
}

TEST_F(EnterpriseDetectorTest, NullProfileIsUnavailable) {
    EnterpriseDetector detector(nullptr);
    EXPECT_FALSE(detector.available());
    EXPECT_TRUE(detector.effective_entities(DetectionConfig{}).empty());
    EXPECT_EQ(detector.detect("4111 1111 1111 1111", DetectionConfig{}).status, DetectorStatus::Unavailable);
}

TEST_F(EnterpriseDetectorTest, InvalidProfilesRaiseModelLoadError) {
    EXPECT_THROW(EnterpriseProfile::load("/nonexistent/profile.yaml"), ModelLoadError);
    EXPECT_THROW(EnterpriseProfile::parse("default_entities: []\n"), ModelLoadError);
    EXPECT_THROW(EnterpriseProfile::parse("default_entities: [SHOE_SIZE]\n"), ModelLoadError);
    EXPECT_THROW(EnterpriseProfile::parse("default_entities: [SSN\n"), ModelLoadError);
}
