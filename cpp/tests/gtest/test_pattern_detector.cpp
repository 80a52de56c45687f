// =============================================================================
// Pattern Detector Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/detect/pattern_detector.hpp"

#include <algorithm>

using namespace redactor;

class PatternDetectorTest : public ::testing::Test {
protected:
    FindingSet scan(const std::string& text) {
        auto result = detector_.detect(text, DetectionConfig{});
        EXPECT_TRUE(result.is_available());
        for (const auto& f : result.findings) {
            EXPECT_EQ(text.substr(f.start, f.end - f.start), f.text);
            EXPECT_EQ(f.method, DetectionMethod::Pattern);
        }
        return result.findings;
    }

    static size_t count(const FindingSet& findings, EntityType type, const std::string& text) {
        return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
            [&](const Finding& f) { return f.entity_type == type && f.text == text; }));
    }

    PatternDetector detector_;
};

TEST_F(PatternDetectorTest, AlwaysAvailable) {
    EXPECT_TRUE(detector_.available());
    EXPECT_EQ(detector_.method(), DetectionMethod::Pattern);
    EXPECT_EQ(detector_.supported_types().size(), PatternDetector::rules().size());
}

TEST_F(PatternDetectorTest, EmailAddress) {
    auto f = scan("Reach jane.doe@corp.example.org today");
    EXPECT_EQ(count(f, EntityType::EMAIL_ADDRESS, "jane.doe@corp.example.org"), 1u);
}

TEST_F(PatternDetectorTest, PhoneNumber) {
    auto f = scan("Call (555) 123-4567 now");
    EXPECT_EQ(count(f, EntityType::PHONE_NUMBER, "(555) 123-4567"), 1u);
}

TEST_F(PatternDetectorTest, SocialSecurityNumber) {
    auto f = scan("SSN 123-45-6789.");
    EXPECT_EQ(count(f, EntityType::SSN, "123-45-6789"), 1u);
}

TEST_F(PatternDetectorTest, CreditCard) {
    auto f = scan("Card 4111-1111-1111-1111 on file");
    EXPECT_EQ(count(f, EntityType::CREDIT_CARD, "4111-1111-1111-1111"), 1u);
}

TEST_F(PatternDetectorTest, IpAddressAndUrl) {
    auto f = scan("host 192.168.1.20 serves https://example.com/path?q=1 today");
    EXPECT_EQ(count(f, EntityType::IP_ADDRESS, "192.168.1.20"), 1u);
    EXPECT_EQ(count(f, EntityType::URL, "https://example.com/path?q=1"), 1u);
}

TEST_F(PatternDetectorTest, UrlStopsBeforeSentencePunctuation) {
    auto f = scan("See http://acme.com. Or (https://x.io/a?b=c), then https://y.org/p;");
    EXPECT_EQ(count(f, EntityType::URL, "http://acme.com"), 1u);
    EXPECT_EQ(count(f, EntityType::URL, "https://x.io/a?b=c"), 1u);
    EXPECT_EQ(count(f, EntityType::URL, "https://y.org/p"), 1u);
}

TEST_F(PatternDetectorTest, DateOfBirthPassportAndPlate) {
    auto f = scan("born 04/12/1985, passport X12345678, plate ABC-1234");
    EXPECT_EQ(count(f, EntityType::DATE_OF_BIRTH, "04/12/1985"), 1u);
    EXPECT_EQ(count(f, EntityType::PASSPORT_NUMBER, "X12345678"), 1u);
    EXPECT_EQ(count(f, EntityType::LICENSE_PLATE, "ABC-1234"), 1u);
}

TEST_F(PatternDetectorTest, EveryOccurrenceReported) {
    const std::string text = "a.b@corp.io wrote to a.b@corp.io";
    auto f = scan(text);
    ASSERT_EQ(count(f, EntityType::EMAIL_ADDRESS, "a.b@corp.io"), 2u);

    std::vector<size_t> starts;
    for (const auto& finding : f) {
        if (finding.entity_type == EntityType::EMAIL_ADDRESS) starts.push_back(finding.start);
    }
    std::sort(starts.begin(), starts.end());
    EXPECT_EQ(starts[0], 0u);
    EXPECT_EQ(starts[1], text.rfind("a.b@corp.io"));
}

TEST_F(PatternDetectorTest, PlainProseHasNoFindings) {
    EXPECT_TRUE(scan("The quarterly meeting moved to the large room.").empty());
    EXPECT_TRUE(scan("").empty());
}
