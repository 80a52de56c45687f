// =============================================================================
// Statistical (Lexicon NER) Detector Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/detect/statistical_detector.hpp"
#include "redactor/error.hpp"
#include "test_documents.hpp"

#include <algorithm>

using namespace redactor;

class StatisticalDetectorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        model_ = NerModel::load(fixtures::models_dir() + "/ner_lexicon.yaml");
    }

    static void TearDownTestSuite() {
        model_.reset();
    }

    FindingSet scan(const std::string& text) {
        StatisticalDetector detector(model_);
        auto result = detector.detect(text, DetectionConfig{});
        EXPECT_TRUE(result.is_available());
        return result.findings;
    }

    static bool has(const FindingSet& findings, EntityType type, const std::string& text) {
        return std::any_of(findings.begin(), findings.end(),
            [&](const Finding& f) { return f.entity_type == type && f.text == text; });
    }

    static std::shared_ptr<const NerModel> model_;
};

std::shared_ptr<const NerModel> StatisticalDetectorTest::model_;

TEST_F(StatisticalDetectorTest, ModelLoads) {
    ASSERT_NE(model_, nullptr);
    EXPECT_EQ(model_->name, "ner-lexicon-en");
    EXPECT_DOUBLE_EQ(model_->threshold, 0.6);
    EXPECT_TRUE(model_->first_names.count("john"));
    EXPECT_TRUE(model_->person_titles.count("dr"));
}

TEST_F(StatisticalDetectorTest, PersonAfterTitleExcludesTitle) {
    auto f = scan("Please ask Dr John Smith.");
    EXPECT_TRUE(has(f, EntityType::PERSON, "John Smith"));
    EXPECT_FALSE(has(f, EntityType::PERSON, "Please"));
}

TEST_F(StatisticalDetectorTest, TitleWithPeriodStillCues) {
    auto f = scan("Contact Dr. Anna Lee today.");
    EXPECT_TRUE(has(f, EntityType::PERSON, "Anna Lee"));
}

TEST_F(StatisticalDetectorTest, SentenceInitialKnownName) {
    auto f = scan("John Smith met Mary Jones.");
    EXPECT_TRUE(has(f, EntityType::PERSON, "John Smith"));
    EXPECT_TRUE(has(f, EntityType::PERSON, "Mary Jones"));
}

TEST_F(StatisticalDetectorTest, OrganizationFromGazetteerAndSuffix) {
    auto f = scan("She works at Acme Corporation today.");
    EXPECT_TRUE(has(f, EntityType::ORGANIZATION, "Acme Corporation"));
}

TEST_F(StatisticalDetectorTest, LocationAfterPreposition) {
    auto f = scan("He moved to Paris last year.");
    EXPECT_TRUE(has(f, EntityType::LOCATION, "Paris"));
}

TEST_F(StatisticalDetectorTest, DatesTimesAndMoney) {
    auto f = scan("Signed on March 5, 2024 at 10:30 AM for $1,200.50 total.");
    EXPECT_TRUE(has(f, EntityType::DATE_TIME, "March 5, 2024"));
    EXPECT_TRUE(has(f, EntityType::DATE_TIME, "10:30 AM"));
    EXPECT_TRUE(has(f, EntityType::FINANCIAL, "$1,200.50"));
    // a bare month name is not a person
    EXPECT_FALSE(has(f, EntityType::PERSON, "March"));
}

TEST_F(StatisticalDetectorTest, RedactionTokensAreNotCandidates) {
    auto f = scan("Signed by [PERSON:\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88] and WITNESS.");
    EXPECT_TRUE(f.empty());
}

TEST_F(StatisticalDetectorTest, TokenizeTracksSeparators) {
    auto words = StatisticalDetector::tokenize("Dr. Jane Smith-Jones");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_TRUE(words[0].sentence_initial);
    EXPECT_TRUE(words[1].after_period);
    EXPECT_FALSE(words[1].joined_to_previous);
    EXPECT_TRUE(words[2].joined_to_previous);
    EXPECT_EQ(words[2].folded, "smith-jones");
    EXPECT_TRUE(words[2].title_case);
}

TEST_F(StatisticalDetectorTest, NullModelIsUnavailable) {
    StatisticalDetector detector(nullptr);
    EXPECT_FALSE(detector.available());
    auto result = detector.detect("John Smith", DetectionConfig{});
    EXPECT_EQ(result.status, DetectorStatus::Unavailable);
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(StatisticalDetectorTest, InvalidModelsRaiseModelLoadError) {
    EXPECT_THROW(NerModel::load("/nonexistent/ner.yaml"), ModelLoadError);
    EXPECT_THROW(NerModel::parse("threshold: 1.5\n"), ModelLoadError);
    EXPECT_THROW(NerModel::parse("currency:\n  symbols: [\"$\"]\n"), ModelLoadError);
    EXPECT_THROW(NerModel::parse("months: [May]\n"), ModelLoadError);
    EXPECT_THROW(NerModel::parse("gazetteers: [unclosed"), ModelLoadError);
}
