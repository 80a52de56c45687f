// =============================================================================
// Redaction Token and Splice Tests
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/error.hpp"
#include "redactor/redact/splice.hpp"
#include "redactor/redact/token.hpp"
#include "redactor/util/utf8.hpp"

using namespace redactor;

namespace {

std::string masks(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) out += kMaskChar;
    return out;
}

Finding make(EntityType type, const std::string& content, const std::string& text, size_t from = 0) {
    Finding f;
    f.entity_type = type;
    f.start = content.find(text, from);
    f.end = f.start + text.size();
    f.text = text;
    f.confidence = 0.9;
    f.method = DetectionMethod::Pattern;
    return f;
}

} // namespace

class RedactionTokenTest : public ::testing::Test {
protected:
    RedactionConfig config_;
};

TEST_F(RedactionTokenTest, LengthCappedMask) {
    EXPECT_EQ(make_token(EntityType::PHONE_NUMBER, 12, config_), "[PHONE_NUMBER:" + masks(12) + "]");
    EXPECT_EQ(make_token(EntityType::EMAIL_ADDRESS, 21, config_), "[EMAIL_ADDRESS:" + masks(20) + "]");
    EXPECT_EQ(make_token(EntityType::SSN, 0, config_), "[SSN:" + masks(1) + "]");
}

TEST_F(RedactionTokenTest, FixedWidthHidesLength) {
    config_.token_style = TokenStyle::FixedWidth;
    config_.fixed_mask_width = 5;
    EXPECT_EQ(make_token(EntityType::PERSON, 3, config_), "[PERSON:" + masks(5) + "]");
    EXPECT_EQ(make_token(EntityType::PERSON, 40, config_), make_token(EntityType::PERSON, 3, config_));
}

TEST_F(RedactionTokenTest, MaskWidthCountsCodepoints) {
    Finding f;
    f.entity_type = EntityType::PERSON;
    f.text = "Jos\xC3\xA9";   // four codepoints, five bytes
    EXPECT_EQ(token_for(f, config_), "[PERSON:" + masks(4) + "]");
}

TEST_F(RedactionTokenTest, FallsBackWhenTokenWouldContainOriginal) {
    Finding label;
    label.entity_type = EntityType::PERSON;
    label.text = "person";
    EXPECT_EQ(token_for(label, config_), masks(6));

    Finding mask_only;
    mask_only.entity_type = EntityType::PERSON;
    mask_only.text = masks(2);
    EXPECT_EQ(token_for(mask_only, config_), "**");
}

TEST_F(RedactionTokenTest, SpliceReplacesEveryOccurrence) {
    const std::string content = "Call 555-123-4567, then 555-123-4567 again.";
    FindingSet findings = {
        make(EntityType::PHONE_NUMBER, content, "555-123-4567"),
        make(EntityType::PHONE_NUMBER, content, "555-123-4567", 10),
    };

    SpliceResult result = splice_block(content, findings, config_);
    const std::string token = "[PHONE_NUMBER:" + masks(12) + "]";
    EXPECT_EQ(result.text, "Call " + token + ", then " + token + " again.");
    EXPECT_EQ(result.tokens_emitted, 2u);
    EXPECT_FALSE(util::contains_normalized(result.text, "555-123-4567"));
}

TEST_F(RedactionTokenTest, SpliceKeepsGapsVerbatim) {
    const std::string content = "Dear Jane Roe,\n\tthanks.";
    FindingSet findings = {make(EntityType::PERSON, content, "Jane Roe")};
    SpliceResult result = splice_block(content, findings, config_);
    EXPECT_EQ(result.text, "Dear [PERSON:" + masks(8) + "],\n\tthanks.");
}

TEST_F(RedactionTokenTest, SpliceWithoutFindingsIsIdentity) {
    SpliceResult result = splice_block("nothing to hide", {}, config_);
    EXPECT_EQ(result.text, "nothing to hide");
    EXPECT_EQ(result.tokens_emitted, 0u);
}

TEST_F(RedactionTokenTest, SpliceRejectsMalformedFindingSets) {
    const std::string content = "0123456789";
    Finding a;
    a.start = 2;
    a.end = 6;
    a.text = "2345";
    Finding b = a;
    b.start = 4;
    b.end = 8;
    b.text = "4567";

    try {
        splice_block(content, {a, b}, config_);
        FAIL() << "overlapping findings accepted";
    } catch (const RedactorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }

    Finding out_of_bounds = a;
    out_of_bounds.end = 42;
    EXPECT_THROW(splice_block(content, {out_of_bounds}, config_), RedactorException);
}
