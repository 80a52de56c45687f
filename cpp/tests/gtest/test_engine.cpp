// =============================================================================
// Redaction Engine Tests - end-to-end pipeline runs
// =============================================================================

#include <gtest/gtest.h>
#include "redactor/engine.hpp"
#include "redactor/format/adapter.hpp"
#include "redactor/format/docx_adapter.hpp"
#include "redactor/format/pdf_adapter.hpp"
#include "redactor/redact/token.hpp"
#include "test_documents.hpp"

using namespace redactor;

namespace {

// Flags only the first occurrence of a word, leaving later copies behind
class FirstOccurrenceDetector : public Detector {
public:
    explicit FirstOccurrenceDetector(std::string word) : word_(std::move(word)) {}

    std::string name() const override { return "first-occurrence"; }
    DetectionMethod method() const override { return DetectionMethod::Statistical; }
    bool available() const override { return true; }

    DetectorResult detect(std::string_view text, const DetectionConfig&) const override {
        FindingSet findings;
        const size_t pos = text.find(word_);
        if (pos != std::string_view::npos) {
            Finding f;
            f.entity_type = EntityType::PERSON;
            f.start = pos;
            f.end = pos + word_.size();
            f.text = word_;
            f.confidence = 0.9;
            f.method = DetectionMethod::Statistical;
            findings.push_back(f);
        }
        return DetectorResult::ok(std::move(findings));
    }

private:
    std::string word_;
};

const std::string kContactLine = "Contact john@example.com or 555-123-4567";

} // namespace

class EngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ner_ = NerModel::load(fixtures::models_dir() + "/ner_lexicon.yaml");
        profile_ = EnterpriseProfile::load(fixtures::models_dir() + "/enterprise_profile.yaml");
    }

    static void TearDownTestSuite() {
        ner_.reset();
        profile_.reset();
    }

    void SetUp() override {
        config_.pipeline.worker_threads = 2;
        detectors_ = std::make_unique<DetectorSet>(ner_, profile_);
    }

    static DocumentRequest request(ByteBuffer bytes, std::optional<DocumentFormat> format = std::nullopt) {
        DocumentRequest req;
        req.bytes = std::move(bytes);
        req.format = format;
        return req;
    }

    static std::shared_ptr<const NerModel> ner_;
    static std::shared_ptr<const EnterpriseProfile> profile_;

    RedactorConfig config_;
    std::unique_ptr<DetectorSet> detectors_;
};

std::shared_ptr<const NerModel> EngineTest::ner_;
std::shared_ptr<const EnterpriseProfile> EngineTest::profile_;

// =============================================================================
// Successful runs
// =============================================================================

TEST_F(EngineTest, PdfContactDetailsRedacted) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf({kContactLine})));
    ASSERT_TRUE(outcome.ok()) << outcome.error().reason;

    const auto& doc = outcome.document();
    EXPECT_EQ(doc.report.final_state, DocumentState::Validated);
    EXPECT_EQ(doc.report.format, DocumentFormat::Pdf);
    EXPECT_EQ(doc.report.total_findings, 2u);
    EXPECT_EQ(doc.report.tokens_emitted, 2u);
    EXPECT_EQ(doc.report.entity_counts.at(EntityType::EMAIL_ADDRESS), 1u);
    EXPECT_EQ(doc.report.entity_counts.at(EntityType::PHONE_NUMBER), 1u);
    EXPECT_EQ(doc.report.methods_used.size(), 3u);
    EXPECT_FALSE(doc.report.reduced_coverage);

    PdfAdapter adapter;
    const std::string text = adapter.extract(doc.bytes).joined_text();
    EXPECT_EQ(text.find("john@example.com"), std::string::npos);
    EXPECT_EQ(text.find("555-123-4567"), std::string::npos);
    EXPECT_NE(text.find("[EMAIL_ADDRESS:"), std::string::npos);
    EXPECT_NE(text.find("[PHONE_NUMBER:"), std::string::npos);
    EXPECT_NE(text.find("Contact"), std::string::npos);
}

TEST_F(EngineTest, DocxTokensKeepOriginalWidth) {
    fixtures::DocxFixture fixture;
    fixture.paragraphs = {kContactLine, "Nothing sensitive here"};

    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_docx(fixture)));
    ASSERT_TRUE(outcome.ok()) << outcome.error().reason;

    RedactedDocument doc = outcome.take_document();
    EXPECT_EQ(doc.report.format, DocumentFormat::Docx);

    DocxAdapter adapter;
    auto again = adapter.extract(doc.bytes);
    ASSERT_GE(again.blocks.size(), 2u);
    EXPECT_EQ(again.blocks[0].content,
              "Contact " + make_token(EntityType::EMAIL_ADDRESS, 16, config_.redaction) +
              " or " + make_token(EntityType::PHONE_NUMBER, 12, config_.redaction));
    EXPECT_EQ(again.blocks[1].content, "Nothing sensitive here");
}

TEST_F(EngineTest, EveryOccurrenceReplaced) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf(
        {"SSN 123-45-6789 on file", "Again: 123-45-6789 and 123-45-6789"})));
    ASSERT_TRUE(outcome.ok()) << outcome.error().reason;

    const auto& report = outcome.document().report;
    EXPECT_EQ(report.entity_counts.at(EntityType::SSN), 3u);
    EXPECT_EQ(report.tokens_emitted, report.total_findings);
    EXPECT_EQ(report.pages_or_sections_processed, 2u);

    PdfAdapter adapter;
    EXPECT_EQ(adapter.extract(outcome.document().bytes).joined_text().find("123-45-6789"), std::string::npos);
}

TEST_F(EngineTest, CleanDocumentPassesThrough) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf({"the weather is mild"})));
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.document().report.total_findings, 0u);
    EXPECT_DOUBLE_EQ(outcome.document().report.confidence_score, 0.85);
}

TEST_F(EngineTest, MissingProfileReducesCoverage) {
    DetectorSet degraded(ner_, nullptr);
    RedactionEngine engine(degraded, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf({kContactLine})));
    ASSERT_TRUE(outcome.ok()) << outcome.error().reason;

    const auto& report = outcome.document().report;
    EXPECT_TRUE(report.reduced_coverage);
    EXPECT_EQ(report.degraded_methods.count(DetectionMethod::Enterprise), 1u);
    EXPECT_EQ(report.methods_used.count(DetectionMethod::Enterprise), 0u);
    EXPECT_EQ(report.entity_counts.at(EntityType::EMAIL_ADDRESS), 1u);
}

TEST_F(EngineTest, ScanReportsWithoutOutput) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.scan(request(fixtures::make_pdf({kContactLine})));
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.document().bytes.empty());
    EXPECT_EQ(outcome.document().report.final_state, DocumentState::Detected);
    EXPECT_EQ(outcome.document().report.total_findings, 2u);
    EXPECT_EQ(outcome.document().report.tokens_emitted, 0u);
}

TEST_F(EngineTest, RedactedOutputHasNothingLeftToDetect) {
    const std::vector<std::string> corpus = {
        "See http://acme.com. Paul will call.",
        kContactLine,
        "Call 555-123-4567. Maria will answer.",
        "Dr John Smith visited Paris on March 5, 2024.",
        "Card 4111-1111-1111-1111; Laura signed for $1,200.50 at 10:30 AM.",
    };

    fixtures::DocxFixture fixture;
    fixture.paragraphs = corpus;
    const std::vector<std::pair<DocumentFormat, ByteBuffer>> inputs = {
        {DocumentFormat::Docx, fixtures::make_docx(fixture)},
        {DocumentFormat::Pdf, fixtures::make_pdf(corpus)},
    };

    RedactionEngine engine(*detectors_, config_);
    for (const auto& [format, bytes] : inputs) {
        SCOPED_TRACE(to_string(format));
        auto outcome = engine.redact(request(bytes, format));
        ASSERT_TRUE(outcome.ok()) << outcome.error().reason;
        EXPECT_GT(outcome.document().report.total_findings, 0u);

        auto adapter = make_adapter(format, config_);
        const auto again = adapter->extract(outcome.document().bytes);
        ASSERT_EQ(again.blocks.size(), corpus.size());
        for (const auto& block : again.blocks) {
            const auto detection = detectors_->detect(block.content, DetectionConfig{});
            EXPECT_TRUE(detection.findings.empty())
                << detection.findings.size() << " finding(s), first "
                << to_string(detection.findings.front().entity_type);
        }
    }
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(EngineTest, CorruptPdfFailsExtraction) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::to_bytes("%PDF-1.7\ngarbage"), DocumentFormat::Pdf));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().kind, PipelineErrorKind::Extraction);
    EXPECT_EQ(outcome.error().failed_in, DocumentState::Received);
    EXPECT_THROW(outcome.document(), InvalidArgumentError);
}

TEST_F(EngineTest, SignatureMismatchFailsExtraction) {
    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf({"text"}), DocumentFormat::Docx));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().kind, PipelineErrorKind::Extraction);
}

TEST_F(EngineTest, ResidueIsSecurityViolation) {
    std::vector<std::unique_ptr<Detector>> list;
    list.push_back(std::make_unique<FirstOccurrenceDetector>("Zephyr"));
    DetectorSet leaky(std::move(list));

    fixtures::DocxFixture fixture;
    fixture.paragraphs = {"Zephyr met Zephyr"};

    RedactionEngine engine(leaky, config_);
    auto outcome = engine.redact(request(fixtures::make_docx(fixture)));
    ASSERT_FALSE(outcome.ok());
    EXPECT_TRUE(outcome.is_security_violation());
    EXPECT_EQ(outcome.error().code, ErrorCode::SECURITY_VIOLATION);
    EXPECT_EQ(outcome.error().failed_in, DocumentState::Redacted);
    EXPECT_EQ(outcome.error().violating_findings, 1u);
    EXPECT_EQ(outcome.error().reason.find("Zephyr"), std::string::npos);
}

TEST_F(EngineTest, CancelledRunFails) {
    CancellationToken cancel;
    cancel.cancel();

    RedactionEngine engine(*detectors_, config_);
    auto outcome = engine.redact(request(fixtures::make_pdf({kContactLine})), &cancel);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().kind, PipelineErrorKind::Cancelled);
}

TEST_F(EngineTest, InputChecks) {
    config_.pipeline.max_document_bytes = 64;
    RedactionEngine engine(*detectors_, config_);

    auto empty = engine.redact(request({}));
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().kind, PipelineErrorKind::InvalidInput);

    auto large = engine.redact(request(ByteBuffer(65, 'x'), DocumentFormat::Pdf));
    ASSERT_FALSE(large.ok());
    EXPECT_EQ(large.error().kind, PipelineErrorKind::InvalidInput);
    EXPECT_EQ(large.error().code, ErrorCode::DOCUMENT_TOO_LARGE);

    DocumentRequest unknown = request(fixtures::to_bytes("plain notes"));
    unknown.filename = "notes.txt";
    auto unsupported = engine.redact(unknown);
    ASSERT_FALSE(unsupported.ok());
    EXPECT_EQ(unsupported.error().code, ErrorCode::UNSUPPORTED_FORMAT);
}

TEST(ReportConfidenceTest, MeanOrDefault) {
    EXPECT_DOUBLE_EQ(report_confidence({}), 0.85);

    Finding a;
    a.confidence = 0.9;
    Finding b;
    b.confidence = 0.5;
    EXPECT_DOUBLE_EQ(report_confidence({a, b}), 0.7);
}
