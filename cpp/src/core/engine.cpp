#include "redactor/engine.hpp"
#include "redactor/error.hpp"
#include "redactor/format/adapter.hpp"
#include "redactor/logging.hpp"
#include "redactor/redact/splice.hpp"
#include "redactor/redact/validator.hpp"
#include "redactor/util/utf8.hpp"

#include <atomic>
#include <chrono>

namespace redactor {

namespace {

std::atomic<uint64_t> g_run_counter{0};

PipelineErrorKind kind_for(ErrorCode code, DocumentState stage) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::UNSUPPORTED_FORMAT:
        case ErrorCode::DOCUMENT_TOO_LARGE:
            return PipelineErrorKind::InvalidInput;
        case ErrorCode::EXTRACTION_FAILED:
            return PipelineErrorKind::Extraction;
        case ErrorCode::MODEL_LOAD_FAILED:
        case ErrorCode::DETECTION_FAILED:
            return PipelineErrorKind::Detection;
        case ErrorCode::RECONSTRUCTION_FAILED:
            return PipelineErrorKind::Reconstruction;
        case ErrorCode::SECURITY_VIOLATION:
            return PipelineErrorKind::SecurityViolation;
        case ErrorCode::CANCELLED:
            return PipelineErrorKind::Cancelled;
        default:
            break;
    }

    // Anything else is attributed to the stage that was running
    switch (stage) {
        case DocumentState::Received:  return PipelineErrorKind::Extraction;
        case DocumentState::Extracted: return PipelineErrorKind::Detection;
        default:                       return PipelineErrorKind::Reconstruction;
    }
}

} // namespace

// =============================================================================
// Run - state of one document through the pipeline
// =============================================================================

class RedactionEngine::Run {
public:
    explicit Run(const CancellationToken* cancel)
        : id_(++g_run_counter), cancel_(cancel), started_(std::chrono::steady_clock::now()) {
        LOG_DEBUG("run ", id_, ": ", to_string(state_));
    }

    void advance(DocumentState next) {
        LOG_DEBUG("run ", id_, ": ", to_string(state_), " -> ", to_string(next));
        state_ = next;
    }

    void check_cancelled() const {
        if (cancel_ && cancel_->is_cancelled()) {
            throw RedactorException(ErrorCode::CANCELLED, "Redaction cancelled",
                                    std::string("during ") + to_string(state_));
        }
    }

    RedactionOutcome fail(PipelineErrorKind kind, ErrorCode code, const std::string& reason,
                          size_t violating = 0) {
        PipelineError error;
        error.kind = kind;
        error.code = code;
        error.reason = reason;
        error.failed_in = state_;
        error.violating_findings = violating;

        LOG_WARN("run ", id_, ": ", to_string(state_), " -> ", to_string(DocumentState::Failed),
                 " (", to_string(kind), ")");
        state_ = DocumentState::Failed;
        return RedactionOutcome::failure(std::move(error));
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_).count();
    }

    uint64_t id() const { return id_; }
    DocumentState state() const { return state_; }

private:
    uint64_t id_;
    const CancellationToken* cancel_;
    std::chrono::steady_clock::time_point started_;
    DocumentState state_ = DocumentState::Received;
};

// =============================================================================
// RedactionEngine
// =============================================================================

RedactionEngine::RedactionEngine(const DetectorSet& detectors, RedactorConfig config)
    : detectors_(detectors)
    , config_(std::move(config))
    , pool_(std::make_unique<ThreadPool>(config_.pipeline.worker_threads)) {
    validate_config(config_);
}

RedactionEngine::~RedactionEngine() = default;

RedactionOutcome RedactionEngine::redact(const DocumentRequest& request,
                                         const CancellationToken* cancel) const {
    return execute(request, cancel, true);
}

RedactionOutcome RedactionEngine::scan(const DocumentRequest& request,
                                       const CancellationToken* cancel) const {
    return execute(request, cancel, false);
}

RedactionOutcome RedactionEngine::execute(const DocumentRequest& request, const CancellationToken* cancel,
                                          bool produce_output) const {
    Run run(cancel);

    try {
        // ----- Input checks -----
        if (request.bytes.empty()) {
            throw InvalidArgumentError("Empty document");
        }
        if (request.bytes.size() > config_.pipeline.max_document_bytes) {
            throw RedactorException(ErrorCode::DOCUMENT_TOO_LARGE, "Document exceeds size limit",
                                    std::to_string(request.bytes.size()) + " > " +
                                    std::to_string(config_.pipeline.max_document_bytes) + " bytes");
        }

        std::optional<DocumentFormat> format = request.format;
        if (!format) format = detect_format(request.bytes, request.filename);
        if (!format) {
            throw RedactorException(ErrorCode::UNSUPPORTED_FORMAT, "Unrecognised document format",
                                    request.filename, "Supported formats: pdf, docx");
        }

        auto adapter = make_adapter(*format, config_);
        if (!adapter->probe(request.bytes)) {
            throw ExtractionError("Document signature does not match its format",
                                  to_string(*format));
        }

        // ----- Extract -----
        run.check_cancelled();
        ExtractedDocument extracted = adapter->extract(request.bytes);
        REDACTOR_CHECK(extracted.scaffold != nullptr, ErrorCode::EXTRACTION_FAILED, "Adapter returned no scaffold");
        run.advance(DocumentState::Extracted);
        LOG_INFO("run ", run.id(), ": ", to_string(*format), " extracted, ", extracted.blocks.size(),
                 " blocks over ", extracted.scaffold->units(), " page(s)/section(s)");

        // ----- Detect (parallel per block) -----
        run.check_cancelled();
        const auto& blocks = extracted.blocks;
        std::vector<BlockDetection> detections(blocks.size());
        pool_->parallel_for(0, blocks.size(), [&](size_t i) {
            run.check_cancelled();
            detections[i] = detectors_.detect(blocks[i].content, request.detection);
        });
        run.advance(DocumentState::Detected);

        RedactionReport report;
        report.format = *format;
        report.pages_or_sections_processed = extracted.scaffold->units();
        report.blocks_processed = blocks.size();

        std::vector<Finding> all_findings;
        for (size_t i = 0; i < blocks.size(); ++i) {
            const auto& detection = detections[i];
            report.methods_used.insert(detection.methods_used.begin(), detection.methods_used.end());
            report.degraded_methods.insert(detection.degraded_methods.begin(), detection.degraded_methods.end());
            for (const auto& f : detection.findings) {
                ++report.entity_counts[f.entity_type];
                all_findings.push_back(f);
            }
            report.original_text_length += util::codepoint_count(blocks[i].content);
        }
        report.total_findings = all_findings.size();
        report.reduced_coverage = !report.degraded_methods.empty();
        report.confidence_score = report_confidence(all_findings);

        if (report.reduced_coverage) {
            for (DetectionMethod method : report.degraded_methods) {
                LOG_WARN("run ", run.id(), ": ", to_string(method), " detection unavailable, coverage reduced");
            }
        }
        for (const auto& [type, count] : report.entity_counts) {
            LOG_DEBUG("run ", run.id(), ": ", to_string(type), " x", count);
        }

        if (!produce_output) {
            report.redacted_text_length = report.original_text_length;
            report.final_state = run.state();
            LOG_INFO("run ", run.id(), ": scan complete, ", report.total_findings, " findings in ",
                     run.elapsed_ms(), " ms");
            return RedactionOutcome::success(RedactedDocument{ByteBuffer{}, std::move(report)});
        }

        // ----- Splice -----
        run.check_cancelled();
        std::vector<TextBlock> redacted_blocks;
        redacted_blocks.reserve(blocks.size());
        for (size_t i = 0; i < blocks.size(); ++i) {
            SpliceResult spliced = splice_block(blocks[i].content, detections[i].findings, config_.redaction);
            report.tokens_emitted += spliced.tokens_emitted;
            report.redacted_text_length += util::codepoint_count(spliced.text);
            redacted_blocks.push_back(TextBlock{std::move(spliced.text), blocks[i].location});
        }
        detections.clear();
        run.advance(DocumentState::Redacted);

        // ----- Reconstruct -----
        run.check_cancelled();
        ByteBuffer output = adapter->reconstruct(*extracted.scaffold, redacted_blocks);
        extracted.blocks.clear();

        // ----- Validate -----
        Validator validator;
        ValidationResult validation = validator.validate(*adapter, output, all_findings);
        if (!validation.passed) {
            output.assign(output.size(), 0);
            output.clear();
            return run.fail(PipelineErrorKind::SecurityViolation, ErrorCode::SECURITY_VIOLATION,
                            "Original sensitive text present in reconstructed output; output discarded",
                            validation.violating_findings.size());
        }
        run.advance(DocumentState::Validated);
        report.final_state = run.state();

        LOG_INFO("run ", run.id(), ": validated, ", report.total_findings, " findings, ",
                 report.tokens_emitted, " tokens, ", output.size(), " bytes in ", run.elapsed_ms(), " ms");
        return RedactionOutcome::success(RedactedDocument{std::move(output), std::move(report)});

    } catch (const RedactorException& e) {
        LOG_ERROR("run ", run.id(), ": ", e.message(), e.context().empty() ? "" : " [", e.context(),
                  e.context().empty() ? "" : "]");
        return run.fail(kind_for(e.code(), run.state()), e.code(), e.message());
    } catch (const std::exception& e) {
        LOG_ERROR("run ", run.id(), ": unexpected failure in ", to_string(run.state()), ": ", e.what());
        return run.fail(kind_for(ErrorCode::INTERNAL_ERROR, run.state()), ErrorCode::INTERNAL_ERROR,
                        "Internal error while processing document");
    }
}

double report_confidence(const std::vector<Finding>& findings) {
    if (findings.empty()) return 0.85;
    double sum = 0.0;
    for (const auto& f : findings) sum += f.confidence;
    return sum / static_cast<double>(findings.size());
}

} // namespace redactor
