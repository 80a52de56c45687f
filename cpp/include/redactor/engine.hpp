#pragma once
// =============================================================================
// engine.hpp - Per-document redaction pipeline
// =============================================================================
// extract -> parallel per-block detect -> merge -> splice -> reconstruct ->
// validate. Every failure fails the whole document and surfaces as a
// PipelineError inside the returned RedactionOutcome; nothing partial is ever
// handed back.
// =============================================================================

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "redactor/config.hpp"
#include "redactor/detect/detector_set.hpp"
#include "redactor/result.hpp"
#include "redactor/thread_pool.hpp"

namespace redactor {

struct DocumentRequest {
    ByteBuffer bytes;
    std::optional<DocumentFormat> format;   // explicit discriminator, wins over filename
    std::string filename;                   // extension hint when format is unset
    DetectionConfig detection;
};

class RedactionEngine {
public:
    /**
     * @param detectors assembled once per process; must outlive the engine
     * @param config    token style, size limit, worker count, PDF layout
     */
    RedactionEngine(const DetectorSet& detectors, RedactorConfig config);
    ~RedactionEngine();

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    /**
     * Run the full pipeline. cancel (optional) is checked between stages and
     * between blocks; a cancelled run fails with PipelineErrorKind::Cancelled.
     * On success the report's final_state is Validated.
     */
    RedactionOutcome redact(const DocumentRequest& request,
                            const CancellationToken* cancel = nullptr) const;

    /**
     * Detection only: extract and detect, no output document. The returned
     * document carries an empty byte buffer and a report in state Detected.
     */
    RedactionOutcome scan(const DocumentRequest& request,
                          const CancellationToken* cancel = nullptr) const;

    const RedactorConfig& config() const { return config_; }

private:
    class Run;

    RedactionOutcome execute(const DocumentRequest& request, const CancellationToken* cancel,
                             bool produce_output) const;

    const DetectorSet& detectors_;
    RedactorConfig config_;
    std::unique_ptr<ThreadPool> pool_;
};

// Informational score: mean finding confidence, 0.85 when nothing was found
double report_confidence(const std::vector<Finding>& findings);

} // namespace redactor
