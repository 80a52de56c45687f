#include "redactor/result.hpp"

namespace redactor {

const char* to_string(PipelineErrorKind kind) noexcept {
    switch (kind) {
        case PipelineErrorKind::InvalidInput:      return "InvalidInput";
        case PipelineErrorKind::Extraction:        return "ExtractionError";
        case PipelineErrorKind::Detection:         return "DetectionError";
        case PipelineErrorKind::Reconstruction:    return "ReconstructionError";
        case PipelineErrorKind::SecurityViolation: return "SecurityViolation";
        case PipelineErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

const RedactedDocument& RedactionOutcome::document() const {
    if (!ok()) {
        throw InvalidArgumentError("Outcome holds no document",
                                   to_string(std::get<PipelineError>(value_).kind));
    }
    return std::get<RedactedDocument>(value_);
}

RedactedDocument RedactionOutcome::take_document() {
    if (!ok()) {
        throw InvalidArgumentError("Outcome holds no document",
                                   to_string(std::get<PipelineError>(value_).kind));
    }
    return std::move(std::get<RedactedDocument>(value_));
}

const PipelineError& RedactionOutcome::error() const {
    if (ok()) {
        throw InvalidArgumentError("Outcome holds no error");
    }
    return std::get<PipelineError>(value_);
}

} // namespace redactor
