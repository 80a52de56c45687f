#pragma once
// =============================================================================
// result.hpp - Explicit pipeline outcome
// =============================================================================
// A RedactionOutcome is either a RedactedDocument or a PipelineError. Callers
// must inspect it; there is no exception to forget to catch and no way to get
// bytes out of a failed outcome.
// =============================================================================

#include <string>
#include <utility>
#include <variant>

#include "redactor/error.hpp"
#include "redactor/types.hpp"

namespace redactor {

enum class PipelineErrorKind : uint8_t {
    InvalidInput,
    Extraction,
    Detection,
    Reconstruction,
    SecurityViolation,
    Cancelled
};

const char* to_string(PipelineErrorKind kind) noexcept;

struct PipelineError {
    PipelineErrorKind kind = PipelineErrorKind::InvalidInput;
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string reason;                 // never contains document text
    DocumentState failed_in = DocumentState::Received;
    size_t violating_findings = 0;      // SecurityViolation only
};

struct RedactedDocument {
    ByteBuffer bytes;
    RedactionReport report;
};

class RedactionOutcome {
public:
    static RedactionOutcome success(RedactedDocument document) {
        return RedactionOutcome(std::move(document));
    }

    static RedactionOutcome failure(PipelineError error) {
        return RedactionOutcome(std::move(error));
    }

    bool ok() const noexcept { return std::holds_alternative<RedactedDocument>(value_); }
    explicit operator bool() const noexcept { return ok(); }

    bool is_security_violation() const noexcept {
        return !ok() && error().kind == PipelineErrorKind::SecurityViolation;
    }

    // Throws InvalidArgumentError when the outcome is not a success
    const RedactedDocument& document() const;
    RedactedDocument take_document();

    const PipelineError& error() const;

private:
    explicit RedactionOutcome(RedactedDocument document) : value_(std::move(document)) {}
    explicit RedactionOutcome(PipelineError error) : value_(std::move(error)) {}

    std::variant<RedactedDocument, PipelineError> value_;
};

} // namespace redactor
