#pragma once

#include <stdexcept>
#include <string>

namespace redactor {

/**
 * Structured error reporting for the redaction pipeline.
 *
 * Exceptions carry an ErrorCode plus optional context and suggestion. They are
 * raised inside the pipeline and converted to a RedactionOutcome at the engine
 * boundary, so callers never have to catch them to learn about a failure.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_IMPLEMENTED = 3,

    // Document errors
    EXTRACTION_FAILED = 100,
    UNSUPPORTED_FORMAT = 101,
    DOCUMENT_TOO_LARGE = 102,
    RECONSTRUCTION_FAILED = 110,

    // Detection errors
    MODEL_LOAD_FAILED = 200,
    DETECTION_FAILED = 201,

    // Security errors
    SECURITY_VIOLATION = 300,

    // Configuration / I/O errors
    CONFIG_INVALID = 400,
    FILE_NOT_FOUND = 401,
    WRITE_FAILED = 402,

    // Pipeline control
    CANCELLED = 500,
    INTERNAL_ERROR = 501
};

const char* to_string(ErrorCode code) noexcept;

class RedactorException : public std::runtime_error {
public:
    explicit RedactorException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Redactor error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public RedactorException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : RedactorException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Source bytes unreadable, corrupt or unsupported
class ExtractionError : public RedactorException {
public:
    explicit ExtractionError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : RedactorException(ErrorCode::EXTRACTION_FAILED, message, context, suggestion) {}
};

// Adapter cannot regenerate the target format
class ReconstructionError : public RedactorException {
public:
    explicit ReconstructionError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : RedactorException(ErrorCode::RECONSTRUCTION_FAILED, message, context, suggestion) {}
};

// Residual original PII found in reconstructed output. Never downgraded.
class SecurityViolation : public RedactorException {
public:
    explicit SecurityViolation(const std::string& message,
                               const std::string& context = "")
        : RedactorException(ErrorCode::SECURITY_VIOLATION, message, context,
                            "Output discarded; re-run the full pipeline after fixing the adapter") {}
};

class ModelLoadError : public RedactorException {
public:
    explicit ModelLoadError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : RedactorException(ErrorCode::MODEL_LOAD_FAILED, message, context, suggestion) {}
};

class ConfigError : public RedactorException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : RedactorException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class IOError : public RedactorException {
public:
    explicit IOError(ErrorCode code, const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : RedactorException(code, message, context, suggestion) {}
};

// Error checking utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw RedactorException(code, message, context, suggestion);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name) {
        if (!ptr) {
            throw InvalidArgumentError("Null pointer: " + name);
        }
    }
};

// Macros for common error checking
#define REDACTOR_CHECK(condition, code, message) \
    redactor::ErrorHandler::check_condition(condition, code, message, __func__)

#define REDACTOR_CHECK_ARGUMENT(condition, message) \
    REDACTOR_CHECK(condition, redactor::ErrorCode::INVALID_ARGUMENT, message)

#define REDACTOR_CHECK_POINTER(ptr, name) \
    redactor::ErrorHandler::check_pointer(ptr, name)

#define REDACTOR_THROW(code, message) \
    throw redactor::RedactorException(code, message, __func__)

#define REDACTOR_THROW_INVALID_ARG(message) \
    throw redactor::InvalidArgumentError(message, __func__)

} // namespace redactor
