#include "redactor/error.hpp"

namespace redactor {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:               return "success";
        case ErrorCode::INVALID_ARGUMENT:      return "invalid_argument";
        case ErrorCode::NOT_IMPLEMENTED:       return "not_implemented";
        case ErrorCode::EXTRACTION_FAILED:     return "extraction_failed";
        case ErrorCode::UNSUPPORTED_FORMAT:    return "unsupported_format";
        case ErrorCode::DOCUMENT_TOO_LARGE:    return "document_too_large";
        case ErrorCode::RECONSTRUCTION_FAILED: return "reconstruction_failed";
        case ErrorCode::MODEL_LOAD_FAILED:     return "model_load_failed";
        case ErrorCode::DETECTION_FAILED:      return "detection_failed";
        case ErrorCode::SECURITY_VIOLATION:    return "security_violation";
        case ErrorCode::CONFIG_INVALID:        return "config_invalid";
        case ErrorCode::FILE_NOT_FOUND:        return "file_not_found";
        case ErrorCode::WRITE_FAILED:          return "write_failed";
        case ErrorCode::CANCELLED:             return "cancelled";
        case ErrorCode::INTERNAL_ERROR:        return "internal_error";
    }
    return "unknown";
}

} // namespace redactor
