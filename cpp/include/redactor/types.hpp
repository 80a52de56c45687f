#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

// Raw document bytes as read from / handed to the delivery layer
using ByteBuffer = std::vector<uint8_t>;

// =============================================================================
// Entity Types
// =============================================================================

enum class EntityType : uint8_t {
    EMAIL_ADDRESS,
    PHONE_NUMBER,
    SSN,
    CREDIT_CARD,
    IP_ADDRESS,
    URL,
    DATE_OF_BIRTH,
    PASSPORT_NUMBER,
    LICENSE_PLATE,
    PERSON,
    ORGANIZATION,
    LOCATION,
    DATE_TIME,
    FINANCIAL,
    IBAN_CODE
};

const char* to_string(EntityType type) noexcept;
std::optional<EntityType> parse_entity_type(std::string_view name);
const std::vector<EntityType>& all_entity_types();

// =============================================================================
// Detection Methods
// =============================================================================

enum class DetectionMethod : uint8_t {
    Pattern,
    Statistical,
    Enterprise
};

const char* to_string(DetectionMethod method) noexcept;

// Overlap tie-break order: enterprise > statistical > pattern
constexpr int method_priority(DetectionMethod method) noexcept {
    switch (method) {
        case DetectionMethod::Enterprise:  return 3;
        case DetectionMethod::Statistical: return 2;
        case DetectionMethod::Pattern:     return 1;
    }
    return 0;
}

/**
 * A detected span of sensitive text inside one TextBlock.
 *
 * Offsets are byte offsets into the block content, 0 <= start < end <= size.
 * Findings live only for the duration of a single pipeline run.
 */
struct Finding {
    EntityType entity_type = EntityType::PERSON;
    size_t start = 0;
    size_t end = 0;
    std::string text;
    double confidence = 0.0;
    DetectionMethod method = DetectionMethod::Pattern;

    size_t length() const { return end - start; }

    bool overlaps(const Finding& other) const {
        return start < other.end && other.start < end;
    }

    bool operator==(const Finding& other) const {
        return entity_type == other.entity_type && start == other.start &&
               end == other.end && text == other.text && method == other.method;
    }
};

// Sorted by start, pairwise non-overlapping (see merge_findings)
using FindingSet = std::vector<Finding>;

// =============================================================================
// Structural Location
// =============================================================================

enum class LocationKind : uint8_t {
    Page,           // paginated flow: page index + reading order
    Paragraph,      // structured flow: body paragraph
    TableCell,      // structured flow: table / row / cell
    HeaderFooter,   // structured flow: paragraph inside a header or footer part
    Property        // document-level free-text metadata (title, author, ...)
};

const char* to_string(LocationKind kind) noexcept;

struct StructuralLocation {
    LocationKind kind = LocationKind::Page;
    size_t page = 0;
    size_t order = 0;       // reading / body order within the document
    size_t paragraph = 0;
    size_t table = 0;
    size_t row = 0;
    size_t cell = 0;
    std::string part;       // property key or header/footer part name
};

struct TextBlock {
    std::string content;
    StructuralLocation location;
};

// =============================================================================
// Document Formats & Lifecycle
// =============================================================================

enum class DocumentFormat : uint8_t {
    Pdf,    // paginated flow
    Docx    // structured flow
};

const char* to_string(DocumentFormat format) noexcept;
std::optional<DocumentFormat> parse_document_format(std::string_view name);

enum class DocumentState : uint8_t {
    Received,
    Extracted,
    Detected,
    Redacted,
    Validated,
    Delivered,
    Failed
};

const char* to_string(DocumentState state) noexcept;

// =============================================================================
// Detection Configuration
// =============================================================================

struct DetectionConfig {
    bool enable_pattern = true;
    bool enable_statistical = true;
    bool enable_enterprise = true;
    // Empty set means "use the enterprise profile's default entity list"
    std::set<EntityType> enterprise_entity_allowlist;

    bool is_enabled(DetectionMethod method) const {
        switch (method) {
            case DetectionMethod::Pattern:     return enable_pattern;
            case DetectionMethod::Statistical: return enable_statistical;
            case DetectionMethod::Enterprise:  return enable_enterprise;
        }
        return false;
    }
};

// =============================================================================
// Report
// =============================================================================

/**
 * Per-document outcome summary handed to the delivery layer.
 * Holds counts only; never any extracted or detected text.
 */
struct RedactionReport {
    DocumentFormat format = DocumentFormat::Pdf;
    std::map<EntityType, size_t> entity_counts;
    size_t pages_or_sections_processed = 0;
    size_t blocks_processed = 0;
    size_t total_findings = 0;
    size_t tokens_emitted = 0;
    size_t original_text_length = 0;
    size_t redacted_text_length = 0;
    std::set<DetectionMethod> methods_used;
    std::set<DetectionMethod> degraded_methods;
    bool reduced_coverage = false;
    double confidence_score = 0.0;   // informational only
    DocumentState final_state = DocumentState::Received;
};

} // namespace redactor
