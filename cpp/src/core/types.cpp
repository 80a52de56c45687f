#include "redactor/types.hpp"

#include <algorithm>
#include <cctype>

namespace redactor {

namespace {

struct EntityName {
    EntityType type;
    const char* name;
};

constexpr EntityName ENTITY_NAMES[] = {
    {EntityType::EMAIL_ADDRESS,   "EMAIL_ADDRESS"},
    {EntityType::PHONE_NUMBER,    "PHONE_NUMBER"},
    {EntityType::SSN,             "SSN"},
    {EntityType::CREDIT_CARD,     "CREDIT_CARD"},
    {EntityType::IP_ADDRESS,      "IP_ADDRESS"},
    {EntityType::URL,             "URL"},
    {EntityType::DATE_OF_BIRTH,   "DATE_OF_BIRTH"},
    {EntityType::PASSPORT_NUMBER, "PASSPORT_NUMBER"},
    {EntityType::LICENSE_PLATE,   "LICENSE_PLATE"},
    {EntityType::PERSON,          "PERSON"},
    {EntityType::ORGANIZATION,    "ORGANIZATION"},
    {EntityType::LOCATION,        "LOCATION"},
    {EntityType::DATE_TIME,       "DATE_TIME"},
    {EntityType::FINANCIAL,       "FINANCIAL"},
    {EntityType::IBAN_CODE,       "IBAN_CODE"},
};

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

const char* to_string(EntityType type) noexcept {
    for (const auto& entry : ENTITY_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}

std::optional<EntityType> parse_entity_type(std::string_view name) {
    const std::string key = upper(name);
    for (const auto& entry : ENTITY_NAMES) {
        if (key == entry.name) return entry.type;
    }
    return std::nullopt;
}

const std::vector<EntityType>& all_entity_types() {
    static const std::vector<EntityType> types = [] {
        std::vector<EntityType> v;
        for (const auto& entry : ENTITY_NAMES) v.push_back(entry.type);
        return v;
    }();
    return types;
}

const char* to_string(DetectionMethod method) noexcept {
    switch (method) {
        case DetectionMethod::Pattern:     return "pattern";
        case DetectionMethod::Statistical: return "statistical";
        case DetectionMethod::Enterprise:  return "enterprise";
    }
    return "unknown";
}

const char* to_string(LocationKind kind) noexcept {
    switch (kind) {
        case LocationKind::Page:         return "page";
        case LocationKind::Paragraph:    return "paragraph";
        case LocationKind::TableCell:    return "table_cell";
        case LocationKind::HeaderFooter: return "header_footer";
        case LocationKind::Property:     return "property";
    }
    return "unknown";
}

const char* to_string(DocumentFormat format) noexcept {
    switch (format) {
        case DocumentFormat::Pdf:  return "pdf";
        case DocumentFormat::Docx: return "docx";
    }
    return "unknown";
}

std::optional<DocumentFormat> parse_document_format(std::string_view name) {
    std::string key = upper(name);
    if (!key.empty() && key.front() == '.') key.erase(0, 1);
    if (key == "PDF") return DocumentFormat::Pdf;
    if (key == "DOCX") return DocumentFormat::Docx;
    return std::nullopt;
}

const char* to_string(DocumentState state) noexcept {
    switch (state) {
        case DocumentState::Received:  return "Received";
        case DocumentState::Extracted: return "Extracted";
        case DocumentState::Detected:  return "Detected";
        case DocumentState::Redacted:  return "Redacted";
        case DocumentState::Validated: return "Validated";
        case DocumentState::Delivered: return "Delivered";
        case DocumentState::Failed:    return "Failed";
    }
    return "Unknown";
}

} // namespace redactor
