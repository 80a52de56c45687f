#include "redactor/format/adapter.hpp"
#include "redactor/error.hpp"
#include "redactor/format/docx_adapter.hpp"
#include "redactor/format/pdf_adapter.hpp"

#include <cstring>
#include <filesystem>

namespace redactor {

std::string ExtractedDocument::joined_text() const {
    std::string out;
    for (const auto& block : blocks) {
        if (!out.empty()) out.push_back('\n');
        out += block.content;
    }
    return out;
}

std::unique_ptr<FormatAdapter> make_adapter(DocumentFormat format, const RedactorConfig& config) {
    switch (format) {
        case DocumentFormat::Pdf:  return std::make_unique<PdfAdapter>(config.pdf);
        case DocumentFormat::Docx: return std::make_unique<DocxAdapter>();
    }
    throw InvalidArgumentError("No adapter for document format", to_string(format));
}

std::optional<DocumentFormat> detect_format(const ByteBuffer& bytes, std::string_view filename) {
    if (!filename.empty()) {
        const std::string ext = std::filesystem::path(std::string(filename)).extension().string();
        if (auto format = parse_document_format(ext)) {
            return format;
        }
    }

    if (bytes.size() >= 5 && std::memcmp(bytes.data(), "%PDF-", 5) == 0) {
        return DocumentFormat::Pdf;
    }
    if (bytes.size() >= 4 && std::memcmp(bytes.data(), "PK\x03\x04", 4) == 0) {
        return DocumentFormat::Docx;
    }
    return std::nullopt;
}

void check_block_alignment(const DocumentScaffold& scaffold,
                           const std::vector<TextBlock>& redacted_blocks) {
    if (redacted_blocks.size() != scaffold.block_count()) {
        throw ReconstructionError("Redacted block count does not match the extracted document",
                                  "expected " + std::to_string(scaffold.block_count()) +
                                  ", got " + std::to_string(redacted_blocks.size()));
    }
}

} // namespace redactor
