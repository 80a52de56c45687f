#pragma once

#include <string>
#include <vector>

#include "redactor/format/adapter.hpp"

namespace redactor {

struct PageGeometry {
    double llx = 0.0;
    double lly = 0.0;
    double urx = 612.0;
    double ury = 792.0;

    double width() const { return urx - llx; }
    double height() const { return ury - lly; }
};

/**
 * Scaffold of a paginated document: page boxes and the metadata keys that
 * carried text. Block order is one Page block per page, then one Property
 * block per key.
 */
class PdfScaffold : public DocumentScaffold {
public:
    std::vector<PageGeometry> pages;
    std::vector<std::string> property_keys;     // "/Title", "/Author", ...

    DocumentFormat format() const override { return DocumentFormat::Pdf; }
    size_t units() const override { return pages.size(); }
    size_t block_count() const override { return pages.size() + property_keys.size(); }
};

/**
 * Paginated-flow adapter (qpdf).
 *
 * extract(): per-page text from the content streams (Tj, TJ, ', ") decoded
 * through the font's ToUnicode CMap, WinAnsi or PDFDocEncoding, plus the
 * free-text /Info entries.
 *
 * reconstruct(): a new PDF with one page per original page (same MediaBox),
 * redacted text set in Helvetica and wrapped to the page width. The font
 * shrinks down to the configured minimum to fit; text that still does not fit
 * raises ReconstructionError.
 */
class PdfAdapter : public FormatAdapter {
public:
    explicit PdfAdapter(PdfLayoutConfig layout = {});

    DocumentFormat format() const override { return DocumentFormat::Pdf; }
    std::string name() const override { return "pdf"; }

    bool probe(const ByteBuffer& bytes) const override;
    ExtractedDocument extract(const ByteBuffer& bytes) const override;
    ByteBuffer reconstruct(const DocumentScaffold& scaffold,
                           const std::vector<TextBlock>& redacted_blocks) const override;

    // /Info keys scanned as Property blocks
    static const std::vector<std::string>& info_keys();

    const PdfLayoutConfig& layout() const { return layout_; }

private:
    PdfLayoutConfig layout_;
};

} // namespace redactor
