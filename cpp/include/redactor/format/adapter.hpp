/**
 * Format Adapter Contract
 * =======================
 *
 * An adapter turns document bytes into an ordered list of TextBlocks plus a
 * scaffold describing the document's structure (page geometry, paragraph and
 * table formatting, metadata keys), and later regenerates a brand-new
 * document from the scaffold and the redacted blocks.
 *
 * Reconstruction never copies original text-bearing objects: the output is
 * built from the redacted blocks alone, so nothing from the source survives
 * except structure.
 *
 * Both operations are all-or-nothing: an undecodable part fails extraction
 * with ExtractionError, an element that cannot be regenerated fails
 * reconstruction with ReconstructionError.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "redactor/config.hpp"
#include "redactor/types.hpp"

namespace redactor {

/**
 * Structure retained between extract() and reconstruct(). Holds no text
 * content; every string that reaches the output comes from a TextBlock.
 */
class DocumentScaffold {
public:
    virtual ~DocumentScaffold() = default;
    virtual DocumentFormat format() const = 0;

    // Pages (paginated flow) or sections (structured flow)
    virtual size_t units() const = 0;

    // Number of TextBlocks extract() produced alongside this scaffold
    virtual size_t block_count() const = 0;
};

struct ExtractedDocument {
    std::vector<TextBlock> blocks;
    std::unique_ptr<DocumentScaffold> scaffold;

    // All block contents joined with '\n', in block order
    std::string joined_text() const;
};

class FormatAdapter {
public:
    virtual ~FormatAdapter() = default;

    virtual DocumentFormat format() const = 0;
    virtual std::string name() const = 0;

    // Cheap signature check; does not parse the document
    virtual bool probe(const ByteBuffer& bytes) const = 0;

    virtual ExtractedDocument extract(const ByteBuffer& bytes) const = 0;

    /**
     * Build a new document.
     * @param scaffold       scaffold returned by extract() of this adapter
     * @param redacted_blocks blocks in the same order and locations as extracted
     */
    virtual ByteBuffer reconstruct(const DocumentScaffold& scaffold,
                                   const std::vector<TextBlock>& redacted_blocks) const = 0;
};

// Adapter for a format, configured from the process configuration
std::unique_ptr<FormatAdapter> make_adapter(DocumentFormat format, const RedactorConfig& config);

/**
 * Resolve the document format from the file name extension, falling back to
 * the leading signature bytes ("%PDF-" or a ZIP local header).
 */
std::optional<DocumentFormat> detect_format(const ByteBuffer& bytes, std::string_view filename = {});

// Throws ReconstructionError unless the blocks line up one-to-one with the scaffold
void check_block_alignment(const DocumentScaffold& scaffold,
                           const std::vector<TextBlock>& redacted_blocks);

} // namespace redactor
