#pragma once

#include <string>
#include <utility>
#include <vector>

#include "redactor/format/adapter.hpp"

namespace redactor {

/**
 * Text-free copy of an XML element: name, attributes and child elements.
 * Text nodes are never stored, so a scaffold built from XmlNodes cannot carry
 * document content into the output.
 */
struct XmlNode {
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<XmlNode> children;
};

struct DocxParagraphShape {
    XmlNode paragraph_properties;   // whitelisted w:pPr (empty name = none)
    XmlNode run_properties;         // whitelisted w:rPr of the first text run
};

struct DocxCellShape {
    XmlNode cell_properties;        // whitelisted w:tcPr
    DocxParagraphShape paragraph;
};

struct DocxTableShape {
    XmlNode table_properties;       // whitelisted w:tblPr
    XmlNode grid;                   // w:tblGrid
    std::vector<std::vector<DocxCellShape>> rows;
};

struct DocxBodyItem {
    enum class Kind { Paragraph, Table };
    Kind kind = Kind::Paragraph;
    DocxParagraphShape paragraph;
    DocxTableShape table;
};

struct DocxPartShape {
    std::string source;             // original part name, for logging only
    bool header = true;             // header or footer
    std::string reference_id;       // r:id used by the section properties
    std::vector<DocxParagraphShape> paragraphs;
};

/**
 * Scaffold of a structured-flow document. Block order: body items (one
 * block per paragraph, one per table cell in row/cell order), then every
 * header/footer paragraph part by part, then core properties.
 */
class DocxScaffold : public DocumentScaffold {
public:
    std::vector<DocxBodyItem> body;
    XmlNode section_properties;     // body-level w:sectPr, references remapped
    std::vector<DocxPartShape> parts;
    XmlNode styles;                 // whitelisted w:styles (empty name = none)
    XmlNode numbering;              // w:numbering skeleton (empty name = none)
    std::vector<std::string> property_keys;   // "dc:title", "cp:keywords", ...
    size_t sections = 1;

    DocumentFormat format() const override { return DocumentFormat::Docx; }
    size_t units() const override { return sections; }
    size_t block_count() const override;
};

/**
 * Structured-flow adapter (miniz + tinyxml2).
 *
 * extract(): body paragraphs, table cells, header/footer paragraphs and core
 * properties as TextBlocks; w:tab becomes '\t', w:br '\n'.
 *
 * reconstruct(): a fresh package containing only regenerated parts. Original
 * runs are never carried; paragraph, run, table and cell formatting pass
 * through element whitelists. Comments, footnotes, media and any other part
 * are left out and their omission is logged by part name.
 */
class DocxAdapter : public FormatAdapter {
public:
    DocumentFormat format() const override { return DocumentFormat::Docx; }
    std::string name() const override { return "docx"; }

    bool probe(const ByteBuffer& bytes) const override;
    ExtractedDocument extract(const ByteBuffer& bytes) const override;
    ByteBuffer reconstruct(const DocumentScaffold& scaffold,
                           const std::vector<TextBlock>& redacted_blocks) const override;

    // Core property elements scanned as Property blocks
    static const std::vector<std::string>& property_elements();
};

} // namespace redactor
