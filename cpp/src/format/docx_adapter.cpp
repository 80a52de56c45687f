#include "redactor/format/docx_adapter.hpp"
#include "redactor/error.hpp"
#include "redactor/format/zip_archive.hpp"
#include "redactor/logging.hpp"

#include <tinyxml2.h>

#include <cstring>
#include <initializer_list>
#include <map>
#include <set>

namespace redactor {

namespace {

using tinyxml2::XMLElement;
using tinyxml2::XMLPrinter;

// =============================================================================
// Package constants
// =============================================================================

constexpr const char* kDocumentPart = "word/document.xml";
constexpr const char* kDocumentRelsPart = "word/_rels/document.xml.rels";
constexpr const char* kStylesPart = "word/styles.xml";
constexpr const char* kNumberingPart = "word/numbering.xml";
constexpr const char* kCorePart = "docProps/core.xml";

constexpr const char* kNsW = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kNsR = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kNsRels = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kNsTypes = "http://schemas.openxmlformats.org/package/2006/content-types";
constexpr const char* kRelBase = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";
constexpr const char* kCtBase = "application/vnd.openxmlformats-officedocument.wordprocessingml.";

// Formatting allowed through to the regenerated document
const std::set<std::string> kParagraphProps = {
    "w:pStyle", "w:jc", "w:numPr", "w:spacing", "w:ind", "w:keepNext", "w:keepLines",
    "w:pageBreakBefore", "w:outlineLvl"};
const std::set<std::string> kRunProps = {
    "w:rStyle", "w:b", "w:bCs", "w:i", "w:iCs", "w:u", "w:sz", "w:szCs", "w:rFonts",
    "w:color", "w:highlight", "w:caps", "w:smallCaps", "w:strike"};
const std::set<std::string> kTableProps = {
    "w:tblStyle", "w:tblW", "w:tblBorders", "w:tblLook", "w:jc", "w:tblLayout", "w:tblInd"};
const std::set<std::string> kCellProps = {
    "w:tcW", "w:gridSpan", "w:vMerge", "w:shd", "w:vAlign", "w:tcBorders"};
const std::set<std::string> kSectionProps = {
    "w:pgSz", "w:pgMar", "w:cols", "w:titlePg", "w:docGrid", "w:type"};
// w:name and w:aliases are free text and are not carried
const std::set<std::string> kStyleChildren = {
    "w:basedOn", "w:next", "w:link", "w:qFormat", "w:uiPriority"};

bool is_named(const XMLElement* e, const char* name) {
    return e && std::strcmp(e->Name(), name) == 0;
}

const XMLElement* find_child(const XMLElement* parent, const char* name) {
    return parent ? parent->FirstChildElement(name) : nullptr;
}

void parse_xml(tinyxml2::XMLDocument& doc, const std::string& xml, const std::string& part) {
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS || !doc.RootElement()) {
        throw ExtractionError("Malformed XML part", part);
    }
}

// =============================================================================
// Text-free element copies
// =============================================================================

XmlNode skeleton(const XMLElement* e) {
    XmlNode node;
    node.name = e->Name();
    for (const auto* attr = e->FirstAttribute(); attr; attr = attr->Next()) {
        // Only WordprocessingML attributes; foreign namespaces are not declared in the output
        if (std::strncmp(attr->Name(), "w:", 2) == 0) {
            node.attributes.emplace_back(attr->Name(), attr->Value());
        }
    }
    for (const auto* child = e->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (std::strncmp(child->Name(), "w:", 2) == 0) {
            node.children.push_back(skeleton(child));
        }
    }
    return node;
}

XmlNode filtered(const XMLElement* e, const std::set<std::string>& allowed) {
    XmlNode node;
    if (!e) return node;
    node.name = e->Name();
    for (const auto* child = e->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (allowed.count(child->Name())) {
            node.children.push_back(skeleton(child));
        }
    }
    return node;
}

XmlNode filtered_styles(const XMLElement* root) {
    XmlNode styles;
    styles.name = "w:styles";

    for (const auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (is_named(child, "w:docDefaults")) {
            XmlNode defaults;
            defaults.name = "w:docDefaults";
            if (const auto* rdef = find_child(child, "w:rPrDefault")) {
                XmlNode node;
                node.name = "w:rPrDefault";
                if (const auto* rpr = find_child(rdef, "w:rPr")) node.children.push_back(filtered(rpr, kRunProps));
                defaults.children.push_back(std::move(node));
            }
            if (const auto* pdef = find_child(child, "w:pPrDefault")) {
                XmlNode node;
                node.name = "w:pPrDefault";
                if (const auto* ppr = find_child(pdef, "w:pPr")) node.children.push_back(filtered(ppr, kParagraphProps));
                defaults.children.push_back(std::move(node));
            }
            styles.children.push_back(std::move(defaults));
        } else if (is_named(child, "w:style")) {
            XmlNode style = skeleton(child);
            style.children.clear();
            for (const auto* part = child->FirstChildElement(); part; part = part->NextSiblingElement()) {
                if (kStyleChildren.count(part->Name())) {
                    style.children.push_back(skeleton(part));
                } else if (is_named(part, "w:pPr")) {
                    style.children.push_back(filtered(part, kParagraphProps));
                } else if (is_named(part, "w:rPr")) {
                    style.children.push_back(filtered(part, kRunProps));
                } else if (is_named(part, "w:tblPr")) {
                    style.children.push_back(filtered(part, kTableProps));
                }
            }
            styles.children.push_back(std::move(style));
        }
    }
    return styles;
}

// Copy only the named attributes of e
XmlNode with_attributes(const XMLElement* e, std::initializer_list<const char*> names) {
    XmlNode node;
    node.name = e->Name();
    for (const char* name : names) {
        if (const char* value = e->Attribute(name)) node.attributes.emplace_back(name, value);
    }
    return node;
}

/**
 * Numbering definitions rebuilt from a whitelist. Level label text (w:lvlText)
 * is rendered in the document but never extracted, so it is replaced by a
 * neutral "%N." label, or a plain bullet for bullet levels.
 */
XmlNode neutral_numbering(const XMLElement* root) {
    XmlNode numbering;
    numbering.name = "w:numbering";

    for (const auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (is_named(child, "w:abstractNum")) {
            XmlNode abstract = with_attributes(child, {"w:abstractNumId"});
            for (const auto* part = child->FirstChildElement(); part; part = part->NextSiblingElement()) {
                if (is_named(part, "w:multiLevelType")) {
                    abstract.children.push_back(with_attributes(part, {"w:val"}));
                    continue;
                }
                if (!is_named(part, "w:lvl")) continue;

                XmlNode lvl = with_attributes(part, {"w:ilvl"});
                const int ilvl = part->IntAttribute("w:ilvl", 0);
                const auto* fmt = find_child(part, "w:numFmt");
                const bool bullet = fmt && fmt->Attribute("w:val", "bullet");

                // Children in schema order
                for (const char* name : {"w:start", "w:numFmt", "w:lvlRestart", "w:suff"}) {
                    if (const auto* item = find_child(part, name)) lvl.children.push_back(with_attributes(item, {"w:val"}));
                }
                XmlNode label;
                label.name = "w:lvlText";
                label.attributes.emplace_back(
                    "w:val", bullet ? std::string("\xE2\x80\xA2") : "%" + std::to_string(ilvl + 1) + ".");
                lvl.children.push_back(std::move(label));
                if (const auto* jc = find_child(part, "w:lvlJc")) lvl.children.push_back(with_attributes(jc, {"w:val"}));
                if (const auto* ppr = find_child(part, "w:pPr")) lvl.children.push_back(filtered(ppr, kParagraphProps));
                abstract.children.push_back(std::move(lvl));
            }
            numbering.children.push_back(std::move(abstract));
        } else if (is_named(child, "w:num")) {
            XmlNode num = with_attributes(child, {"w:numId"});
            if (const auto* ref = find_child(child, "w:abstractNumId")) {
                num.children.push_back(with_attributes(ref, {"w:val"}));
            }
            for (const auto* over = child->FirstChildElement("w:lvlOverride"); over;
                 over = over->NextSiblingElement("w:lvlOverride")) {
                XmlNode node = with_attributes(over, {"w:ilvl"});
                if (const auto* start = find_child(over, "w:startOverride")) {
                    node.children.push_back(with_attributes(start, {"w:val"}));
                }
                num.children.push_back(std::move(node));
            }
            numbering.children.push_back(std::move(num));
        }
    }
    return numbering;
}

// =============================================================================
// Text collection
// =============================================================================

void collect_text(const XMLElement* node, std::string& out) {
    for (const auto* child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
        const char* name = child->Name();
        if (std::strcmp(name, "w:t") == 0) {
            if (const char* text = child->GetText()) out += text;
        } else if (std::strcmp(name, "w:tab") == 0 || std::strcmp(name, "w:ptab") == 0) {
            out.push_back('\t');
        } else if (std::strcmp(name, "w:br") == 0 || std::strcmp(name, "w:cr") == 0) {
            out.push_back('\n');
        } else if (std::strcmp(name, "w:noBreakHyphen") == 0) {
            out.push_back('-');
        } else if (std::strcmp(name, "w:pPr") == 0 || std::strcmp(name, "w:rPr") == 0 ||
                   std::strcmp(name, "w:instrText") == 0 || std::strcmp(name, "w:delText") == 0 ||
                   std::strcmp(name, "mc:Fallback") == 0) {
            continue;
        } else if (std::strcmp(name, "w:p") == 0) {
            // paragraph nested in a text box
            if (!out.empty() && out.back() != '\n') out.push_back('\n');
            collect_text(child, out);
        } else {
            collect_text(child, out);
        }
    }
}

std::string paragraph_text(const XMLElement* p) {
    std::string text;
    collect_text(p, text);
    return text;
}

DocxParagraphShape paragraph_shape(const XMLElement* p) {
    DocxParagraphShape shape;
    if (const auto* ppr = find_child(p, "w:pPr")) {
        shape.paragraph_properties = filtered(ppr, kParagraphProps);
    }
    for (const auto* run = p->FirstChildElement("w:r"); run; run = run->NextSiblingElement("w:r")) {
        if (find_child(run, "w:t")) {
            if (const auto* rpr = find_child(run, "w:rPr")) {
                shape.run_properties = filtered(rpr, kRunProps);
            }
            break;
        }
    }
    return shape;
}

// Flatten a cell (paragraphs and any nested tables) into '\n'-separated text
void collect_cell(const XMLElement* container, std::vector<std::string>& lines,
                  DocxParagraphShape& shape, bool& shape_set) {
    for (const auto* child = container->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (is_named(child, "w:p")) {
            if (!shape_set) {
                shape = paragraph_shape(child);
                shape_set = true;
            }
            lines.push_back(paragraph_text(child));
        } else if (is_named(child, "w:tbl")) {
            for (const auto* row = child->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
                for (const auto* cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
                    collect_cell(cell, lines, shape, shape_set);
                }
            }
        } else if (is_named(child, "w:sdt")) {
            if (const auto* content = find_child(child, "w:sdtContent")) {
                collect_cell(content, lines, shape, shape_set);
            }
        }
    }
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

// =============================================================================
// Extraction state
// =============================================================================

struct SectionReference {
    bool header;
    std::string type;
    std::string original_id;
};

class BodyWalker {
public:
    BodyWalker(DocxScaffold& scaffold, std::vector<TextBlock>& blocks)
        : scaffold_(scaffold), blocks_(blocks) {}

    void walk(const XMLElement* container) {
        for (const auto* child = container->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (is_named(child, "w:p")) {
                add_paragraph(child);
            } else if (is_named(child, "w:tbl")) {
                add_table(child);
            } else if (is_named(child, "w:sdt")) {
                if (const auto* content = find_child(child, "w:sdtContent")) walk(content);
            } else if (is_named(child, "w:sectPr")) {
                body_section_ = child;
                note_references(child);
            }
        }
    }

    const XMLElement* body_section() const { return body_section_; }
    size_t paragraph_sections() const { return paragraph_sections_; }
    const std::vector<SectionReference>& references() const { return references_; }

private:
    void add_paragraph(const XMLElement* p) {
        if (const auto* sect = find_child(find_child(p, "w:pPr"), "w:sectPr")) {
            ++paragraph_sections_;
            note_references(sect);
        }

        DocxBodyItem item;
        item.kind = DocxBodyItem::Kind::Paragraph;
        item.paragraph = paragraph_shape(p);
        scaffold_.body.push_back(std::move(item));

        TextBlock block;
        block.content = paragraph_text(p);
        block.location.kind = LocationKind::Paragraph;
        block.location.paragraph = paragraph_index_++;
        block.location.order = blocks_.size();
        blocks_.push_back(std::move(block));
    }

    void add_table(const XMLElement* tbl) {
        DocxBodyItem item;
        item.kind = DocxBodyItem::Kind::Table;
        item.table.table_properties = filtered(find_child(tbl, "w:tblPr"), kTableProps);
        if (const auto* grid = find_child(tbl, "w:tblGrid")) item.table.grid = skeleton(grid);

        size_t row_index = 0;
        for (const auto* row = tbl->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
            std::vector<DocxCellShape> cells;
            size_t cell_index = 0;
            for (const auto* cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
                DocxCellShape shape;
                shape.cell_properties = filtered(find_child(cell, "w:tcPr"), kCellProps);

                std::vector<std::string> lines;
                bool shape_set = false;
                collect_cell(cell, lines, shape.paragraph, shape_set);
                cells.push_back(std::move(shape));

                TextBlock block;
                block.content = join_lines(lines);
                block.location.kind = LocationKind::TableCell;
                block.location.table = table_index_;
                block.location.row = row_index;
                block.location.cell = cell_index++;
                block.location.order = blocks_.size();
                blocks_.push_back(std::move(block));
            }
            item.table.rows.push_back(std::move(cells));
            ++row_index;
        }

        scaffold_.body.push_back(std::move(item));
        ++table_index_;
    }

    void note_references(const XMLElement* sect) {
        for (const auto* child = sect->FirstChildElement(); child; child = child->NextSiblingElement()) {
            const bool header = is_named(child, "w:headerReference");
            if (!header && !is_named(child, "w:footerReference")) continue;
            const char* id = child->Attribute("r:id");
            const char* type = child->Attribute("w:type");
            if (!id) continue;
            references_.push_back({header, type ? type : "default", id});
        }
    }

    DocxScaffold& scaffold_;
    std::vector<TextBlock>& blocks_;
    const XMLElement* body_section_ = nullptr;
    size_t paragraph_sections_ = 0;
    size_t paragraph_index_ = 0;
    size_t table_index_ = 0;
    std::vector<SectionReference> references_;
};

std::map<std::string, std::string> read_relationships(const ZipReader& zip) {
    std::map<std::string, std::string> targets;
    auto xml = zip.read(kDocumentRelsPart);
    if (!xml) return targets;

    tinyxml2::XMLDocument doc;
    parse_xml(doc, *xml, kDocumentRelsPart);
    for (const auto* rel = doc.RootElement()->FirstChildElement("Relationship"); rel;
         rel = rel->NextSiblingElement("Relationship")) {
        const char* id = rel->Attribute("Id");
        const char* target = rel->Attribute("Target");
        const char* mode = rel->Attribute("TargetMode");
        if (!id || !target || (mode && std::strcmp(mode, "External") == 0)) continue;

        std::string path = target;
        if (!path.empty() && path.front() == '/') {
            path.erase(0, 1);
        } else {
            path = "word/" + path;
        }
        targets[id] = path;
    }
    return targets;
}

void collect_part_paragraphs(const XMLElement* container, DocxPartShape& part,
                             std::vector<TextBlock>& blocks) {
    for (const auto* child = container->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (is_named(child, "w:p")) {
            part.paragraphs.push_back(paragraph_shape(child));

            TextBlock block;
            block.content = paragraph_text(child);
            block.location.kind = LocationKind::HeaderFooter;
            block.location.part = part.reference_id;
            block.location.paragraph = part.paragraphs.size() - 1;
            block.location.order = blocks.size();
            blocks.push_back(std::move(block));
        } else if (is_named(child, "w:tbl")) {
            for (const auto* row = child->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
                for (const auto* cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
                    collect_part_paragraphs(cell, part, blocks);
                }
            }
        } else if (is_named(child, "w:sdt")) {
            if (const auto* content = find_child(child, "w:sdtContent")) {
                collect_part_paragraphs(content, part, blocks);
            }
        }
    }
}

// =============================================================================
// Writing
// =============================================================================

std::string printed(const XMLPrinter& printer) {
    return std::string(printer.CStr(), printer.CStrSize() > 0 ? printer.CStrSize() - 1 : 0);
}

void open(XMLPrinter& p, const char* name) {
    p.OpenElement(name, true);
}

void close(XMLPrinter& p) {
    p.CloseElement(true);
}

void write_node(XMLPrinter& p, const XmlNode& node) {
    if (node.name.empty()) return;
    open(p, node.name.c_str());
    for (const auto& [key, value] : node.attributes) {
        p.PushAttribute(key.c_str(), value.c_str());
    }
    for (const auto& child : node.children) {
        write_node(p, child);
    }
    close(p);
}

void write_runs(XMLPrinter& p, const XmlNode& rpr, const std::string& text) {
    std::string segment;
    auto run = [&](const char* empty_element) {
        open(p, "w:r");
        write_node(p, rpr);
        if (empty_element) {
            open(p, empty_element);
            close(p);
        } else {
            open(p, "w:t");
            p.PushAttribute("xml:space", "preserve");
            p.PushText(segment.c_str());
            close(p);
        }
        close(p);
    };
    auto flush = [&]() {
        if (segment.empty()) return;
        run(nullptr);
        segment.clear();
    };

    for (char c : text) {
        if (c == '\t') {
            flush();
            run("w:tab");
        } else if (c == '\n') {
            flush();
            run("w:br");
        } else if (c != '\r') {
            segment.push_back(c);
        }
    }
    flush();
}

void write_paragraph(XMLPrinter& p, const DocxParagraphShape& shape, const std::string& text) {
    open(p, "w:p");
    write_node(p, shape.paragraph_properties);
    write_runs(p, shape.run_properties, text);
    close(p);
}

void write_cell_paragraphs(XMLPrinter& p, const DocxParagraphShape& shape, const std::string& text) {
    size_t start = 0;
    while (true) {
        const size_t nl = text.find('\n', start);
        write_paragraph(p, shape, text.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
}

void push_declaration(XMLPrinter& p) {
    p.PushDeclaration("xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"");
}

class BlockCursor {
public:
    explicit BlockCursor(const std::vector<TextBlock>& blocks) : blocks_(blocks) {}

    const std::string& next(LocationKind expected) {
        if (index_ >= blocks_.size() || blocks_[index_].location.kind != expected) {
            throw ReconstructionError("Redacted blocks do not follow the document structure",
                                      "block " + std::to_string(index_) + ", expected " + to_string(expected));
        }
        return blocks_[index_++].content;
    }

private:
    const std::vector<TextBlock>& blocks_;
    size_t index_ = 0;
};

std::string part_file(const DocxPartShape& part, size_t index) {
    return std::string(part.header ? "header" : "footer") + std::to_string(index + 1) + ".xml";
}

} // namespace

// =============================================================================
// DocxScaffold
// =============================================================================

size_t DocxScaffold::block_count() const {
    size_t count = property_keys.size();
    for (const auto& item : body) {
        if (item.kind == DocxBodyItem::Kind::Paragraph) {
            ++count;
        } else {
            for (const auto& row : item.table.rows) count += row.size();
        }
    }
    for (const auto& part : parts) count += part.paragraphs.size();
    return count;
}

// =============================================================================
// DocxAdapter
// =============================================================================

const std::vector<std::string>& DocxAdapter::property_elements() {
    static const std::vector<std::string> elements = {
        "dc:title", "dc:subject", "dc:creator", "cp:keywords", "dc:description", "cp:lastModifiedBy"};
    return elements;
}

bool DocxAdapter::probe(const ByteBuffer& bytes) const {
    return bytes.size() >= 4 && std::memcmp(bytes.data(), "PK\x03\x04", 4) == 0;
}

ExtractedDocument DocxAdapter::extract(const ByteBuffer& bytes) const {
    if (!probe(bytes)) {
        throw ExtractionError("Not a DOCX package", "missing ZIP signature");
    }

    ZipReader zip(bytes);
    auto document_xml = zip.read(kDocumentPart);
    if (!document_xml) {
        throw ExtractionError("DOCX package has no main document part", kDocumentPart);
    }

    ExtractedDocument doc;
    auto scaffold = std::make_unique<DocxScaffold>();

    tinyxml2::XMLDocument document;
    parse_xml(document, *document_xml, kDocumentPart);
    const XMLElement* body = find_child(document.RootElement(), "w:body");
    if (!body) {
        throw ExtractionError("Main document part has no body", kDocumentPart);
    }

    BodyWalker walker(*scaffold, doc.blocks);
    walker.walk(body);
    scaffold->sections = walker.paragraph_sections() + 1;

    // Headers and footers referenced from any section
    const auto targets = read_relationships(zip);
    std::map<std::string, std::string> new_ids;    // original r:id -> regenerated r:id
    std::set<std::string> kept_parts = {"[Content_Types].xml", "_rels/.rels", kDocumentPart,
                                        kDocumentRelsPart, kStylesPart, kNumberingPart, kCorePart};

    for (const auto& ref : walker.references()) {
        if (new_ids.count(ref.original_id)) continue;
        auto target = targets.find(ref.original_id);
        if (target == targets.end()) {
            throw ExtractionError("Section references a missing header/footer relationship", ref.original_id);
        }
        auto xml = zip.read(target->second);
        if (!xml) {
            throw ExtractionError("Header/footer part missing from package", target->second);
        }

        DocxPartShape part;
        part.source = target->second;
        part.header = ref.header;
        part.reference_id = "rIdPart" + std::to_string(scaffold->parts.size() + 1);
        new_ids[ref.original_id] = part.reference_id;

        tinyxml2::XMLDocument part_doc;
        parse_xml(part_doc, *xml, target->second);
        collect_part_paragraphs(part_doc.RootElement(), part, doc.blocks);
        scaffold->parts.push_back(std::move(part));
        kept_parts.insert(target->second);
    }

    if (const XMLElement* sect = walker.body_section()) {
        XmlNode section = filtered(sect, kSectionProps);
        for (const auto* child = sect->FirstChildElement(); child; child = child->NextSiblingElement()) {
            const bool header = is_named(child, "w:headerReference");
            if (!header && !is_named(child, "w:footerReference")) continue;
            const char* id = child->Attribute("r:id");
            if (!id || !new_ids.count(id)) continue;

            XmlNode ref;
            ref.name = child->Name();
            ref.attributes.emplace_back("w:type", child->Attribute("w:type") ? child->Attribute("w:type") : "default");
            ref.attributes.emplace_back("r:id", new_ids[id]);
            // references precede every other section property
            section.children.insert(section.children.begin(), std::move(ref));
        }
        scaffold->section_properties = std::move(section);
    }

    if (auto styles_xml = zip.read(kStylesPart)) {
        tinyxml2::XMLDocument styles;
        parse_xml(styles, *styles_xml, kStylesPart);
        scaffold->styles = filtered_styles(styles.RootElement());
    }

    if (auto numbering_xml = zip.read(kNumberingPart)) {
        tinyxml2::XMLDocument numbering;
        parse_xml(numbering, *numbering_xml, kNumberingPart);
        scaffold->numbering = neutral_numbering(numbering.RootElement());
    }

    if (auto core_xml = zip.read(kCorePart)) {
        tinyxml2::XMLDocument core;
        parse_xml(core, *core_xml, kCorePart);
        for (const auto& key : property_elements()) {
            const XMLElement* element = core.RootElement()->FirstChildElement(key.c_str());
            if (!element) continue;

            scaffold->property_keys.push_back(key);
            TextBlock block;
            block.content = element->GetText() ? element->GetText() : "";
            block.location.kind = LocationKind::Property;
            block.location.part = key;
            block.location.order = doc.blocks.size();
            doc.blocks.push_back(std::move(block));
        }
    }

    for (const auto& entry : zip.entries()) {
        if (!entry.empty() && entry.back() != '/' && !kept_parts.count(entry)) {
            LOG_INFO("DOCX part not carried into output: ", entry);
        }
    }

    LOG_DEBUG("DOCX extracted: ", doc.blocks.size(), " blocks, ", scaffold->parts.size(),
              " header/footer parts, ", scaffold->sections, " sections");
    doc.scaffold = std::move(scaffold);
    return doc;
}

ByteBuffer DocxAdapter::reconstruct(const DocumentScaffold& scaffold,
                                    const std::vector<TextBlock>& redacted_blocks) const {
    const auto* docx = dynamic_cast<const DocxScaffold*>(&scaffold);
    if (!docx) {
        throw ReconstructionError("Scaffold was not produced by the DOCX adapter", to_string(scaffold.format()));
    }
    check_block_alignment(scaffold, redacted_blocks);

    BlockCursor cursor(redacted_blocks);
    ZipWriter zip;

    // ----- word/document.xml -----
    {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, "w:document");
        p.PushAttribute("xmlns:w", kNsW);
        p.PushAttribute("xmlns:r", kNsR);
        open(p, "w:body");

        for (const auto& item : docx->body) {
            if (item.kind == DocxBodyItem::Kind::Paragraph) {
                write_paragraph(p, item.paragraph, cursor.next(LocationKind::Paragraph));
                continue;
            }

            open(p, "w:tbl");
            write_node(p, item.table.table_properties);
            write_node(p, item.table.grid);
            for (const auto& row : item.table.rows) {
                open(p, "w:tr");
                for (const auto& cell : row) {
                    open(p, "w:tc");
                    write_node(p, cell.cell_properties);
                    write_cell_paragraphs(p, cell.paragraph, cursor.next(LocationKind::TableCell));
                    close(p);
                }
                close(p);
            }
            close(p);
        }

        write_node(p, docx->section_properties);
        close(p);  // w:body
        close(p);  // w:document
        zip.add(kDocumentPart, printed(p));
    }

    // ----- headers / footers -----
    for (size_t i = 0; i < docx->parts.size(); ++i) {
        const auto& part = docx->parts[i];
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, part.header ? "w:hdr" : "w:ftr");
        p.PushAttribute("xmlns:w", kNsW);
        p.PushAttribute("xmlns:r", kNsR);
        for (const auto& shape : part.paragraphs) {
            write_paragraph(p, shape, cursor.next(LocationKind::HeaderFooter));
        }
        if (part.paragraphs.empty()) {
            open(p, "w:p");
            close(p);
        }
        close(p);
        zip.add("word/" + part_file(part, i), printed(p));
    }

    // ----- styles / numbering -----
    if (!docx->styles.name.empty()) {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        XmlNode root = docx->styles;
        root.attributes.insert(root.attributes.begin(), {"xmlns:w", kNsW});
        write_node(p, root);
        zip.add(kStylesPart, printed(p));
    }
    if (!docx->numbering.name.empty()) {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        XmlNode root = docx->numbering;
        root.attributes.insert(root.attributes.begin(), {"xmlns:w", kNsW});
        write_node(p, root);
        zip.add(kNumberingPart, printed(p));
    }

    // ----- docProps/core.xml -----
    {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, "cp:coreProperties");
        p.PushAttribute("xmlns:cp", "http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
        p.PushAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
        p.PushAttribute("xmlns:dcterms", "http://purl.org/dc/terms/");
        p.PushAttribute("xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");
        for (const auto& key : docx->property_keys) {
            const std::string& value = cursor.next(LocationKind::Property);
            open(p, key.c_str());
            p.PushText(value.c_str());
            close(p);
        }
        close(p);
        zip.add(kCorePart, printed(p));
    }

    // ----- relationships -----
    {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, "Relationships");
        p.PushAttribute("xmlns", kNsRels);
        auto relationship = [&p](const std::string& id, const std::string& type, const std::string& target) {
            open(p, "Relationship");
            p.PushAttribute("Id", id.c_str());
            p.PushAttribute("Type", (kRelBase + type).c_str());
            p.PushAttribute("Target", target.c_str());
            close(p);
        };
        if (!docx->styles.name.empty()) relationship("rIdStyles", "styles", "styles.xml");
        if (!docx->numbering.name.empty()) relationship("rIdNumbering", "numbering", "numbering.xml");
        for (size_t i = 0; i < docx->parts.size(); ++i) {
            const auto& part = docx->parts[i];
            relationship(part.reference_id, part.header ? "header" : "footer", part_file(part, i));
        }
        close(p);
        zip.add(kDocumentRelsPart, printed(p));
    }
    {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, "Relationships");
        p.PushAttribute("xmlns", kNsRels);
        open(p, "Relationship");
        p.PushAttribute("Id", "rId1");
        p.PushAttribute("Type", (std::string(kRelBase) + "officeDocument").c_str());
        p.PushAttribute("Target", kDocumentPart);
        close(p);
        open(p, "Relationship");
        p.PushAttribute("Id", "rId2");
        p.PushAttribute("Type", "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties");
        p.PushAttribute("Target", kCorePart);
        close(p);
        close(p);
        zip.add("_rels/.rels", printed(p));
    }

    // ----- [Content_Types].xml -----
    {
        XMLPrinter p(nullptr, true);
        push_declaration(p);
        open(p, "Types");
        p.PushAttribute("xmlns", kNsTypes);
        auto default_type = [&p](const char* ext, const char* type) {
            open(p, "Default");
            p.PushAttribute("Extension", ext);
            p.PushAttribute("ContentType", type);
            close(p);
        };
        auto override_type = [&p](const std::string& part, const std::string& type) {
            open(p, "Override");
            p.PushAttribute("PartName", ("/" + part).c_str());
            p.PushAttribute("ContentType", type.c_str());
            close(p);
        };
        default_type("rels", "application/vnd.openxmlformats-package.relationships+xml");
        default_type("xml", "application/xml");
        override_type(kDocumentPart, std::string(kCtBase) + "document.main+xml");
        if (!docx->styles.name.empty()) override_type(kStylesPart, std::string(kCtBase) + "styles+xml");
        if (!docx->numbering.name.empty()) override_type(kNumberingPart, std::string(kCtBase) + "numbering+xml");
        for (size_t i = 0; i < docx->parts.size(); ++i) {
            const auto& part = docx->parts[i];
            override_type("word/" + part_file(part, i),
                          std::string(kCtBase) + (part.header ? "header+xml" : "footer+xml"));
        }
        override_type(kCorePart, "application/vnd.openxmlformats-package.core-properties+xml");
        close(p);
        zip.add("[Content_Types].xml", printed(p));
    }

    return zip.finish();
}

} // namespace redactor
