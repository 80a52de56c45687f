#include "redactor/format/pdf_adapter.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"
#include "redactor/redact/token.hpp"
#include "redactor/util/utf8.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <map>
#include <sstream>

namespace redactor {

namespace {

// =============================================================================
// Encodings
// =============================================================================

// WinAnsiEncoding 0x80-0x9F; 0 marks an undefined code
constexpr uint16_t kWinAnsiHigh[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

uint32_t win_ansi_codepoint(uint8_t byte) {
    if (byte >= 0x80 && byte <= 0x9F) {
        const uint16_t cp = kWinAnsiHigh[byte - 0x80];
        return cp ? cp : 0xFFFD;
    }
    return byte;
}

std::string win_ansi_to_utf8(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        out += util::encode_utf8(win_ansi_codepoint(static_cast<uint8_t>(c)));
    }
    return out;
}

// Helvetica advance widths (AFM, 1/1000 em) for 0x20-0x7E
constexpr uint16_t kHelveticaAscii[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584,
};

double glyph_width(uint8_t byte) {
    if (byte >= 0x20 && byte <= 0x7E) return kHelveticaAscii[byte - 0x20];
    if (byte == 0x95) return 350;   // bullet
    return 667;                     // widest common Latin-1 letter
}

double text_width(const std::string& win_ansi, double font_size) {
    double units = 0.0;
    for (char c : win_ansi) units += glyph_width(static_cast<uint8_t>(c));
    return units * font_size / 1000.0;
}

// UTF-8 to WinAnsi; the mask character becomes the bullet glyph
std::string to_win_ansi(const std::string& utf8) {
    std::string prepared;
    prepared.reserve(utf8.size());
    size_t pos = 0;
    while (pos < utf8.size()) {
        if (utf8.compare(pos, kMaskChar.size(), kMaskChar.data(), kMaskChar.size()) == 0) {
            prepared += "\xE2\x80\xA2";
            pos += kMaskChar.size();
        } else if (utf8[pos] == '\t' || utf8[pos] == '\r') {
            prepared.push_back(' ');
            ++pos;
        } else {
            prepared.push_back(utf8[pos++]);
        }
    }
    std::string win;
    QUtil::utf8_to_win_ansi(prepared, win, '?');
    return win;
}

// =============================================================================
// ToUnicode CMaps
// =============================================================================

struct FontDecoder {
    enum class Base { WinAnsi, PdfDoc };

    Base base = Base::PdfDoc;
    bool has_cmap = false;
    size_t code_bytes = 1;
    std::map<uint32_t, std::string> cmap;

    std::string decode(const std::string& raw) const {
        if (!has_cmap) {
            return base == Base::WinAnsi ? win_ansi_to_utf8(raw) : QUtil::pdf_doc_to_utf8(raw);
        }
        std::string out;
        for (size_t i = 0; i + code_bytes <= raw.size(); i += code_bytes) {
            uint32_t code = 0;
            for (size_t k = 0; k < code_bytes; ++k) {
                code = (code << 8) | static_cast<uint8_t>(raw[i + k]);
            }
            auto it = cmap.find(code);
            if (it != cmap.end()) {
                out += it->second;
            } else if (code_bytes == 1) {
                out += util::encode_utf8(win_ansi_codepoint(static_cast<uint8_t>(code)));
            } else {
                out += util::encode_utf8(0xFFFD);
            }
        }
        return out;
    }
};

struct CMapToken {
    enum class Kind { Hex, Word, ArrayOpen, ArrayClose };
    Kind kind;
    std::string value;
};

std::vector<CMapToken> tokenize_cmap(const std::string& data) {
    std::vector<CMapToken> tokens;
    size_t i = 0;
    const size_t n = data.size();
    auto is_delim = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>' || c == '[' ||
               c == ']' || c == '(' || c == ')' || c == '/' || c == '%';
    };

    while (i < n) {
        const char c = data[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '%') {
            while (i < n && data[i] != '\n' && data[i] != '\r') ++i;
        } else if (c == '<' && i + 1 < n && data[i + 1] == '<') {
            i += 2;
        } else if (c == '>' && i + 1 < n && data[i + 1] == '>') {
            i += 2;
        } else if (c == '<') {
            const size_t close = data.find('>', i);
            if (close == std::string::npos) break;
            std::string hex;
            for (size_t k = i + 1; k < close; ++k) {
                if (std::isxdigit(static_cast<unsigned char>(data[k]))) hex.push_back(data[k]);
            }
            tokens.push_back({CMapToken::Kind::Hex, hex});
            i = close + 1;
        } else if (c == '[') {
            tokens.push_back({CMapToken::Kind::ArrayOpen, ""});
            ++i;
        } else if (c == ']') {
            tokens.push_back({CMapToken::Kind::ArrayClose, ""});
            ++i;
        } else if (c == '(') {
            // literal strings carry CMap names only
            while (i < n && data[i] != ')') ++i;
            ++i;
        } else {
            size_t start = i++;
            while (i < n && !is_delim(data[i])) ++i;
            tokens.push_back({CMapToken::Kind::Word, data.substr(start, i - start)});
        }
    }
    return tokens;
}

uint32_t hex_value(const std::string& hex) {
    return static_cast<uint32_t>(std::stoul(hex.empty() ? "0" : hex, nullptr, 16));
}

std::vector<uint16_t> hex_to_utf16(const std::string& hex) {
    std::vector<uint16_t> units;
    for (size_t i = 0; i + 4 <= hex.size(); i += 4) {
        units.push_back(static_cast<uint16_t>(std::stoul(hex.substr(i, 4), nullptr, 16)));
    }
    if (hex.size() % 4 == 2) {
        units.push_back(static_cast<uint16_t>(std::stoul(hex.substr(hex.size() - 2), nullptr, 16)));
    }
    return units;
}

std::string utf16_to_utf8(const std::vector<uint16_t>& units) {
    std::string out;
    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t cp = units[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < units.size() &&
            units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (units[i + 1] - 0xDC00);
            ++i;
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }
        out += util::encode_utf8(cp);
    }
    return out;
}

void parse_to_unicode(const std::string& data, FontDecoder& decoder) {
    const auto tokens = tokenize_cmap(data);
    bool width_known = false;
    auto note_width = [&](const std::string& hex) {
        if (!width_known && !hex.empty()) {
            decoder.code_bytes = std::max<size_t>(1, hex.size() / 2);
            width_known = true;
        }
    };

    size_t i = 0;
    auto is_hex = [&](size_t k) { return k < tokens.size() && tokens[k].kind == CMapToken::Kind::Hex; };
    auto is_word = [&](size_t k, const char* w) {
        return k < tokens.size() && tokens[k].kind == CMapToken::Kind::Word && tokens[k].value == w;
    };

    while (i < tokens.size()) {
        if (is_word(i, "begincodespacerange")) {
            ++i;
            while (i < tokens.size() && !is_word(i, "endcodespacerange")) {
                if (is_hex(i)) note_width(tokens[i].value);
                ++i;
            }
        } else if (is_word(i, "beginbfchar")) {
            ++i;
            while (is_hex(i) && is_hex(i + 1)) {
                note_width(tokens[i].value);
                decoder.cmap[hex_value(tokens[i].value)] = utf16_to_utf8(hex_to_utf16(tokens[i + 1].value));
                i += 2;
            }
        } else if (is_word(i, "beginbfrange")) {
            ++i;
            while (is_hex(i) && is_hex(i + 1)) {
                note_width(tokens[i].value);
                const uint32_t lo = hex_value(tokens[i].value);
                const uint32_t hi = std::min(hex_value(tokens[i + 1].value), lo + 0xFFFF);
                i += 2;
                if (is_hex(i)) {
                    auto units = hex_to_utf16(tokens[i].value);
                    for (uint32_t code = lo; code <= hi && !units.empty(); ++code) {
                        auto shifted = units;
                        shifted.back() = static_cast<uint16_t>(shifted.back() + (code - lo));
                        decoder.cmap[code] = utf16_to_utf8(shifted);
                    }
                    ++i;
                } else if (i < tokens.size() && tokens[i].kind == CMapToken::Kind::ArrayOpen) {
                    ++i;
                    uint32_t code = lo;
                    while (is_hex(i)) {
                        if (code <= hi) decoder.cmap[code++] = utf16_to_utf8(hex_to_utf16(tokens[i].value));
                        ++i;
                    }
                    if (i < tokens.size() && tokens[i].kind == CMapToken::Kind::ArrayClose) ++i;
                }
            }
        } else {
            ++i;
        }
    }
    decoder.has_cmap = !decoder.cmap.empty();
}

// =============================================================================
// Content stream text collection
// =============================================================================

constexpr int kMaxFormDepth = 8;

class TextCollector : public QPDFObjectHandle::ParserCallbacks {
public:
    TextCollector(std::string& out, QPDFObjectHandle resources, size_t page, int depth)
        : out_(out), resources_(std::move(resources)), page_(page), depth_(depth) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (obj.isOperator()) {
            dispatch(obj.getOperatorValue());
            operands_.clear();
        } else if (obj.isInlineImage()) {
            operands_.clear();
        } else {
            operands_.push_back(obj);
        }
    }

    void handleEOF() override {}

private:
    void dispatch(const std::string& op) {
        if (op == "Tf") {
            if (!operands_.empty() && operands_[0].isName()) select_font(operands_[0].getName());
        } else if (op == "Tj") {
            if (!operands_.empty()) show(operands_.back());
        } else if (op == "'") {
            hard_newline();
            if (!operands_.empty()) show(operands_.back());
        } else if (op == "\"") {
            hard_newline();
            if (operands_.size() >= 3) show(operands_[2]);
        } else if (op == "TJ") {
            if (!operands_.empty() && operands_.back().isArray()) show_array(operands_.back());
        } else if (op == "Td" || op == "TD") {
            if (operands_.size() >= 2 && operands_[1].isNumber()) {
                if (operands_[1].getNumericValue() != 0.0) {
                    soft_newline();
                } else if (operands_[0].isNumber() && operands_[0].getNumericValue() > 0.0) {
                    soft_space();
                }
            }
        } else if (op == "T*") {
            hard_newline();
        } else if (op == "ET" || op == "Tm") {
            soft_newline();
        } else if (op == "Do") {
            if (!operands_.empty() && operands_[0].isName()) render_form(operands_[0].getName());
        }
    }

    void select_font(const std::string& name) {
        auto cached = fonts_.find(name);
        if (cached != fonts_.end()) {
            font_ = &cached->second;
            return;
        }

        FontDecoder decoder;
        QPDFObjectHandle font;
        if (resources_.isDictionary() && resources_.getKey("/Font").isDictionary()) {
            font = resources_.getKey("/Font").getKey(name);
        }

        if (font.isDictionary()) {
            QPDFObjectHandle to_unicode = font.getKey("/ToUnicode");
            if (to_unicode.isStream()) {
                auto data = to_unicode.getStreamData(qpdf_dl_generalized);
                parse_to_unicode(std::string(reinterpret_cast<const char*>(data->getBuffer()), data->getSize()),
                                 decoder);
            }

            const bool composite = font.getKey("/Subtype").isName() &&
                                   font.getKey("/Subtype").getName() == "/Type0";
            if (composite && !decoder.has_cmap) {
                throw ExtractionError("Composite font without a Unicode mapping",
                                      "page " + std::to_string(page_ + 1) + " font " + name);
            }

            QPDFObjectHandle encoding = font.getKey("/Encoding");
            if (encoding.isDictionary()) encoding = encoding.getKey("/BaseEncoding");
            const bool pdf_doc = encoding.isName() && encoding.getName() == "/PDFDocEncoding";
            decoder.base = pdf_doc ? FontDecoder::Base::PdfDoc : FontDecoder::Base::WinAnsi;
        }

        font_ = &fonts_.emplace(name, std::move(decoder)).first->second;
    }

    std::string decode(const std::string& raw) const {
        if (font_) return font_->decode(raw);
        return QUtil::pdf_doc_to_utf8(raw);
    }

    void show(QPDFObjectHandle str) {
        if (str.isString()) out_ += decode(str.getStringValue());
    }

    void show_array(QPDFObjectHandle array) {
        const int n = array.getArrayNItems();
        for (int i = 0; i < n; ++i) {
            QPDFObjectHandle item = array.getArrayItem(i);
            if (item.isString()) {
                out_ += decode(item.getStringValue());
            } else if (item.isNumber() && item.getNumericValue() <= -250.0) {
                soft_space();   // large negative kerning is an inter-word gap
            }
        }
    }

    void render_form(const std::string& name) {
        if (depth_ >= kMaxFormDepth || !resources_.isDictionary()) return;
        QPDFObjectHandle xobjects = resources_.getKey("/XObject");
        if (!xobjects.isDictionary()) return;

        QPDFObjectHandle form = xobjects.getKey(name);
        if (!form.isStream()) return;
        QPDFObjectHandle subtype = form.getDict().getKey("/Subtype");
        if (!subtype.isName() || subtype.getName() != "/Form") return;

        QPDFObjectHandle form_resources = form.getDict().getKey("/Resources");
        TextCollector nested(out_, form_resources.isDictionary() ? form_resources : resources_,
                             page_, depth_ + 1);
        form.parseAsContents(&nested);
        soft_newline();
    }

    void hard_newline() {
        if (!out_.empty()) out_.push_back('\n');
    }

    void soft_newline() {
        if (!out_.empty() && out_.back() != '\n') out_.push_back('\n');
    }

    void soft_space() {
        if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n') out_.push_back(' ');
    }

    std::string& out_;
    QPDFObjectHandle resources_;
    size_t page_;
    int depth_;
    std::vector<QPDFObjectHandle> operands_;
    std::map<std::string, FontDecoder> fonts_;
    const FontDecoder* font_ = nullptr;
};

std::string trim_trailing(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

PageGeometry page_geometry(QPDFPageObjectHelper& page) {
    PageGeometry g;
    QPDFObjectHandle box = page.getAttribute("/MediaBox", false);
    if (box.isArray() && box.getArrayNItems() == 4) {
        auto rect = box.getArrayAsRectangle();
        g.llx = std::min(rect.llx, rect.urx);
        g.lly = std::min(rect.lly, rect.ury);
        g.urx = std::max(rect.llx, rect.urx);
        g.ury = std::max(rect.lly, rect.ury);
    }
    return g;
}

// =============================================================================
// Layout
// =============================================================================

struct PageLayout {
    double font_size = 0.0;
    std::vector<std::string> lines;     // WinAnsi encoded
};

void wrap_paragraph(const std::string& paragraph, double font_size, double max_width,
                    std::vector<std::string>& lines) {
    std::vector<std::string> words;
    std::istringstream in(paragraph);
    for (std::string word; in >> word;) words.push_back(word);

    std::string current;
    for (const auto& word : words) {
        if (text_width(word, font_size) > max_width) {
            if (!current.empty()) {
                lines.push_back(current);
                current.clear();
            }
            // hard break an over-long word
            std::string chunk;
            for (char c : word) {
                if (!chunk.empty() && text_width(chunk + c, font_size) > max_width) {
                    lines.push_back(chunk);
                    chunk.clear();
                }
                chunk.push_back(c);
            }
            current = chunk;
            continue;
        }

        if (current.empty()) {
            current = word;
        } else if (text_width(current + " " + word, font_size) <= max_width) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }
    lines.push_back(current);
}

PageLayout layout_page(const std::string& utf8_text, const PageGeometry& geometry,
                       const PdfLayoutConfig& config, size_t page_index) {
    const double max_width = geometry.width() - 2.0 * config.margin;
    const double max_height = geometry.height() - 2.0 * config.margin;
    if (max_width <= 0.0 || max_height <= 0.0) {
        throw ReconstructionError("Page too small for the configured margins",
                                  "page " + std::to_string(page_index + 1));
    }

    const std::string encoded = to_win_ansi(utf8_text);
    std::vector<std::string> paragraphs;
    {
        std::string line;
        std::istringstream in(encoded);
        while (std::getline(in, line)) paragraphs.push_back(line);
    }

    for (double size = config.font_size; size >= config.min_font_size - 1e-9; size -= 0.5) {
        PageLayout layout;
        layout.font_size = size;
        for (const auto& paragraph : paragraphs) {
            wrap_paragraph(paragraph, size, max_width, layout.lines);
        }
        const double leading = size + config.line_spacing;
        if (static_cast<double>(layout.lines.size()) * leading <= max_height) {
            if (size < config.font_size) {
                LOG_DEBUG("Page ", page_index + 1, " set at ", size, "pt to fit");
            }
            return layout;
        }
    }

    throw ReconstructionError("Redacted text does not fit the page at the minimum font size",
                              "page " + std::to_string(page_index + 1),
                              "Lower pdf.min_font_size or pdf.margin");
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string escape_pdf_string(const std::string& win_ansi) {
    std::string out;
    out.reserve(win_ansi.size() + 8);
    for (char c : win_ansi) {
        if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string build_content(const PageLayout& layout, const PageGeometry& geometry,
                          const PdfLayoutConfig& config) {
    const double leading = layout.font_size + config.line_spacing;
    const double x = geometry.llx + config.margin;
    const double y = geometry.ury - config.margin - layout.font_size;

    std::ostringstream content;
    content << "BT\n"
            << "/F1 " << format_number(layout.font_size) << " Tf\n"
            << format_number(leading) << " TL\n"
            << format_number(x) << " " << format_number(y) << " Td\n";
    for (const auto& line : layout.lines) {
        if (!line.empty()) content << "(" << escape_pdf_string(line) << ") Tj\n";
        content << "T*\n";
    }
    content << "ET\n";
    return content.str();
}

} // namespace

// =============================================================================
// PdfAdapter
// =============================================================================

PdfAdapter::PdfAdapter(PdfLayoutConfig layout) : layout_(layout) {}

const std::vector<std::string>& PdfAdapter::info_keys() {
    static const std::vector<std::string> keys = {"/Title", "/Author", "/Subject", "/Keywords", "/Creator"};
    return keys;
}

bool PdfAdapter::probe(const ByteBuffer& bytes) const {
    // The header may be preceded by up to 1024 bytes of junk
    const size_t limit = std::min<size_t>(bytes.size(), 1024 + 5);
    for (size_t i = 0; i + 5 <= limit; ++i) {
        if (std::memcmp(bytes.data() + i, "%PDF-", 5) == 0) return true;
    }
    return false;
}

ExtractedDocument PdfAdapter::extract(const ByteBuffer& bytes) const {
    if (!probe(bytes)) {
        throw ExtractionError("Not a PDF document", "missing %PDF- header");
    }

    ExtractedDocument doc;
    auto scaffold = std::make_unique<PdfScaffold>();

    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile("document.pdf", reinterpret_cast<const char*>(bytes.data()), bytes.size());

        auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
        if (pages.empty()) {
            throw ExtractionError("PDF has no pages");
        }

        for (size_t i = 0; i < pages.size(); ++i) {
            auto& page = pages[i];
            scaffold->pages.push_back(page_geometry(page));

            std::string text;
            TextCollector collector(text, page.getAttribute("/Resources", false), i, 0);
            page.parseContents(&collector);

            TextBlock block;
            block.content = trim_trailing(std::move(text));
            block.location.kind = LocationKind::Page;
            block.location.page = i;
            block.location.order = i;
            doc.blocks.push_back(std::move(block));
        }

        QPDFObjectHandle info = pdf.getTrailer().getKey("/Info");
        if (info.isDictionary()) {
            for (const auto& key : info_keys()) {
                QPDFObjectHandle value = info.getKey(key);
                if (!value.isString()) continue;

                scaffold->property_keys.push_back(key);
                TextBlock block;
                block.content = value.getUTF8Value();
                block.location.kind = LocationKind::Property;
                block.location.order = doc.blocks.size();
                block.location.part = key;
                doc.blocks.push_back(std::move(block));
            }
        }
    } catch (const RedactorException&) {
        throw;
    } catch (const std::exception& e) {
        throw ExtractionError("Unable to parse PDF", e.what());
    }

    LOG_DEBUG("PDF extracted: ", scaffold->pages.size(), " pages, ",
              scaffold->property_keys.size(), " metadata fields");
    doc.scaffold = std::move(scaffold);
    return doc;
}

ByteBuffer PdfAdapter::reconstruct(const DocumentScaffold& scaffold,
                                   const std::vector<TextBlock>& redacted_blocks) const {
    const auto* pdf_scaffold = dynamic_cast<const PdfScaffold*>(&scaffold);
    if (!pdf_scaffold) {
        throw ReconstructionError("Scaffold was not produced by the PDF adapter", to_string(scaffold.format()));
    }
    check_block_alignment(scaffold, redacted_blocks);

    const auto& pages = pdf_scaffold->pages;
    std::vector<const TextBlock*> page_blocks(pages.size(), nullptr);
    std::vector<const TextBlock*> property_blocks;

    for (const auto& block : redacted_blocks) {
        if (block.location.kind == LocationKind::Page && block.location.page < pages.size() &&
            !page_blocks[block.location.page]) {
            page_blocks[block.location.page] = &block;
        } else if (block.location.kind == LocationKind::Property &&
                   std::find(pdf_scaffold->property_keys.begin(), pdf_scaffold->property_keys.end(),
                             block.location.part) != pdf_scaffold->property_keys.end()) {
            property_blocks.push_back(&block);
        } else {
            throw ReconstructionError("Unexpected block location for a PDF document",
                                      to_string(block.location.kind));
        }
    }
    for (size_t i = 0; i < page_blocks.size(); ++i) {
        if (!page_blocks[i]) {
            throw ReconstructionError("No redacted block for page", "page " + std::to_string(i + 1));
        }
    }

    try {
        QPDF out;
        out.emptyPDF();

        QPDFObjectHandle font = out.makeIndirectObject(QPDFObjectHandle::parse(
            "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));

        QPDFPageDocumentHelper pages_helper(out);
        for (size_t i = 0; i < pages.size(); ++i) {
            const PageLayout layout = layout_page(page_blocks[i]->content, pages[i], layout_, i);

            QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
            fonts.replaceKey("/F1", font);
            QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
            resources.replaceKey("/Font", fonts);

            QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
            page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
            page.replaceKey("/MediaBox", QPDFObjectHandle::newArray(QPDFObjectHandle::Rectangle(
                pages[i].llx, pages[i].lly, pages[i].urx, pages[i].ury)));
            page.replaceKey("/Resources", resources);
            page.replaceKey("/Contents",
                            QPDFObjectHandle::newStream(&out, build_content(layout, pages[i], layout_)));

            pages_helper.addPage(QPDFPageObjectHelper(out.makeIndirectObject(page)), false);
        }

        if (!property_blocks.empty()) {
            QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
            for (const auto* block : property_blocks) {
                info.replaceKey(block->location.part, QPDFObjectHandle::newUnicodeString(block->content));
            }
            out.getTrailer().replaceKey("/Info", out.makeIndirectObject(info));
        }

        QPDFWriter writer(out);
        writer.setOutputMemory();
        writer.setObjectStreamMode(qpdf_o_disable);
        writer.write();

        std::unique_ptr<Buffer> buffer(writer.getBuffer());
        const auto* data = buffer->getBuffer();
        return ByteBuffer(data, data + buffer->getSize());
    } catch (const RedactorException&) {
        throw;
    } catch (const std::exception& e) {
        throw ReconstructionError("Unable to write PDF", e.what());
    }
}

} // namespace redactor
