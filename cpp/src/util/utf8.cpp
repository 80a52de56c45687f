#include "redactor/util/utf8.hpp"

namespace redactor::util {

// UTF-8 decoder
// - Invalid sequences replaced with U+FFFD
// - BOM at the start is skipped
std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();

    if (data.size() >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) {
        p += 3;
    }

    while (p < end) {
        uint32_t cp;

        if (*p < 0x80) {
            // ASCII fast path
            cp = *p++;
        } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            if ((b2 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p--; // Rewind to retry b2 as start byte
            } else {
                cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
                if (cp < 0x80) cp = 0xFFFD; // Overlong
            }
        } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 2;
            } else {
                cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
                if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
            }
        } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            uint8_t b4 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 3;
            } else {
                cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
                if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
            }
        } else {
            // Invalid start byte or truncated sequence
            cp = 0xFFFD;
            ++p;
        }

        codepoints.push_back(cp);
    }

    return codepoints;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

size_t codepoint_count(std::string_view data) {
    size_t count = 0;
    for (char c : data) {
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

uint32_t fold_codepoint(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp < 0xC0) return cp;
    // Latin-1 Supplement (skip multiplication sign)
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 32;
    // Latin Extended-A: alternating upper/lower pairs
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;
    // Greek capitals
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 32;
    // Cyrillic capitals
    if (cp >= 0x400 && cp <= 0x40F) return cp + 80;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 32;
    return cp;
}

namespace {

bool is_space_codepoint(uint32_t cp) {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

} // namespace

std::string normalize_for_search(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (uint32_t cp : decode_utf8(text)) {
        if (is_space_codepoint(cp)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out += encode_utf8(fold_codepoint(cp));
    }
    return out;
}

bool contains_normalized(std::string_view haystack, std::string_view needle) {
    const std::string n = normalize_for_search(needle);
    if (n.empty()) return false;
    return normalize_for_search(haystack).find(n) != std::string::npos;
}

} // namespace redactor::util
