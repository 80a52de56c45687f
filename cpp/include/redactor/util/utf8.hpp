#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace redactor::util {

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Number of codepoints in a UTF-8 string
size_t codepoint_count(std::string_view data);

// True when the byte at pos starts a codepoint (is not a continuation byte)
inline bool is_codepoint_boundary(std::string_view data, size_t pos) {
    if (pos == 0 || pos >= data.size()) return true;
    return (static_cast<uint8_t>(data[pos]) & 0xC0) != 0x80;
}

// Simple case fold: ASCII, Latin-1 Supplement, Latin Extended-A, Greek and Cyrillic
uint32_t fold_codepoint(uint32_t cp);

/**
 * Canonical form used for residue searches: case folded, every run of
 * Unicode whitespace collapsed to one ASCII space, leading and trailing
 * whitespace removed.
 */
std::string normalize_for_search(std::string_view text);

// Case-insensitive, whitespace-normalised containment test
bool contains_normalized(std::string_view haystack, std::string_view needle);

} // namespace redactor::util
