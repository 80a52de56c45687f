#pragma once

#include <string>
#include <string_view>

#include "redactor/config.hpp"
#include "redactor/types.hpp"

namespace redactor {

// U+2588 FULL BLOCK, the mask character
inline constexpr std::string_view kMaskChar = "\xE2\x96\x88";

// Prefix every emitted token starts with ("[")
inline constexpr char kTokenOpen = '[';

/**
 * Build the redaction token for an entity of the given type whose original
 * text is codepoint_length codepoints long.
 *
 *   LengthCappedMask: "[TYPE:" + mask * min(length, mask_cap) + "]"
 *   FixedWidth:       "[TYPE:" + mask * fixed_mask_width + "]"
 *
 * Deterministic in (type, length, style).
 */
std::string make_token(EntityType type, size_t codepoint_length, const RedactionConfig& config);

// Mask characters alone, same width rule as make_token
std::string make_mask(size_t codepoint_length, const RedactionConfig& config);

/**
 * Replacement text for one finding. Falls back to a bare mask (and then to
 * an ASCII mask) if the token would contain the original text when compared
 * case-insensitively.
 */
std::string token_for(const Finding& finding, const RedactionConfig& config);

} // namespace redactor
