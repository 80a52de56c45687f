#include "redactor/redact/token.hpp"
#include "redactor/util/utf8.hpp"

#include <algorithm>

namespace redactor {

namespace {

size_t mask_width(size_t codepoint_length, const RedactionConfig& config) {
    if (config.token_style == TokenStyle::FixedWidth) {
        return config.fixed_mask_width;
    }
    return std::max<size_t>(1, std::min<size_t>(codepoint_length, config.mask_cap));
}

std::string repeat(std::string_view unit, size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) out += unit;
    return out;
}

} // namespace

std::string make_mask(size_t codepoint_length, const RedactionConfig& config) {
    return repeat(kMaskChar, mask_width(codepoint_length, config));
}

std::string make_token(EntityType type, size_t codepoint_length, const RedactionConfig& config) {
    std::string token(1, kTokenOpen);
    token += to_string(type);
    token.push_back(':');
    token += make_mask(codepoint_length, config);
    token.push_back(']');
    return token;
}

std::string token_for(const Finding& finding, const RedactionConfig& config) {
    const size_t length = util::codepoint_count(finding.text);

    std::string token = make_token(finding.entity_type, length, config);
    if (!util::contains_normalized(token, finding.text)) return token;

    std::string mask = make_mask(length, config);
    if (!util::contains_normalized(mask, finding.text)) return mask;

    // Text made only of mask characters
    return repeat("*", mask_width(length, config));
}

} // namespace redactor
