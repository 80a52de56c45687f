#pragma once

#include <string_view>
#include <vector>

#include "redactor/format/adapter.hpp"
#include "redactor/types.hpp"

namespace redactor {

struct ValidationResult {
    bool passed = true;
    std::vector<Finding> violating_findings;   // original findings still present in the output
    size_t tokens_found = 0;
    size_t tokens_expected = 0;

    bool token_shortfall() const { return tokens_found < tokens_expected; }
};

/**
 * Closed-loop residue check.
 *
 * The reconstructed bytes are re-extracted with the same adapter that built
 * them and every original finding's text is searched for, case folded and
 * with whitespace runs collapsed. Any hit fails validation; the caller must
 * discard the output.
 *
 * A token count below the finding count is logged as a warning and does not
 * fail validation on its own.
 */
class Validator {
public:
    // Re-extraction failures propagate as ExtractionError
    ValidationResult validate(const FormatAdapter& adapter, const ByteBuffer& output,
                              const std::vector<Finding>& original_findings) const;

    // Residue check against already extracted text
    ValidationResult validate_text(std::string_view reextracted_text,
                                   const std::vector<Finding>& original_findings) const;

    // Occurrences of "[TYPE:" token prefixes for every entity type
    static size_t count_tokens(std::string_view text);
};

} // namespace redactor
