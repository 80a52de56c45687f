#include "redactor/redact/splice.hpp"
#include "redactor/error.hpp"
#include "redactor/redact/token.hpp"

namespace redactor {

SpliceResult splice_block(std::string_view content, const FindingSet& findings,
                          const RedactionConfig& config) {
    SpliceResult result;
    result.text.reserve(content.size());

    size_t cursor = 0;
    for (const auto& f : findings) {
        REDACTOR_CHECK_ARGUMENT(f.start < f.end && f.end <= content.size(),
                                "Finding span outside block bounds");
        REDACTOR_CHECK_ARGUMENT(f.start >= cursor, "Findings overlap or are not sorted by start");

        result.text.append(content.substr(cursor, f.start - cursor));
        result.text += token_for(f, config);
        ++result.tokens_emitted;
        cursor = f.end;
    }
    result.text.append(content.substr(cursor));

    return result;
}

} // namespace redactor
