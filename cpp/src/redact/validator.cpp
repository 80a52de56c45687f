#include "redactor/redact/validator.hpp"
#include "redactor/logging.hpp"
#include "redactor/redact/token.hpp"
#include "redactor/util/utf8.hpp"

#include <map>

namespace redactor {

ValidationResult Validator::validate(const FormatAdapter& adapter, const ByteBuffer& output,
                                     const std::vector<Finding>& original_findings) const {
    ExtractedDocument reextracted = adapter.extract(output);
    return validate_text(reextracted.joined_text(), original_findings);
}

ValidationResult Validator::validate_text(std::string_view reextracted_text,
                                          const std::vector<Finding>& original_findings) const {
    ValidationResult result;
    result.tokens_expected = original_findings.size();
    result.tokens_found = count_tokens(reextracted_text);

    const std::string haystack = util::normalize_for_search(reextracted_text);

    for (const auto& finding : original_findings) {
        const std::string needle = util::normalize_for_search(finding.text);
        if (!needle.empty() && haystack.find(needle) != std::string::npos) {
            result.passed = false;
            result.violating_findings.push_back(finding);
        }
    }

    if (!result.passed) {
        std::map<EntityType, size_t> by_type;
        for (const auto& f : result.violating_findings) ++by_type[f.entity_type];
        for (const auto& [type, count] : by_type) {
            LOG_ERROR("Residual ", to_string(type), " text in output: ", count, " finding(s)");
        }
    }

    if (result.token_shortfall()) {
        LOG_WARN("Token count below finding count: ", result.tokens_found, " tokens for ",
                 result.tokens_expected, " findings");
    }

    return result;
}

size_t Validator::count_tokens(std::string_view text) {
    size_t count = 0;
    for (EntityType type : all_entity_types()) {
        std::string prefix(1, kTokenOpen);
        prefix += to_string(type);
        prefix += ':';

        for (size_t pos = text.find(prefix); pos != std::string_view::npos;
             pos = text.find(prefix, pos + prefix.size())) {
            ++count;
        }
    }
    return count;
}

} // namespace redactor
