#include "redactor/detect/pattern_detector.hpp"

namespace redactor {

const std::vector<PatternDetector::Rule>& PatternDetector::rules() {
    static const std::vector<Rule> table = {
        {EntityType::EMAIL_ADDRESS,
         R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"},
        {EntityType::PHONE_NUMBER,
         R"((?:\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)"},
        {EntityType::SSN,
         R"(\b\d{3}-?\d{2}-?\d{4}\b)"},
        {EntityType::CREDIT_CARD,
         R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)"},
        {EntityType::IP_ADDRESS,
         R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)"},
        {EntityType::URL,
         // Trailing sentence punctuation is left outside the match
         R"(https?://(?:[A-Za-z0-9$_@.&+!*(),/?=#~:;-]|%[0-9A-Fa-f]{2})*(?:[A-Za-z0-9$_@&+*/=#~-]|%[0-9A-Fa-f]{2}))"},
        {EntityType::DATE_OF_BIRTH,
         R"(\b(?:0?[1-9]|1[0-2])[/-](?:0?[1-9]|[12][0-9]|3[01])[/-](?:19|20)\d{2}\b)"},
        {EntityType::PASSPORT_NUMBER,
         R"(\b[A-Z]{1,2}[0-9]{6,9}\b)"},
        {EntityType::LICENSE_PLATE,
         R"(\b[A-Z]{2,3}[- ]?[0-9]{3,4}(?:[- ]?[A-Z])?\b)"},
    };
    return table;
}

PatternDetector::PatternDetector() {
    compiled_.reserve(rules().size());
    for (const auto& rule : rules()) {
        compiled_.push_back({rule.type, std::regex(rule.expression, std::regex::ECMAScript | std::regex::optimize)});
        types_.push_back(rule.type);
    }
}

DetectorResult PatternDetector::detect(std::string_view text, const DetectionConfig& /*config*/) const {
    FindingSet findings;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (const auto& rule : compiled_) {
        for (std::cregex_iterator it(begin, end, rule.regex), last; it != last; ++it) {
            const auto& match = *it;
            if (match.length(0) == 0) continue;

            Finding f;
            f.entity_type = rule.type;
            f.start = static_cast<size_t>(match.position(0));
            f.end = f.start + static_cast<size_t>(match.length(0));
            f.text = match.str(0);
            f.confidence = kConfidence;
            f.method = DetectionMethod::Pattern;
            findings.push_back(std::move(f));
        }
    }

    return DetectorResult::ok(std::move(findings));
}

} // namespace redactor
