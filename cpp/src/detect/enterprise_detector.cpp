#include "redactor/detect/enterprise_detector.hpp"
#include "redactor/detect/ner_model.hpp"

#include <algorithm>
#include <cctype>

namespace redactor {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

std::string strip_separators(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != ' ' && c != '-') out.push_back(c);
    }
    return out;
}

bool is_alnum_byte(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

Finding make_finding(EntityType type, size_t start, size_t length, std::string_view text, double confidence) {
    Finding f;
    f.entity_type = type;
    f.start = start;
    f.end = start + length;
    f.text = std::string(text.substr(start, length));
    f.confidence = confidence;
    f.method = DetectionMethod::Enterprise;
    return f;
}

} // namespace

EnterpriseDetector::EnterpriseDetector(std::shared_ptr<const EnterpriseProfile> profile)
    : profile_(std::move(profile))
    , card_regex_(R"(\b\d(?:[ -]?\d){12,18}\b)", kRegexFlags)
    , ssn_regex_(R"(\b(\d{3})([- ]?)(\d{2})\2(\d{4})\b)", kRegexFlags)
    , ipv4_regex_(R"(\b\d{1,3}(?:\.\d{1,3}){3}\b)", kRegexFlags)
    , iban_regex_(R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)", kRegexFlags)
    , email_regex_(R"(\b[A-Za-z0-9._%+-]+@(?:[A-Za-z0-9-]+\.)+[A-Za-z]{2,}\b)", kRegexFlags)
    , phone_regex_(R"((?:\+?1[-. ]?)?(?:\(\d{3}\)|\b\d{3})[-. ]?\d{3}[-. ]?\d{4}\b)", kRegexFlags) {}

std::set<EntityType> EnterpriseDetector::effective_entities(const DetectionConfig& config) const {
    if (!profile_) return {};
    if (config.enterprise_entity_allowlist.empty()) return profile_->default_entities;
    return config.enterprise_entity_allowlist;
}

DetectorResult EnterpriseDetector::detect(std::string_view text, const DetectionConfig& config) const {
    if (!profile_) {
        return DetectorResult::unavailable();
    }

    const auto entities = effective_entities(config);
    auto wanted = [&entities](EntityType type) { return entities.count(type) > 0; };

    FindingSet findings;
    if (wanted(EntityType::CREDIT_CARD))   detect_credit_cards(text, findings);
    if (wanted(EntityType::SSN))           detect_ssns(text, findings);
    if (wanted(EntityType::IP_ADDRESS))    detect_ipv4(text, findings);
    if (wanted(EntityType::IBAN_CODE))     detect_ibans(text, findings);
    if (wanted(EntityType::EMAIL_ADDRESS)) detect_emails(text, findings);
    if (wanted(EntityType::PHONE_NUMBER))  detect_phones(text, findings);
    if (wanted(EntityType::PERSON))        detect_persons(text, findings);

    return DetectorResult::ok(std::move(findings));
}

// =============================================================================
// Structural validators
// =============================================================================

bool EnterpriseDetector::luhn_valid(const std::string& digits) {
    if (digits.size() < 13 || digits.size() > 19) return false;
    int sum = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (*it < '0' || *it > '9') return false;
        int d = *it - '0';
        if (double_it) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

bool EnterpriseDetector::ssn_valid(const std::string& area, const std::string& group, const std::string& serial) {
    if (area == "000" || area == "666" || area[0] == '9') return false;
    if (group == "00") return false;
    if (serial == "0000") return false;
    return true;
}

bool EnterpriseDetector::ipv4_valid(const std::string& address) {
    size_t octets = 0;
    size_t pos = 0;
    while (pos <= address.size()) {
        size_t dot = address.find('.', pos);
        if (dot == std::string::npos) dot = address.size();
        const std::string part = address.substr(pos, dot - pos);
        if (part.empty() || part.size() > 3) return false;
        if (!std::all_of(part.begin(), part.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
        if (std::stoi(part) > 255) return false;
        ++octets;
        pos = dot + 1;
    }
    return octets == 4;
}

bool EnterpriseDetector::iban_valid(const std::string& iban) {
    if (iban.size() < 15 || iban.size() > 34) return false;
    const std::string rearranged = iban.substr(4) + iban.substr(0, 4);
    int remainder = 0;
    for (char c : rearranged) {
        if (c >= '0' && c <= '9') {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            const int value = c - 'A' + 10;
            remainder = (remainder * 100 + value) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

// =============================================================================
// Recognisers
// =============================================================================

void EnterpriseDetector::detect_credit_cards(std::string_view text, FindingSet& out) const {
    const double confidence = profile_->confidence_for(EntityType::CREDIT_CARD, 0.99);
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), card_regex_), last; it != last; ++it) {
        if (!luhn_valid(strip_separators(it->str(0)))) continue;
        out.push_back(make_finding(EntityType::CREDIT_CARD, static_cast<size_t>(it->position(0)),
                                   static_cast<size_t>(it->length(0)), text, confidence));
    }
}

void EnterpriseDetector::detect_ssns(std::string_view text, FindingSet& out) const {
    const double confidence = profile_->confidence_for(EntityType::SSN, 0.95);
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), ssn_regex_), last; it != last; ++it) {
        const auto& m = *it;
        if (!ssn_valid(m.str(1), m.str(3), m.str(4))) continue;
        out.push_back(make_finding(EntityType::SSN, static_cast<size_t>(m.position(0)),
                                   static_cast<size_t>(m.length(0)), text, confidence));
    }
}

void EnterpriseDetector::detect_ipv4(std::string_view text, FindingSet& out) const {
    const double confidence = profile_->confidence_for(EntityType::IP_ADDRESS, 0.95);
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), ipv4_regex_), last; it != last; ++it) {
        if (!ipv4_valid(it->str(0))) continue;
        out.push_back(make_finding(EntityType::IP_ADDRESS, static_cast<size_t>(it->position(0)),
                                   static_cast<size_t>(it->length(0)), text, confidence));
    }
}

void EnterpriseDetector::detect_ibans(std::string_view text, FindingSet& out) const {
    const double confidence = profile_->confidence_for(EntityType::IBAN_CODE, 0.98);
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), iban_regex_), last; it != last; ++it) {
        if (!iban_valid(strip_separators(it->str(0)))) continue;
        out.push_back(make_finding(EntityType::IBAN_CODE, static_cast<size_t>(it->position(0)),
                                   static_cast<size_t>(it->length(0)), text, confidence));
    }
}

void EnterpriseDetector::detect_emails(std::string_view text, FindingSet& out) const {
    const double confidence = profile_->confidence_for(EntityType::EMAIL_ADDRESS, 0.97);
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), email_regex_), last; it != last; ++it) {
        out.push_back(make_finding(EntityType::EMAIL_ADDRESS, static_cast<size_t>(it->position(0)),
                                   static_cast<size_t>(it->length(0)), text, confidence));
    }
}

void EnterpriseDetector::detect_phones(std::string_view text, FindingSet& out) const {
    const auto& p = *profile_;
    for (std::cregex_iterator it(text.data(), text.data() + text.size(), phone_regex_), last; it != last; ++it) {
        const size_t start = static_cast<size_t>(it->position(0));
        const size_t window_start = start > p.phone_context_window ? start - p.phone_context_window : 0;
        const std::string context = fold_ascii(std::string(text.substr(window_start, start - window_start)));

        double confidence = p.phone_base_confidence;
        const bool has_context = std::any_of(p.phone_context_words.begin(), p.phone_context_words.end(),
                                             [&context](const std::string& word) {
                                                 return context.find(word) != std::string::npos;
                                             });
        if (has_context) confidence = std::min(1.0, confidence + p.phone_context_boost);
        if (confidence < p.phone_min_confidence) continue;

        out.push_back(make_finding(EntityType::PHONE_NUMBER, start, static_cast<size_t>(it->length(0)),
                                   text, confidence));
    }
}

void EnterpriseDetector::detect_persons(std::string_view text, FindingSet& out) const {
    if (profile_->person_deny_list.empty()) return;

    const double confidence = profile_->confidence_for(EntityType::PERSON, 0.99);
    // ASCII folding keeps byte offsets aligned with the original text
    const std::string folded = fold_ascii(std::string(text));

    for (const auto& entry : profile_->person_deny_list) {
        const std::string needle = fold_ascii(entry);
        size_t pos = folded.find(needle);
        while (pos != std::string::npos) {
            const size_t end = pos + needle.size();
            const bool left_ok = pos == 0 || !is_alnum_byte(folded[pos - 1]);
            const bool right_ok = end == folded.size() || !is_alnum_byte(folded[end]);
            if (left_ok && right_ok) {
                out.push_back(make_finding(EntityType::PERSON, pos, needle.size(), text, confidence));
            }
            pos = folded.find(needle, pos + 1);
        }
    }
}

} // namespace redactor
