#pragma once

#include <memory>
#include <regex>
#include <set>
#include <string>

#include "redactor/detect/detector.hpp"
#include "redactor/detect/enterprise_profile.hpp"

namespace redactor {

/**
 * Enterprise Detector
 *
 * High-precision recognisers: candidates are found by expression and then
 * validated structurally (Luhn for cards, area/group/serial rules for SSNs,
 * octet range for IPv4, mod-97 for IBANs). Phone numbers gain confidence
 * from nearby context words. Person names come from the profile deny-list.
 *
 * Only entity types in the request allowlist are emitted; an empty allowlist
 * selects the profile's default list. A null profile makes the detector
 * Unavailable.
 */
class EnterpriseDetector : public Detector {
public:
    explicit EnterpriseDetector(std::shared_ptr<const EnterpriseProfile> profile);

    std::string name() const override { return "enterprise"; }
    DetectionMethod method() const override { return DetectionMethod::Enterprise; }
    bool available() const override { return profile_ != nullptr; }

    DetectorResult detect(std::string_view text, const DetectionConfig& config) const override;

    // Entity types that will be emitted for the given request configuration
    std::set<EntityType> effective_entities(const DetectionConfig& config) const;

    const EnterpriseProfile* profile() const { return profile_.get(); }

    // Structural validators (digits / characters only, separators stripped)
    static bool luhn_valid(const std::string& digits);
    static bool ssn_valid(const std::string& area, const std::string& group, const std::string& serial);
    static bool ipv4_valid(const std::string& address);
    static bool iban_valid(const std::string& iban);

private:
    void detect_credit_cards(std::string_view text, FindingSet& out) const;
    void detect_ssns(std::string_view text, FindingSet& out) const;
    void detect_ipv4(std::string_view text, FindingSet& out) const;
    void detect_ibans(std::string_view text, FindingSet& out) const;
    void detect_emails(std::string_view text, FindingSet& out) const;
    void detect_phones(std::string_view text, FindingSet& out) const;
    void detect_persons(std::string_view text, FindingSet& out) const;

    std::shared_ptr<const EnterpriseProfile> profile_;

    std::regex card_regex_;
    std::regex ssn_regex_;
    std::regex ipv4_regex_;
    std::regex iban_regex_;
    std::regex email_regex_;
    std::regex phone_regex_;
};

} // namespace redactor
