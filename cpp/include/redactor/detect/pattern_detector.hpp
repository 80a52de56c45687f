#pragma once

#include <regex>
#include <string>
#include <vector>

#include "redactor/detect/detector.hpp"

namespace redactor {

/**
 * Pattern Detector
 *
 * Fixed regular-expression recognisers for structured identifiers. Has no
 * model dependency and is therefore always available. Every occurrence of a
 * pattern is reported as its own finding.
 */
class PatternDetector : public Detector {
public:
    struct Rule {
        EntityType type;
        const char* expression;
    };

    static constexpr double kConfidence = 0.9;

    PatternDetector();

    std::string name() const override { return "pattern"; }
    DetectionMethod method() const override { return DetectionMethod::Pattern; }
    bool available() const override { return true; }

    DetectorResult detect(std::string_view text, const DetectionConfig& config) const override;

    // The built-in rule table, one entry per supported entity type
    static const std::vector<Rule>& rules();

    const std::vector<EntityType>& supported_types() const { return types_; }

private:
    struct CompiledRule {
        EntityType type;
        std::regex regex;
    };

    std::vector<CompiledRule> compiled_;
    std::vector<EntityType> types_;
};

} // namespace redactor
