#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "redactor/types.hpp"

namespace redactor {

/**
 * Enterprise recogniser profile, loaded once from YAML.
 *
 * Selects which high-precision recognisers run by default, their confidence
 * values, the context words that boost phone numbers and a deny-list of
 * person names that are always redacted.
 */
struct EnterpriseProfile {
    std::string name;
    std::string version;

    // Used when a request carries an empty allowlist
    std::set<EntityType> default_entities;

    std::map<EntityType, double> confidence;

    std::vector<std::string> phone_context_words;   // folded
    size_t phone_context_window = 32;               // bytes before the match
    double phone_base_confidence = 0.6;
    double phone_context_boost = 0.35;
    double phone_min_confidence = 0.5;

    std::vector<std::string> person_deny_list;

    double confidence_for(EntityType type, double fallback = 0.95) const {
        auto it = confidence.find(type);
        return it != confidence.end() ? it->second : fallback;
    }

    /**
     * Load a profile file.
     * @throws ModelLoadError if the file is missing or malformed
     */
    static std::shared_ptr<const EnterpriseProfile> load(const std::string& path);

    static std::shared_ptr<const EnterpriseProfile> parse(const std::string& yaml_text);
};

} // namespace redactor
