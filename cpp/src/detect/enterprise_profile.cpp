#include "redactor/detect/enterprise_profile.hpp"
#include "redactor/detect/ner_model.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace redactor {

namespace {

EntityType entity_from_yaml(const YAML::Node& node, const char* field) {
    const auto name = node.as<std::string>();
    auto type = parse_entity_type(name);
    if (!type) {
        throw ModelLoadError("Unknown entity type '" + name + "' in enterprise profile", field);
    }
    return *type;
}

std::shared_ptr<EnterpriseProfile> build(const YAML::Node& yaml) {
    auto profile = std::make_shared<EnterpriseProfile>();

    profile->name = yaml["name"] ? yaml["name"].as<std::string>() : "unnamed";
    profile->version = yaml["version"] ? yaml["version"].as<std::string>() : "0";

    if (const auto& defaults = yaml["default_entities"]) {
        for (const auto& item : defaults) {
            profile->default_entities.insert(entity_from_yaml(item, "default_entities"));
        }
    }
    if (profile->default_entities.empty()) {
        throw ModelLoadError("Enterprise profile enables no entity types", "default_entities");
    }

    if (const auto& conf = yaml["confidence"]) {
        for (const auto& kv : conf) {
            profile->confidence[entity_from_yaml(kv.first, "confidence")] = kv.second.as<double>();
        }
    }

    if (const auto& phone = yaml["phone"]) {
        if (const auto& words = phone["context_words"]) {
            for (const auto& word : words) {
                profile->phone_context_words.push_back(fold_ascii(word.as<std::string>()));
            }
        }
        if (phone["context_window"]) profile->phone_context_window = phone["context_window"].as<size_t>();
        if (phone["base_confidence"]) profile->phone_base_confidence = phone["base_confidence"].as<double>();
        if (phone["context_boost"]) profile->phone_context_boost = phone["context_boost"].as<double>();
        if (phone["min_confidence"]) profile->phone_min_confidence = phone["min_confidence"].as<double>();
    }

    if (const auto& persons = yaml["persons"]) {
        if (const auto& deny = persons["deny_list"]) {
            for (const auto& item : deny) {
                auto entry = item.as<std::string>();
                if (!entry.empty()) profile->person_deny_list.push_back(std::move(entry));
            }
        }
    }

    return profile;
}

} // namespace

std::shared_ptr<const EnterpriseProfile> EnterpriseProfile::parse(const std::string& yaml_text) {
    try {
        return build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Malformed enterprise profile", e.what());
    }
}

std::shared_ptr<const EnterpriseProfile> EnterpriseProfile::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        throw ModelLoadError("Enterprise profile not found", path,
                             "Set models.enterprise_profile or REDACTOR_ENTERPRISE_PROFILE");
    }

    std::shared_ptr<EnterpriseProfile> profile;
    try {
        profile = build(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Malformed enterprise profile", path + ": " + e.what());
    }

    LOG_INFO("Loaded enterprise profile '", profile->name, "' v", profile->version, " (",
             profile->default_entities.size(), " default entity types, ",
             profile->person_deny_list.size(), " deny-list entries)");
    return profile;
}

} // namespace redactor
