#include "redactor/detect/ner_model.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace redactor {

std::string fold_ascii(const std::string& s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
    }
    return out;
}

namespace {

std::string regex_escape(const std::string& s) {
    static const std::string specials = R"(\^$.|?*+()[]{}/)";
    std::string out;
    for (char c : s) {
        if (specials.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string alternation(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out.push_back('|');
        out += regex_escape(item);
    }
    return out;
}

void read_set(const YAML::Node& node, std::unordered_set<std::string>& out) {
    if (!node) return;
    for (const auto& item : node) {
        out.insert(fold_ascii(item.as<std::string>()));
    }
}

std::vector<std::string> read_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

void read_weight(const YAML::Node& node, const char* key, double& out) {
    if (node && node[key]) out = node[key].as<double>();
}

std::shared_ptr<NerModel> build(const YAML::Node& yaml) {
    auto model = std::make_shared<NerModel>();

    model->name = yaml["name"] ? yaml["name"].as<std::string>() : "unnamed";
    model->version = yaml["version"] ? yaml["version"].as<std::string>() : "0";
    if (yaml["threshold"]) model->threshold = yaml["threshold"].as<double>();
    if (yaml["date_confidence"]) model->date_confidence = yaml["date_confidence"].as<double>();
    if (yaml["money_confidence"]) model->money_confidence = yaml["money_confidence"].as<double>();

    if (model->threshold <= 0.0 || model->threshold >= 1.0) {
        throw ModelLoadError("NER threshold must lie in (0, 1)", "threshold");
    }

    const auto& w = yaml["weights"];
    auto& weights = model->weights;
    read_weight(w, "person_bias", weights.person_bias);
    read_weight(w, "first_name", weights.first_name);
    read_weight(w, "last_name", weights.last_name);
    read_weight(w, "title_cue", weights.title_cue);
    read_weight(w, "multi_token", weights.multi_token);
    read_weight(w, "organization_bias", weights.organization_bias);
    read_weight(w, "org_suffix", weights.org_suffix);
    read_weight(w, "org_gazetteer", weights.org_gazetteer);
    read_weight(w, "location_bias", weights.location_bias);
    read_weight(w, "location_gazetteer", weights.location_gazetteer);
    read_weight(w, "location_preposition", weights.location_preposition);
    read_weight(w, "sentence_initial", weights.sentence_initial);

    const auto& gaz = yaml["gazetteers"];
    if (gaz) {
        read_set(gaz["first_names"], model->first_names);
        read_set(gaz["last_names"], model->last_names);
        read_set(gaz["organizations"], model->organizations);
        read_set(gaz["locations"], model->locations);
    }

    const auto& cues = yaml["cues"];
    if (cues) {
        read_set(cues["person_titles"], model->person_titles);
        read_set(cues["org_suffixes"], model->org_suffixes);
        read_set(cues["location_prepositions"], model->location_prepositions);
        read_set(cues["connectors"], model->connectors);
        read_set(cues["stopwords"], model->stopwords);
    }

    model->months = read_list(yaml["months"]);
    if (model->months.empty()) {
        throw ModelLoadError("NER model defines no month names", "months");
    }

    std::vector<std::string> symbols;
    std::vector<std::string> words;
    if (const auto& currency = yaml["currency"]) {
        symbols = read_list(currency["symbols"]);
        words = read_list(currency["words"]);
    }
    if (symbols.empty() && words.empty()) {
        throw ModelLoadError("NER model defines no currency markers", "currency");
    }

    const std::string month = "(?:" + alternation(model->months) + ")";
    const std::string ordinal = "(?:st|nd|rd|th)?";
    model->date_regex = std::regex(
        "\\b" + month + "\\.?\\s+\\d{1,2}" + ordinal + "(?:,?\\s+\\d{4})?\\b"
        "|\\b\\d{1,2}" + ordinal + "\\s+" + month + "(?:,?\\s+\\d{4})?\\b"
        "|\\b" + month + "\\s+\\d{4}\\b",
        std::regex::ECMAScript | std::regex::optimize);

    model->time_regex = std::regex(
        R"(\b(?:[01]?\d|2[0-3]):[0-5]\d(?::[0-5]\d)?(?:\s?[AaPp][Mm]\b)?)",
        std::regex::ECMAScript | std::regex::optimize);

    const std::string amount = R"((?:\d{1,3}(?:,\d{3})+|\d+)(?:\.\d{1,2})?)";
    std::string money;
    if (!symbols.empty()) {
        money += "(?:" + alternation(symbols) + ")\\s?" + amount +
                 "(?:\\s?(?:thousand|million|billion)\\b)?";
    }
    if (!words.empty()) {
        if (!money.empty()) money += "|";
        money += "\\b" + amount + "\\s?(?:" + alternation(words) + ")\\b";
    }
    model->money_regex = std::regex(money, std::regex::ECMAScript | std::regex::optimize);

    return model;
}

} // namespace

std::shared_ptr<const NerModel> NerModel::parse(const std::string& yaml_text) {
    try {
        return build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Malformed NER model", e.what());
    } catch (const std::regex_error& e) {
        throw ModelLoadError("NER model produced an invalid expression", e.what());
    }
}

std::shared_ptr<const NerModel> NerModel::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        throw ModelLoadError("NER model file not found", path,
                             "Set models.ner_model or REDACTOR_NER_MODEL");
    }

    std::shared_ptr<NerModel> model;
    try {
        model = build(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Malformed NER model", path + ": " + e.what());
    } catch (const std::regex_error& e) {
        throw ModelLoadError("NER model produced an invalid expression", path + ": " + e.what());
    }

    LOG_INFO("Loaded NER model '", model->name, "' v", model->version, " (",
             model->first_names.size() + model->last_names.size(), " name entries, ",
             model->organizations.size(), " organizations, ",
             model->locations.size(), " locations)");
    return model;
}

} // namespace redactor
