#pragma once

#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace redactor {

/**
 * Lexicon NER model
 * =================
 *
 * Read-only model for the statistical detector, loaded once from YAML and
 * shared between all pipeline runs. Holds gazetteers, contextual cue lists,
 * logistic feature weights per class and the rule expressions for dates and
 * currency amounts.
 *
 * All lookup sets store case-folded (lower-case ASCII) entries.
 */
struct NerWeights {
    double person_bias = -2.0;
    double first_name = 2.5;
    double last_name = 1.5;
    double title_cue = 3.0;
    double multi_token = 1.0;

    double organization_bias = -2.5;
    double org_suffix = 4.0;
    double org_gazetteer = 4.5;

    double location_bias = -2.5;
    double location_gazetteer = 4.0;
    double location_preposition = 1.0;

    double sentence_initial = -1.0;
};

class NerModel {
public:
    std::string name;
    std::string version;
    double threshold = 0.5;
    double date_confidence = 0.85;
    double money_confidence = 0.85;
    NerWeights weights;

    std::unordered_set<std::string> first_names;
    std::unordered_set<std::string> last_names;
    std::unordered_set<std::string> organizations;
    std::unordered_set<std::string> locations;
    std::unordered_set<std::string> person_titles;
    std::unordered_set<std::string> org_suffixes;
    std::unordered_set<std::string> location_prepositions;
    std::unordered_set<std::string> connectors;
    std::unordered_set<std::string> stopwords;
    std::vector<std::string> months;

    // Built from months / currency lists at load time
    std::regex date_regex;
    std::regex time_regex;
    std::regex money_regex;

    /**
     * Load a model file.
     * @throws ModelLoadError if the file is missing or malformed
     */
    static std::shared_ptr<const NerModel> load(const std::string& path);

    // Parse a model from YAML text (used by load and by tests)
    static std::shared_ptr<const NerModel> parse(const std::string& yaml_text);
};

// ASCII lower-case copy used for every gazetteer lookup
std::string fold_ascii(const std::string& s);

} // namespace redactor
