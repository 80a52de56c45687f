#include "redactor/detect/statistical_detector.hpp"
#include "redactor/util/utf8.hpp"

#include <algorithm>
#include <cmath>

namespace redactor {

namespace {

bool is_word_byte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '\'' || c >= 0x80;
}

bool is_lower_codepoint(uint32_t cp) {
    if (cp >= 'a' && cp <= 'z') return true;
    return cp >= 0xDF && cp <= 0x17F && cp != 0xF7 && util::fold_codepoint(cp) == cp;
}

// Upper-case first letter followed by at least one lower-case letter.
// All-caps words (acronyms, redaction labels) are never candidates.
bool is_title_case(std::string_view word) {
    const auto cps = util::decode_utf8(word);
    if (cps.empty() || util::fold_codepoint(cps[0]) == cps[0]) return false;
    return std::any_of(cps.begin() + 1, cps.end(), is_lower_codepoint);
}

double sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

void collect(const std::regex& regex, std::string_view text, EntityType type,
             double confidence, FindingSet& out) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    for (std::cregex_iterator it(begin, end, regex), last; it != last; ++it) {
        if (it->length(0) == 0) continue;
        Finding f;
        f.entity_type = type;
        f.start = static_cast<size_t>(it->position(0));
        f.end = f.start + static_cast<size_t>(it->length(0));
        f.text = it->str(0);
        f.confidence = confidence;
        f.method = DetectionMethod::Statistical;
        out.push_back(std::move(f));
    }
}

} // namespace

StatisticalDetector::StatisticalDetector(std::shared_ptr<const NerModel> model)
    : model_(std::move(model)) {}

std::vector<StatisticalDetector::Word> StatisticalDetector::tokenize(std::string_view text) {
    std::vector<Word> words;
    const size_t n = text.size();
    size_t i = 0;
    size_t prev_end = 0;

    while (i < n) {
        if (!is_word_byte(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        const size_t s = i;
        while (i < n) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (is_word_byte(c)) {
                ++i;
            } else if (c == '-' && i > s && i + 1 < n &&
                       is_word_byte(static_cast<unsigned char>(text[i + 1]))) {
                ++i;  // hyphenated name
            } else {
                break;
            }
        }

        Word w;
        w.start = s;
        w.end = i;
        const std::string_view raw = text.substr(s, i - s);
        w.folded = fold_ascii(std::string(raw));
        w.title_case = is_title_case(raw);

        if (words.empty()) {
            w.sentence_initial = true;
        } else {
            const std::string_view gap = text.substr(prev_end, s - prev_end);
            w.joined_to_previous = gap.find_first_not_of(" \t") == std::string_view::npos;
            w.after_period = gap.front() == '.';
            w.sentence_initial = gap.find_first_of(".!?\r\n") != std::string_view::npos;
        }

        words.push_back(std::move(w));
        prev_end = i;
    }

    return words;
}

DetectorResult StatisticalDetector::detect(std::string_view text, const DetectionConfig& /*config*/) const {
    if (!model_) {
        return DetectorResult::unavailable();
    }

    FindingSet findings;
    detect_names(text, findings);
    detect_rules(text, findings);
    return DetectorResult::ok(std::move(findings));
}

void StatisticalDetector::detect_names(std::string_view text, FindingSet& out) const {
    const NerModel& m = *model_;
    const NerWeights& w = m.weights;
    const auto words = tokenize(text);

    auto is_month = [&m](const std::string& folded) {
        return std::any_of(m.months.begin(), m.months.end(),
                           [&folded](const std::string& month) { return fold_ascii(month) == folded; });
    };

    size_t i = 0;
    while (i < words.size()) {
        if (!words[i].title_case) {
            ++i;
            continue;
        }

        // Grow a run of title-case words, allowing lower-case connectors
        // ("Bank of America") when another title-case word follows.
        const size_t first = i;
        size_t last = i;
        size_t j = i + 1;
        while (j < words.size() && words[j].joined_to_previous) {
            if (words[j].title_case) {
                last = j++;
            } else if (m.connectors.count(words[j].folded) && j + 1 < words.size() &&
                       words[j + 1].joined_to_previous && words[j + 1].title_case) {
                last = j + 1;
                j += 2;
            } else {
                break;
            }
        }
        i = last + 1;

        bool title_cue = false;
        size_t b = first;
        while (b <= last && (m.person_titles.count(words[b].folded) || m.stopwords.count(words[b].folded))) {
            if (m.person_titles.count(words[b].folded)) title_cue = true;
            ++b;
        }
        if (b > last) continue;

        if (b == first && first > 0 && m.person_titles.count(words[first - 1].folded) &&
            (words[first].joined_to_previous || words[first].after_period)) {
            title_cue = true;
        }

        bool all_months = true;
        std::string phrase;
        for (size_t k = b; k <= last; ++k) {
            if (!is_month(words[k].folded)) all_months = false;
            if (!phrase.empty()) phrase.push_back(' ');
            phrase += words[k].folded;
        }
        if (all_months) continue;

        const size_t count = last - b + 1;
        const bool sentence_initial = b == first && words[first].sentence_initial && !title_cue;
        const double initial_penalty = sentence_initial ? w.sentence_initial : 0.0;
        const bool after_preposition = b > 0 && words[b].joined_to_previous &&
                                       m.location_prepositions.count(words[b - 1].folded) > 0;

        double person = w.person_bias + initial_penalty;
        if (m.first_names.count(words[b].folded)) person += w.first_name;
        if (m.last_names.count(words[last].folded)) person += w.last_name;
        if (title_cue) person += w.title_cue;
        if (count >= 2 && count <= 3) person += w.multi_token;

        double organization = w.organization_bias + initial_penalty;
        if (count >= 2 && m.org_suffixes.count(words[last].folded)) organization += w.org_suffix;
        if (m.organizations.count(phrase)) organization += w.org_gazetteer;

        double location = w.location_bias + initial_penalty;
        if (m.locations.count(phrase)) location += w.location_gazetteer;
        if (after_preposition) location += w.location_preposition;

        EntityType type = EntityType::PERSON;
        double best = person;
        if (organization > best) {
            type = EntityType::ORGANIZATION;
            best = organization;
        }
        if (location > best) {
            type = EntityType::LOCATION;
            best = location;
        }

        const double probability = sigmoid(best);
        if (probability < m.threshold) continue;

        Finding f;
        f.entity_type = type;
        f.start = words[b].start;
        f.end = words[last].end;
        f.text = std::string(text.substr(f.start, f.end - f.start));
        f.confidence = probability;
        f.method = DetectionMethod::Statistical;
        out.push_back(std::move(f));
    }
}

void StatisticalDetector::detect_rules(std::string_view text, FindingSet& out) const {
    collect(model_->date_regex, text, EntityType::DATE_TIME, model_->date_confidence, out);
    collect(model_->time_regex, text, EntityType::DATE_TIME, model_->date_confidence, out);
    collect(model_->money_regex, text, EntityType::FINANCIAL, model_->money_confidence, out);
}

} // namespace redactor
