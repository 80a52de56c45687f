#pragma once

#include <memory>
#include <string>
#include <vector>

#include "redactor/detect/detector.hpp"
#include "redactor/detect/ner_model.hpp"

namespace redactor {

/**
 * Statistical Detector
 *
 * Named-entity recogniser over a lexicon NerModel. Title-case token runs are
 * scored per class (person, organization, location) with a logistic model
 * over gazetteer and context features; the best class is emitted when its
 * probability reaches the model threshold. Dates, times and currency
 * amounts are found with the rule expressions compiled into the model.
 *
 * Constructed with a null model the detector is Unavailable.
 */
class StatisticalDetector : public Detector {
public:
    explicit StatisticalDetector(std::shared_ptr<const NerModel> model);

    std::string name() const override { return "statistical"; }
    DetectionMethod method() const override { return DetectionMethod::Statistical; }
    bool available() const override { return model_ != nullptr; }

    DetectorResult detect(std::string_view text, const DetectionConfig& config) const override;

    const NerModel* model() const { return model_.get(); }

    // Word produced by the tokenizer, byte offsets into the scanned text
    struct Word {
        size_t start = 0;
        size_t end = 0;
        std::string folded;
        bool title_case = false;
        bool sentence_initial = false;
        bool joined_to_previous = false;   // separated from the previous word by spaces only
        bool after_period = false;         // previous word is followed by '.'
    };

    static std::vector<Word> tokenize(std::string_view text);

private:
    void detect_names(std::string_view text, FindingSet& out) const;
    void detect_rules(std::string_view text, FindingSet& out) const;

    std::shared_ptr<const NerModel> model_;
};

} // namespace redactor
