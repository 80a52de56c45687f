#include "redactor/detect/detector_set.hpp"
#include "redactor/detect/enterprise_detector.hpp"
#include "redactor/detect/merger.hpp"
#include "redactor/detect/pattern_detector.hpp"
#include "redactor/detect/statistical_detector.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"

namespace redactor {

DetectorSet::DetectorSet(std::shared_ptr<const NerModel> ner_model,
                         std::shared_ptr<const EnterpriseProfile> enterprise_profile) {
    detectors_.push_back(std::make_unique<PatternDetector>());
    detectors_.push_back(std::make_unique<StatisticalDetector>(std::move(ner_model)));
    detectors_.push_back(std::make_unique<EnterpriseDetector>(std::move(enterprise_profile)));
}

DetectorSet::DetectorSet(std::vector<std::unique_ptr<Detector>> detectors)
    : detectors_(std::move(detectors)) {
    for (const auto& detector : detectors_) {
        REDACTOR_CHECK_POINTER(detector.get(), "detector");
    }
}

DetectorSet DetectorSet::from_config(const ModelConfig& models) {
    std::shared_ptr<const NerModel> ner;
    std::shared_ptr<const EnterpriseProfile> profile;
    std::map<DetectionMethod, std::string> failures;

    if (models.ner_model_path.empty()) {
        failures[DetectionMethod::Statistical] = "no model configured";
    } else {
        try {
            ner = NerModel::load(models.ner_model_path);
        } catch (const ModelLoadError& e) {
            LOG_WARN("Statistical detection unavailable: ", e.message(), " (", e.context(), ")");
            failures[DetectionMethod::Statistical] = e.message();
        }
    }

    if (models.enterprise_profile_path.empty()) {
        failures[DetectionMethod::Enterprise] = "no profile configured";
    } else {
        try {
            profile = EnterpriseProfile::load(models.enterprise_profile_path);
        } catch (const ModelLoadError& e) {
            LOG_WARN("Enterprise detection unavailable: ", e.message(), " (", e.context(), ")");
            failures[DetectionMethod::Enterprise] = e.message();
        }
    }

    DetectorSet set(std::move(ner), std::move(profile));
    set.load_failures_ = std::move(failures);
    return set;
}

BlockDetection DetectorSet::detect(std::string_view text, const DetectionConfig& config) const {
    BlockDetection result;
    std::vector<Finding> pool;

    for (DetectionMethod method : {DetectionMethod::Pattern, DetectionMethod::Statistical,
                                   DetectionMethod::Enterprise}) {
        if (config.is_enabled(method) && !is_available(method)) {
            result.degraded_methods.insert(method);
        }
    }

    for (const auto& detector : detectors_) {
        if (!config.is_enabled(detector->method())) continue;

        DetectorResult found = detector->detect(text, config);
        if (!found.is_available()) continue;

        result.methods_used.insert(detector->method());
        pool.insert(pool.end(),
                    std::make_move_iterator(found.findings.begin()),
                    std::make_move_iterator(found.findings.end()));
    }

    result.findings = merge_findings(std::move(pool));
    return result;
}

bool DetectorSet::is_available(DetectionMethod method) const {
    for (const auto& detector : detectors_) {
        if (detector->method() == method && detector->available()) return true;
    }
    return false;
}

std::vector<DetectorStatusEntry> DetectorSet::status() const {
    std::vector<DetectorStatusEntry> entries;
    for (const auto& detector : detectors_) {
        DetectorStatusEntry entry;
        entry.method = detector->method();
        entry.name = detector->name();
        entry.available = detector->available();

        if (const auto* stat = dynamic_cast<const StatisticalDetector*>(detector.get()); stat && stat->model()) {
            entry.source = stat->model()->name + " v" + stat->model()->version;
        } else if (const auto* ent = dynamic_cast<const EnterpriseDetector*>(detector.get()); ent && ent->profile()) {
            entry.source = ent->profile()->name + " v" + ent->profile()->version;
        } else if (entry.method == DetectionMethod::Pattern) {
            entry.source = "built-in";
        } else {
            auto it = load_failures_.find(entry.method);
            entry.source = it != load_failures_.end() ? it->second : "no model loaded";
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace redactor
