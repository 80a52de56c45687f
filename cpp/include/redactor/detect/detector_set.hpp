#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "redactor/config.hpp"
#include "redactor/detect/detector.hpp"
#include "redactor/detect/enterprise_profile.hpp"
#include "redactor/detect/ner_model.hpp"

namespace redactor {

struct DetectorStatusEntry {
    DetectionMethod method;
    std::string name;
    bool available = false;
    std::string source;     // model / profile name and version, or why it is missing
};

/**
 * Result of running the enabled detectors over one text block.
 * Unavailable methods are recorded as degradation, never as an error.
 */
struct BlockDetection {
    FindingSet findings;
    std::set<DetectionMethod> methods_used;
    std::set<DetectionMethod> degraded_methods;
};

/**
 * DetectorSet - the assembled detection capability of the process.
 *
 * Built once at start-up (models loaded once and shared read-only) and passed
 * by reference to every pipeline run. detect() is const and safe to call from
 * many threads at once.
 */
class DetectorSet {
public:
    // Pattern detector plus statistical / enterprise detectors over the given
    // models; a null model leaves that method unavailable.
    DetectorSet(std::shared_ptr<const NerModel> ner_model,
                std::shared_ptr<const EnterpriseProfile> enterprise_profile);

    // Arbitrary detector list, in execution order
    explicit DetectorSet(std::vector<std::unique_ptr<Detector>> detectors);

    /**
     * Load models named by the configuration. A model that fails to load is
     * logged at warn level and its method reported unavailable.
     */
    static DetectorSet from_config(const ModelConfig& models);

    DetectorSet(DetectorSet&&) = default;
    DetectorSet& operator=(DetectorSet&&) = default;
    DetectorSet(const DetectorSet&) = delete;
    DetectorSet& operator=(const DetectorSet&) = delete;

    // Run every enabled detector over text and merge the findings
    BlockDetection detect(std::string_view text, const DetectionConfig& config) const;

    std::vector<DetectorStatusEntry> status() const;

    bool is_available(DetectionMethod method) const;

    size_t size() const { return detectors_.size(); }

private:
    std::vector<std::unique_ptr<Detector>> detectors_;
    std::map<DetectionMethod, std::string> load_failures_;
};

} // namespace redactor
