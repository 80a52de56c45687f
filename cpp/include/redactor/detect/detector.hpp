/**
 * Detector Capability
 * ===================
 *
 * A detector finds sensitive spans inside one block of text. Three methods
 * exist (pattern, statistical, enterprise); each is implemented behind the
 * same interface so the DetectorSet can run any subset of them.
 *
 * A detector whose backing model could not be loaded stays constructible and
 * answers every call with an explicit Unavailable result instead of throwing.
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "redactor/types.hpp"

namespace redactor {

enum class DetectorStatus : uint8_t {
    Ok,
    Unavailable
};

struct DetectorResult {
    DetectorStatus status = DetectorStatus::Ok;
    FindingSet findings;

    static DetectorResult ok(FindingSet findings) {
        return DetectorResult{DetectorStatus::Ok, std::move(findings)};
    }

    static DetectorResult unavailable() {
        return DetectorResult{DetectorStatus::Unavailable, {}};
    }

    bool is_available() const { return status == DetectorStatus::Ok; }
};

/**
 * Detector Interface - base class for all detection methods
 *
 * Implementations must be pure with respect to detect(): no mutable state is
 * shared between calls, so one instance can serve many worker threads.
 */
class Detector {
public:
    virtual ~Detector() = default;

    virtual std::string name() const = 0;
    virtual DetectionMethod method() const = 0;

    // False when the backing model/profile is missing
    virtual bool available() const = 0;

    /**
     * Scan one block of text.
     * @param text   block content (UTF-8)
     * @param config per-request detection options
     * @return findings with byte offsets into text, or Unavailable
     */
    virtual DetectorResult detect(std::string_view text, const DetectionConfig& config) const = 0;
};

} // namespace redactor
