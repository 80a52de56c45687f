#pragma once

#include <vector>

#include "redactor/types.hpp"

namespace redactor {

/**
 * Total order used before the overlap sweep: start ascending, end
 * descending, method priority descending, entity type, then text.
 * Two findings compare equal only if they are interchangeable.
 */
bool finding_order(const Finding& a, const Finding& b);

/**
 * Merge raw findings from any number of detectors into one FindingSet.
 *
 * Among findings sharing at least one byte, the longer span is kept; on
 * equal length the higher method priority wins (enterprise > statistical >
 * pattern). Confidence never decides inclusion. The result is sorted by
 * start, pairwise non-overlapping and identical for every permutation of
 * the input.
 */
FindingSet merge_findings(std::vector<Finding> pool);

} // namespace redactor
