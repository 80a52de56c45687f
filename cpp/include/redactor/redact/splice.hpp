#pragma once

#include <string>
#include <string_view>

#include "redactor/config.hpp"
#include "redactor/types.hpp"

namespace redactor {

struct SpliceResult {
    std::string text;
    size_t tokens_emitted = 0;
};

/**
 * Interval splice: walk the block left to right, copy the gaps between
 * findings verbatim and emit one token per finding span.
 *
 * findings must be a merged FindingSet (sorted, non-overlapping, in bounds);
 * anything else throws InvalidArgumentError.
 */
SpliceResult splice_block(std::string_view content, const FindingSet& findings,
                          const RedactionConfig& config);

} // namespace redactor
