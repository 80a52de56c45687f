#include "redactor/detect/merger.hpp"

#include <algorithm>
#include <tuple>

namespace redactor {

bool finding_order(const Finding& a, const Finding& b) {
    const int pa = method_priority(a.method);
    const int pb = method_priority(b.method);
    return std::tie(a.start, b.end, pb, a.entity_type, a.text) <
           std::tie(b.start, a.end, pa, b.entity_type, b.text);
}

namespace {

// True when candidate should replace incumbent
bool wins_over(const Finding& candidate, const Finding& incumbent) {
    if (candidate.length() != incumbent.length()) {
        return candidate.length() > incumbent.length();
    }
    return method_priority(candidate.method) > method_priority(incumbent.method);
}

} // namespace

FindingSet merge_findings(std::vector<Finding> pool) {
    std::sort(pool.begin(), pool.end(), finding_order);

    FindingSet kept;
    kept.reserve(pool.size());

    for (auto& candidate : pool) {
        if (candidate.end <= candidate.start) continue;

        if (kept.empty() || !kept.back().overlaps(candidate)) {
            kept.push_back(std::move(candidate));
        } else if (wins_over(candidate, kept.back())) {
            kept.back() = std::move(candidate);
        }
    }

    return kept;
}

} // namespace redactor
