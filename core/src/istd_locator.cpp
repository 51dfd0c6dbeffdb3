#include "trh/algorithms/istd_locator.hpp"
#include <cmath>
#include <sstream>
#include <vector>

namespace trh {
namespace algorithms {

namespace {

std::string describeWindows(const IstdTarget& target) {
    std::ostringstream out;
    out << "RT " << target.rtWindow().min_value << "-"
        << target.rtWindow().max_value << ", area "
        << target.areaWindow().min_value << "-"
        << target.areaWindow().max_value;
    return out.str();
}

} // namespace

IstdMatch findInternalStandard(const PeakList& peaks, const IstdTarget& target) {
    std::vector<Index> candidates;
    for (std::size_t i = 0; i < peaks.size(); ++i) {
        if (target.accepts(peaks[i])) {
            candidates.push_back(i);
        }
    }

    const std::size_t found = candidates.size();

    // Narrow co-eluting candidates to the one closest to the nominal RT
    if (candidates.size() > 1) {
        Index best = candidates.front();
        double best_dist = std::abs(peaks[best].rt() - target.rt);
        for (Index pos : candidates) {
            double dist = std::abs(peaks[pos].rt() - target.rt);
            if (dist < best_dist) {
                best = pos;
                best_dist = dist;
            }
        }
        candidates.assign(1, best);
    }

    if (candidates.empty()) {
        throw IstdError("no acceptable internal standard peak found (" +
                        describeWindows(target) + ", " +
                        std::to_string(peaks.size()) + " peaks searched)");
    }
    if (candidates.size() > 1) {
        throw IstdError(std::to_string(candidates.size()) +
                        " candidate internal standard peaks within tolerance, "
                        "ambiguous (" + describeWindows(target) + ")");
    }

    IstdMatch match;
    match.position = candidates.front();
    match.peak = peaks[match.position];
    match.candidate_count = found;
    return match;
}

Area locateInternalStandard(const PeakList& peaks, const IstdTarget& target) {
    return findInternalStandard(peaks, target).peak.area();
}

} // namespace algorithms
} // namespace trh
