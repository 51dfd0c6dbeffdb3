#include "trh/algorithms/retention_index.hpp"
#include <cmath>
#include <sstream>

namespace trh {
namespace algorithms {

Index fractionEndIndex(const PeakList& peaks, RetentionTime rt_end) {
    bool found = false;
    Index best = 0;
    double best_diff = 0.0;

    for (std::size_t i = 0; i < peaks.size(); ++i) {
        double diff = peaks[i].endRt() - rt_end;
        if (diff < 0.0) continue;

        // Strict comparison keeps the earliest of equally close peaks
        if (!found || diff < best_diff) {
            found = true;
            best = i;
            best_diff = diff;
        }
    }

    if (!found) {
        std::ostringstream msg;
        msg << "no peak found ending at or after target retention time "
            << rt_end << " (" << peaks.size() << " peaks";
        if (!peaks.empty()) {
            msg << ", last ends at " << peaks[peaks.size() - 1].endRt();
        }
        msg << ")";
        throw BoundaryResolutionError(msg.str());
    }
    return best + 1;
}

Index fractionStartIndex(const PeakList& peaks, RetentionTime rt_start) {
    bool found = false;
    Index best = 0;
    double best_diff = 0.0;

    for (std::size_t i = 0; i < peaks.size(); ++i) {
        double offset = peaks[i].startRt() - rt_start;
        if (offset > 0.0) continue;

        double diff = std::abs(offset);
        if (!found || diff < best_diff) {
            found = true;
            best = i;
            best_diff = diff;
        }
    }

    // First detected peak starts after the boundary: run assumed clean
    if (!found) {
        return 1;
    }
    return best + 1;
}

} // namespace algorithms
} // namespace trh
