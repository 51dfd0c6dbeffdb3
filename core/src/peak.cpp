#include "trh/peak.hpp"
#include <numeric>
#include <stdexcept>

namespace trh {

Area PeakList::sumAreas(Index low, Index high) const {
    if (low > high) {
        throw std::invalid_argument(
            "Invalid peak range: low position " + std::to_string(low) +
            " exceeds high position " + std::to_string(high));
    }
    if (high > peaks_.size()) {
        throw std::invalid_argument(
            "Invalid peak range: high position " + std::to_string(high) +
            " exceeds peak count " + std::to_string(peaks_.size()));
    }

    return std::accumulate(peaks_.begin() + static_cast<std::ptrdiff_t>(low),
                           peaks_.begin() + static_cast<std::ptrdiff_t>(high),
                           0.0,
                           [](Area sum, const Peak& p) { return sum + p.area(); });
}

const Peak* PeakList::findByIndex(Index index) const {
    for (const auto& p : peaks_) {
        if (p.index() == index) {
            return &p;
        }
    }
    return nullptr;
}

PeakList PeakList::findInRtRange(RetentionTime low, RetentionTime high) const {
    PeakList result;
    for (const auto& p : peaks_) {
        if (p.rt() >= low && p.rt() <= high) {
            result.add(p);
        }
    }
    return result;
}

RTRange PeakList::rtRange() const {
    RTRange range;
    for (const auto& p : peaks_) {
        range.extend(p.startRt());
        range.extend(p.endRt());
    }
    return range;
}

void PeakList::validate() const {
    for (std::size_t i = 0; i < peaks_.size(); ++i) {
        const Peak& p = peaks_[i];
        if (!p.isConsistent()) {
            throw std::invalid_argument(
                "Peak " + std::to_string(p.index()) +
                " is inconsistent (requires start <= RT <= end and area >= 0)");
        }
        if (i == 0) continue;

        const Peak& prev = peaks_[i - 1];
        if (p.index() <= prev.index()) {
            throw std::invalid_argument(
                "Peak numbers not ascending at position " + std::to_string(i) +
                " (" + std::to_string(prev.index()) + " then " +
                std::to_string(p.index()) + ")");
        }
        if (p.rt() < prev.rt()) {
            throw std::invalid_argument(
                "Peak " + std::to_string(p.index()) +
                " elutes before the preceding peak");
        }
    }
}

} // namespace trh
