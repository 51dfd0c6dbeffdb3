#pragma once

#include "../peak.hpp"
#include "../errors.hpp"

namespace trh {
namespace algorithms {

/**
 * @brief Identity window for the internal standard peak.
 *
 * A peak is a candidate only when its apex RT and its area both fall
 * inside the closed windows target +/- tolerance.
 */
struct IstdTarget {
    /// Nominal retention time (minutes)
    RetentionTime rt = 0.0;

    /// Half-width of the RT window
    RetentionTime rt_tolerance = 0.0;

    /// Expected peak area
    Area area = 0.0;

    /// Half-width of the area window (absolute)
    Area area_tolerance = 0.0;

    [[nodiscard]] RTRange rtWindow() const {
        return RTRange::around(rt, rt_tolerance);
    }
    [[nodiscard]] AreaRange areaWindow() const {
        return AreaRange::around(area, area_tolerance);
    }

    /// Check if a peak lies in both windows
    [[nodiscard]] bool accepts(const Peak& peak) const {
        return rtWindow().contains(peak.rt()) &&
               areaWindow().contains(peak.area());
    }
};

/**
 * @brief Result of an internal standard search.
 */
struct IstdMatch {
    /// Position of the chosen peak in the peak list
    Index position = 0;

    /// Chosen peak
    Peak peak;

    /// Number of peaks that satisfied both windows before narrowing
    std::size_t candidate_count = 0;
};

/**
 * @brief Find the internal standard peak.
 *
 * When several peaks satisfy both windows the one closest to the nominal
 * RT is kept (ties: earliest eluting).
 *
 * @throws IstdError if no peak lies in both windows
 */
IstdMatch findInternalStandard(const PeakList& peaks, const IstdTarget& target);

/**
 * @brief Get the integrated area of the internal standard peak.
 *
 * @throws IstdError if no peak lies in both windows
 */
Area locateInternalStandard(const PeakList& peaks, const IstdTarget& target);

} // namespace algorithms
} // namespace trh
