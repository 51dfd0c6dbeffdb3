#pragma once

#include "../peak.hpp"
#include "retention_index.hpp"
#include <vector>

namespace trh {
namespace algorithms {

/**
 * @brief Retention-time cutoffs delimiting the hydrocarbon fractions.
 *
 * Only the C6-C10 end is used in C6-C10 mode; the remaining cutoffs are
 * used in full TRH mode.
 */
struct FractionBoundaries {
    RetentionTime c6_c10_end = 0.0;
    RetentionTime c10_c16_start = 0.0;
    RetentionTime c10_c16_end = 0.0;
    RetentionTime c16_c34_end = 0.0;
    RetentionTime c34_c40_end = 0.0;
};

/**
 * @brief A fraction resolved against one run's peaks.
 *
 * Covers positions [low, high) of the peak list, i.e. peak numbers
 * low+1 .. high: a fraction includes the peak that ends it and excludes
 * the peak that starts it.
 */
struct FractionSlice {
    Fraction fraction = Fraction::C6_C10;
    Index low = 0;
    Index high = 0;

    /// Sum the areas covered by this slice
    [[nodiscard]] Area area(const PeakList& peaks) const {
        return peaks.sumAreas(low, high);
    }
};

/**
 * @brief Resolve every fraction of an analysis mode for one run.
 *
 * Slices are returned in the order given by fractionsFor(mode). The
 * combined C10-C40 slice is resolved from the C10-C16 start and C34-C40
 * end directly.
 *
 * @throws BoundaryResolutionError if a fraction end cannot be resolved
 */
std::vector<FractionSlice> sliceFractions(const PeakList& peaks,
                                          AnalysisMode mode,
                                          const FractionBoundaries& boundaries);

} // namespace algorithms
} // namespace trh
