#pragma once

#include "../peak.hpp"
#include "../errors.hpp"

namespace trh {
namespace algorithms {

/**
 * @brief Resolve a fraction end boundary to a peak number.
 *
 * Among peaks whose integration window ends at or after @p rt_end, picks
 * the one ending closest to it. Equally close peaks resolve to the one
 * eluting first.
 *
 * @param peaks Peaks in elution order
 * @param rt_end Fraction end retention time
 * @return 1-based peak number (position + 1)
 * @throws BoundaryResolutionError if no peak ends at or after @p rt_end
 */
Index fractionEndIndex(const PeakList& peaks, RetentionTime rt_end);

/**
 * @brief Resolve a fraction start boundary to a peak number.
 *
 * Among peaks whose integration window starts at or before @p rt_start,
 * picks the one starting closest to it. Equally close peaks resolve to the
 * one eluting first.
 *
 * @param peaks Peaks in elution order
 * @param rt_start Fraction start retention time
 * @return 1-based peak number (position + 1), or 1 when every peak starts
 *         after @p rt_start
 */
Index fractionStartIndex(const PeakList& peaks, RetentionTime rt_start);

} // namespace algorithms
} // namespace trh
