#pragma once

#include "../sample_run.hpp"
#include "fraction_slicer.hpp"
#include "istd_locator.hpp"
#include <map>
#include <vector>

namespace trh {
namespace algorithms {

/**
 * @brief Background areas averaged over the blank runs of a batch.
 *
 * Holds one mean area per fraction of the analysis mode and the mean
 * internal standard area. Immutable once built; fractions outside the
 * mode are absent rather than zero.
 */
class BlankAverage {
public:
    BlankAverage(AnalysisMode mode, std::map<Fraction, Area> fraction_areas,
                 Area istd, std::size_t run_count)
        : mode_(mode), fraction_areas_(std::move(fraction_areas)),
          istd_(istd), run_count_(run_count) {}

    /// Get analysis mode the average was built for
    [[nodiscard]] AnalysisMode mode() const noexcept { return mode_; }

    /// Check if a fraction was averaged
    [[nodiscard]] bool hasFraction(Fraction f) const {
        return fraction_areas_.count(f) != 0;
    }

    /**
     * @brief Get mean background area of a fraction.
     *
     * @throws std::out_of_range if the fraction is not part of the mode
     */
    [[nodiscard]] Area fractionArea(Fraction f) const;

    /// Get all averaged fraction areas
    [[nodiscard]] const std::map<Fraction, Area>& fractionAreas() const noexcept {
        return fraction_areas_;
    }

    /// Get mean internal standard area
    [[nodiscard]] Area istd() const noexcept { return istd_; }

    /// Get number of blank runs averaged
    [[nodiscard]] std::size_t runCount() const noexcept { return run_count_; }

private:
    AnalysisMode mode_;
    std::map<Fraction, Area> fraction_areas_;
    Area istd_;
    std::size_t run_count_;
};

/**
 * @brief Fraction sums and ISTD area of a single blank run.
 */
struct BlankRunSummary {
    std::map<Fraction, Area> fraction_areas;
    Area istd = 0.0;
};

/**
 * @brief Resolve one blank run's fractions and internal standard.
 *
 * @throws BoundaryResolutionError if a fraction end cannot be resolved
 * @throws IstdError if the internal standard is not found
 */
BlankRunSummary summarizeBlankRun(const PeakList& peaks, AnalysisMode mode,
                                  const FractionBoundaries& boundaries,
                                  const IstdTarget& istd_target);

/**
 * @brief Average already summarized blank runs without weighting.
 *
 * @throws std::invalid_argument if @p summaries is empty
 */
BlankAverage averageBlankRuns(const std::vector<BlankRunSummary>& summaries,
                              AnalysisMode mode);

/**
 * @brief Build the blank average for a batch.
 *
 * Every blank run is sliced into the fractions of @p mode and searched for
 * its internal standard; per-run fraction sums and ISTD areas are averaged
 * without weighting. A single unresolvable run aborts the whole average.
 *
 * @throws std::invalid_argument if @p blank_runs is empty
 * @throws BoundaryResolutionError, IstdError from any blank run
 */
BlankAverage buildBlankAverage(const std::vector<PeakList>& blank_runs,
                               AnalysisMode mode,
                               const FractionBoundaries& boundaries,
                               const IstdTarget& istd_target);

/// Convenience overload taking whole sample runs
BlankAverage buildBlankAverage(const std::vector<SampleRun>& blank_runs,
                               AnalysisMode mode,
                               const FractionBoundaries& boundaries,
                               const IstdTarget& istd_target);

} // namespace algorithms
} // namespace trh
