#include "trh/algorithms/blank_average.hpp"
#include <numeric>
#include <stdexcept>

namespace trh {
namespace algorithms {

namespace {

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

} // namespace

Area BlankAverage::fractionArea(Fraction f) const {
    auto it = fraction_areas_.find(f);
    if (it == fraction_areas_.end()) {
        throw std::out_of_range("Blank average has no " + toString(f) +
                                " area in " + toString(mode_) + " mode");
    }
    return it->second;
}

BlankRunSummary summarizeBlankRun(const PeakList& peaks, AnalysisMode mode,
                                  const FractionBoundaries& boundaries,
                                  const IstdTarget& istd_target) {
    BlankRunSummary summary;
    for (const auto& slice : sliceFractions(peaks, mode, boundaries)) {
        summary.fraction_areas[slice.fraction] = slice.area(peaks);
    }
    summary.istd = locateInternalStandard(peaks, istd_target);
    return summary;
}

BlankAverage averageBlankRuns(const std::vector<BlankRunSummary>& summaries,
                              AnalysisMode mode) {
    if (summaries.empty()) {
        throw std::invalid_argument("Blank average requires at least one blank run");
    }

    std::map<Fraction, std::vector<double>> sums;
    std::vector<double> istd_areas;
    istd_areas.reserve(summaries.size());

    for (const auto& summary : summaries) {
        for (const auto& [fraction, area] : summary.fraction_areas) {
            sums[fraction].push_back(area);
        }
        istd_areas.push_back(summary.istd);
    }

    std::map<Fraction, Area> averages;
    for (const auto& [fraction, values] : sums) {
        averages[fraction] = mean(values);
    }

    return BlankAverage(mode, std::move(averages), mean(istd_areas),
                        summaries.size());
}

BlankAverage buildBlankAverage(const std::vector<PeakList>& blank_runs,
                               AnalysisMode mode,
                               const FractionBoundaries& boundaries,
                               const IstdTarget& istd_target) {
    if (blank_runs.empty()) {
        throw std::invalid_argument("Blank average requires at least one blank run");
    }

    std::vector<BlankRunSummary> summaries;
    summaries.reserve(blank_runs.size());
    for (const auto& peaks : blank_runs) {
        summaries.push_back(summarizeBlankRun(peaks, mode, boundaries, istd_target));
    }
    return averageBlankRuns(summaries, mode);
}

BlankAverage buildBlankAverage(const std::vector<SampleRun>& blank_runs,
                               AnalysisMode mode,
                               const FractionBoundaries& boundaries,
                               const IstdTarget& istd_target) {
    std::vector<BlankRunSummary> summaries;
    summaries.reserve(blank_runs.size());
    for (const auto& run : blank_runs) {
        summaries.push_back(summarizeBlankRun(run.peaks(), mode, boundaries,
                                              istd_target));
    }
    return averageBlankRuns(summaries, mode);
}

} // namespace algorithms
} // namespace trh
