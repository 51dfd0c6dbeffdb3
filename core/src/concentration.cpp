#include "trh/algorithms/concentration.hpp"
#include <cmath>

namespace trh {
namespace algorithms {

namespace {

double divide(double numerator, double denominator, const char* what) {
    if (denominator == 0.0) {
        throw NumericDegeneracyError(std::string("division by zero: ") + what);
    }
    return numerator / denominator;
}

void requireFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw NumericDegeneracyError(std::string(what) + " is not finite");
    }
}

} // namespace

double CalibrationModel::concentrationRatio(double response_ratio) const {
    return divide(response_ratio - intercept, slope, "calibration slope is zero");
}

double roundTo(double value, int decimal_places) {
    double scale = std::pow(10.0, decimal_places);
    double scaled = value * scale;
    // Magnitudes this large carry no digits below the requested place
    if (!std::isfinite(scaled)) {
        return value;
    }
    return std::round(scaled) / scale;
}

QuantificationBreakdown quantify(const PeakList& sample_peaks,
                                 Index low_index, Index high_index,
                                 const IstdTarget& istd_target,
                                 const BlankAverage& blank_average,
                                 Area blank_fraction_area,
                                 const CalibrationModel& calibration,
                                 const QuantificationOptions& options) {
    return quantify(sample_peaks, low_index, high_index,
                    locateInternalStandard(sample_peaks, istd_target),
                    blank_average, blank_fraction_area, calibration, options);
}

QuantificationBreakdown quantify(const PeakList& sample_peaks,
                                 Index low_index, Index high_index,
                                 Area sample_istd,
                                 const BlankAverage& blank_average,
                                 Area blank_fraction_area,
                                 const CalibrationModel& calibration,
                                 const QuantificationOptions& options) {
    QuantificationBreakdown q;

    q.area = sample_peaks.sumAreas(low_index, high_index);
    q.istd = sample_istd;

    q.istd_blank_corrected = q.istd * divide(blank_fraction_area,
                                             blank_average.istd(),
                                             "blank ISTD area is zero");
    q.area_blank_corrected = q.area - q.istd_blank_corrected;

    q.response_ratio = divide(q.area_blank_corrected, q.istd,
                              "sample ISTD area is zero");
    q.concentration_ratio = calibration.concentrationRatio(q.response_ratio);

    q.concentration_vial = q.concentration_ratio * options.istd_concentration;
    q.concentration_sample = q.concentration_vial * options.dilution_factor;
    requireFinite(q.concentration_sample, "sample concentration");

    q.concentration = roundTo(q.concentration_sample, options.decimal_places);
    requireFinite(q.concentration, "rounded concentration");
    return q;
}

double computeConcentration(const PeakList& sample_peaks,
                            Index low_index, Index high_index,
                            const IstdTarget& istd_target,
                            const BlankAverage& blank_average,
                            Area blank_fraction_area,
                            const CalibrationModel& calibration,
                            double istd_concentration,
                            double dilution_factor,
                            int decimal_places) {
    QuantificationOptions options;
    options.istd_concentration = istd_concentration;
    options.dilution_factor = dilution_factor;
    options.decimal_places = decimal_places;
    return quantify(sample_peaks, low_index, high_index, istd_target,
                    blank_average, blank_fraction_area, calibration,
                    options).concentration;
}

} // namespace algorithms
} // namespace trh
