#pragma once

#include "../peak.hpp"
#include "../errors.hpp"
#include "istd_locator.hpp"
#include "blank_average.hpp"

namespace trh {
namespace algorithms {

/**
 * @brief Linear fit of response ratio against concentration ratio.
 *
 * response_ratio = slope * concentration_ratio + intercept
 */
struct CalibrationModel {
    double slope = 1.0;
    double intercept = 0.0;

    CalibrationModel() = default;
    CalibrationModel(double s, double i) : slope(s), intercept(i) {}

    /// Predict the response ratio of a concentration ratio
    [[nodiscard]] double response(double concentration_ratio) const {
        return slope * concentration_ratio + intercept;
    }

    /**
     * @brief Invert the fit.
     *
     * @throws NumericDegeneracyError if the slope is zero
     */
    [[nodiscard]] double concentrationRatio(double response_ratio) const;
};

/**
 * @brief Per-compound scaling applied after calibration inversion.
 */
struct QuantificationOptions {
    /// Concentration of the internal standard in the vial
    double istd_concentration = 1.0;

    /// Sample dilution factor
    double dilution_factor = 1.0;

    /// Decimal places of the reported concentration
    int decimal_places = 2;
};

/**
 * @brief Every intermediate value of one concentration computation.
 */
struct QuantificationBreakdown {
    Area area = 0.0;
    Area istd = 0.0;
    Area istd_blank_corrected = 0.0;
    Area area_blank_corrected = 0.0;
    double response_ratio = 0.0;
    double concentration_ratio = 0.0;
    double concentration_vial = 0.0;
    double concentration_sample = 0.0;

    /// Final value rounded to the configured decimal places
    double concentration = 0.0;
};

/**
 * @brief Round half away from zero to a number of decimal places.
 */
double roundTo(double value, int decimal_places);

/**
 * @brief Blank-corrected, ISTD-normalised concentration with breakdown.
 *
 * The sample's own ISTD area is scaled by the blank's background-to-ISTD
 * ratio and subtracted from the fraction area; the remainder is
 * normalised by the ISTD area, inverted through the calibration and
 * scaled by ISTD concentration and dilution.
 *
 * @param sample_peaks Sample peaks in elution order
 * @param low_index First position summed (0-based)
 * @param high_index One past the last position summed
 * @param istd_target Internal standard identity window
 * @param blank_average Blank average of the batch
 * @param blank_fraction_area Blank background area of this fraction
 * @param calibration Calibration of this fraction
 * @param options ISTD concentration, dilution and rounding
 * @throws IstdError if the sample's internal standard is not found
 * @throws NumericDegeneracyError on division by zero or non-finite result
 */
QuantificationBreakdown quantify(const PeakList& sample_peaks,
                                 Index low_index, Index high_index,
                                 const IstdTarget& istd_target,
                                 const BlankAverage& blank_average,
                                 Area blank_fraction_area,
                                 const CalibrationModel& calibration,
                                 const QuantificationOptions& options);

/**
 * @brief Same computation with the sample's ISTD area already located.
 *
 * Lets a caller quantifying several fractions of one sample search for
 * the internal standard once.
 *
 * @throws NumericDegeneracyError on division by zero or non-finite result
 */
QuantificationBreakdown quantify(const PeakList& sample_peaks,
                                 Index low_index, Index high_index,
                                 Area sample_istd,
                                 const BlankAverage& blank_average,
                                 Area blank_fraction_area,
                                 const CalibrationModel& calibration,
                                 const QuantificationOptions& options);

/**
 * @brief Rounded concentration of a compound in a sample.
 *
 * Same computation as quantify(), returning only the reported value.
 */
double computeConcentration(const PeakList& sample_peaks,
                            Index low_index, Index high_index,
                            const IstdTarget& istd_target,
                            const BlankAverage& blank_average,
                            Area blank_fraction_area,
                            const CalibrationModel& calibration,
                            double istd_concentration,
                            double dilution_factor,
                            int decimal_places = 2);

} // namespace algorithms
} // namespace trh
