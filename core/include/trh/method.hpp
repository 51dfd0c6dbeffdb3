#pragma once

#include "types.hpp"
#include "algorithms/fraction_slicer.hpp"
#include "algorithms/istd_locator.hpp"
#include "algorithms/concentration.hpp"
#include <map>
#include <stdexcept>
#include <string>

namespace trh {

/**
 * @brief Quantification method for one analytical batch.
 *
 * Collects everything the engine needs from the laboratory method:
 * fraction cutoffs, the internal standard window and concentration,
 * per-fraction calibrations, dilution factors and rounding.
 */
struct MethodConfig {
    /// Method name, informational
    std::string name;

    /// Fractions to quantify
    AnalysisMode mode = AnalysisMode::FULL_TRH;

    /// Retention-time cutoffs (minutes)
    algorithms::FractionBoundaries boundaries;

    /// Internal standard identity window
    algorithms::IstdTarget istd;

    /// Internal standard concentration in the vial
    double istd_concentration = 1.0;

    /// Dilution factor for samples without an override
    double default_dilution = 1.0;

    /// Per-sample dilution factors keyed by sample name
    std::map<std::string, double> sample_dilutions;

    /// Calibration per fraction
    std::map<Fraction, algorithms::CalibrationModel> calibrations;

    /// Decimal places of reported concentrations
    int decimal_places = 2;

    /// Dilution factor of a sample (override or default)
    [[nodiscard]] double dilutionFor(const std::string& sample_name) const {
        auto it = sample_dilutions.find(sample_name);
        return it != sample_dilutions.end() ? it->second : default_dilution;
    }

    /**
     * @brief Calibration of a fraction.
     *
     * @throws std::out_of_range if the fraction has no calibration
     */
    [[nodiscard]] const algorithms::CalibrationModel& calibrationFor(Fraction f) const {
        auto it = calibrations.find(f);
        if (it == calibrations.end()) {
            throw std::out_of_range("No calibration for fraction " + toString(f));
        }
        return it->second;
    }

    /**
     * @brief Check the method for internal consistency.
     *
     * Boundaries used by the mode must ascend, tolerances must be
     * non-negative, dilution factors positive, and every fraction of the
     * mode needs a calibration with a non-zero slope.
     *
     * @throws std::invalid_argument describing the first problem found
     */
    void validate() const;

    /// Scaling options for a sample
    [[nodiscard]] algorithms::QuantificationOptions quantificationFor(
        const std::string& sample_name) const {
        algorithms::QuantificationOptions options;
        options.istd_concentration = istd_concentration;
        options.dilution_factor = dilutionFor(sample_name);
        options.decimal_places = decimal_places;
        return options;
    }
};

} // namespace trh
