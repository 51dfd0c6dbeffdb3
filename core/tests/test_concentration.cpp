#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "trh/algorithms/concentration.hpp"
#include <cmath>
#include <stdexcept>

using namespace trh;
using namespace trh::algorithms;
using Catch::Approx;

namespace {

PeakList samplePeaks(Area istd_area = 5000.0) {
    PeakList peaks;
    peaks.add(1, 0.0, 1.0, 2.0, 1000.0);
    peaks.add(2, 2.0, 3.0, 4.0, istd_area);
    peaks.add(3, 4.0, 5.0, 6.0, 2000.0);
    return peaks;
}

BlankAverage blankAverage(Area istd = 5000.0) {
    return BlankAverage(AnalysisMode::C6_C10, {{Fraction::C6_C10, 500.0}}, istd, 1);
}

const IstdTarget kIstd{3.0, 0.5, 5000.0, 500.0};

} // namespace

TEST_CASE("Calibration model", "[calibration]") {
    CalibrationModel model(2.0, 0.1);

    SECTION("Forward response") {
        REQUIRE(model.response(0.5) == Approx(1.1));
    }

    SECTION("Inversion") {
        REQUIRE(model.concentrationRatio(1.1) == Approx(0.5));
        REQUIRE(model.concentrationRatio(model.response(0.7)) == Approx(0.7));
    }

    SECTION("Identity by default") {
        CalibrationModel identity;
        REQUIRE(identity.concentrationRatio(3.25) == Approx(3.25));
    }

    SECTION("Zero slope") {
        CalibrationModel flat(0.0, 0.1);
        REQUIRE_THROWS_AS(flat.concentrationRatio(1.0), NumericDegeneracyError);
    }
}

TEST_CASE("Rounding", "[concentration]") {
    REQUIRE(roundTo(1.23456, 2) == Approx(1.23));
    REQUIRE(roundTo(1.235, 1) == Approx(1.2));
    REQUIRE(roundTo(2.5, 0) == Approx(3.0));
    REQUIRE(roundTo(-2.5, 0) == Approx(-3.0));
    REQUIRE(roundTo(15.0, 4) == Approx(15.0));

    SECTION("Scaling past the double range leaves the value unchanged") {
        REQUIRE(std::isfinite(roundTo(1e300, 15)));
        REQUIRE(roundTo(1e300, 15) == 1e300);
        REQUIRE(roundTo(-1e300, 15) == -1e300);
    }
}

TEST_CASE("Concentration of a sample", "[concentration]") {
    PeakList peaks = samplePeaks();
    CalibrationModel calibration(2.0, 0.1);

    SECTION("Reported value") {
        // area 6000, blank-corrected ISTD 500, response 1.1, ratio 0.5
        double c = computeConcentration(peaks, 0, 2, kIstd, blankAverage(), 500.0,
                                        calibration, 10.0, 3.0);
        REQUIRE(c == Approx(15.0));
    }

    SECTION("Breakdown") {
        QuantificationOptions options;
        options.istd_concentration = 10.0;
        options.dilution_factor = 3.0;

        QuantificationBreakdown q = quantify(peaks, 0, 2, kIstd, blankAverage(),
                                             500.0, calibration, options);
        REQUIRE(q.area == Approx(6000.0));
        REQUIRE(q.istd == Approx(5000.0));
        REQUIRE(q.istd_blank_corrected == Approx(500.0));
        REQUIRE(q.area_blank_corrected == Approx(5500.0));
        REQUIRE(q.response_ratio == Approx(1.1));
        REQUIRE(q.concentration_ratio == Approx(0.5));
        REQUIRE(q.concentration_vial == Approx(5.0));
        REQUIRE(q.concentration_sample == Approx(15.0));
        REQUIRE(q.concentration == Approx(15.0));
    }

    SECTION("Without blank background") {
        // response 1.2, ratio 0.55, vial 5.5
        double c = computeConcentration(peaks, 0, 2, kIstd, blankAverage(), 0.0,
                                        calibration, 10.0, 1.0);
        REQUIRE(c == Approx(5.5));
    }

    SECTION("Rounded to requested places") {
        CalibrationModel third(3.0, 0.0);
        // response 1.1, ratio 0.36666..., vial 3.6666...
        REQUIRE(computeConcentration(peaks, 0, 2, kIstd, blankAverage(), 500.0,
                                     third, 10.0, 1.0, 2) == Approx(3.67));
        REQUIRE(computeConcentration(peaks, 0, 2, kIstd, blankAverage(), 500.0,
                                     third, 10.0, 1.0, 0) == Approx(4.0));
    }

    SECTION("Located ISTD area gives the same result") {
        QuantificationOptions options;
        options.istd_concentration = 10.0;
        options.dilution_factor = 3.0;

        QuantificationBreakdown q = quantify(peaks, 0, 2, Area(5000.0),
                                             blankAverage(), 500.0, calibration,
                                             options);
        REQUIRE(q.istd == Approx(5000.0));
        REQUIRE(q.concentration == Approx(15.0));
    }

    SECTION("Background larger than the fraction area") {
        double c = computeConcentration(peaks, 0, 1, kIstd, blankAverage(), 500.0,
                                        CalibrationModel(), 1.0, 1.0);
        // (1000 - 500) / 5000
        REQUIRE(c == Approx(0.1));

        double negative = computeConcentration(peaks, 0, 0, kIstd, blankAverage(),
                                               500.0, CalibrationModel(), 1.0, 1.0);
        REQUIRE(negative == Approx(-0.1));
    }
}

TEST_CASE("Concentration failures", "[concentration]") {
    CalibrationModel calibration(2.0, 0.1);

    SECTION("Sample ISTD missing") {
        PeakList peaks = samplePeaks(100.0);
        REQUIRE_THROWS_AS(computeConcentration(peaks, 0, 2, kIstd, blankAverage(),
                                               500.0, calibration, 10.0, 3.0),
                          IstdError);
    }

    SECTION("Sample ISTD area is zero") {
        PeakList peaks = samplePeaks(0.0);
        IstdTarget zero_target{3.0, 0.5, 0.0, 10.0};
        REQUIRE_THROWS_AS(computeConcentration(peaks, 0, 2, zero_target,
                                               blankAverage(), 500.0, calibration,
                                               10.0, 3.0),
                          NumericDegeneracyError);
    }

    SECTION("Blank ISTD area is zero") {
        REQUIRE_THROWS_AS(computeConcentration(samplePeaks(), 0, 2, kIstd,
                                               blankAverage(0.0), 500.0,
                                               calibration, 10.0, 3.0),
                          NumericDegeneracyError);
    }

    SECTION("Zero calibration slope") {
        REQUIRE_THROWS_AS(computeConcentration(samplePeaks(), 0, 2, kIstd,
                                               blankAverage(), 500.0,
                                               CalibrationModel(0.0, 0.1),
                                               10.0, 3.0),
                          NumericDegeneracyError);
    }

    SECTION("Huge concentration with many decimal places stays finite") {
        PeakList huge;
        huge.add(1, 0.0, 1.0, 2.0, 1e306);
        huge.add(2, 2.0, 3.0, 4.0, 1.0);
        IstdTarget unit{3.0, 0.5, 1.0, 0.5};

        double c = computeConcentration(huge, 0, 1, unit, blankAverage(), 0.0,
                                        CalibrationModel(), 1.0, 1.0, 15);
        REQUIRE(std::isfinite(c));
        REQUIRE(c == Approx(1e306));
    }

    SECTION("Concentration overflowing the double range") {
        PeakList huge;
        huge.add(1, 0.0, 1.0, 2.0, 1e306);
        huge.add(2, 2.0, 3.0, 4.0, 1.0);
        IstdTarget unit{3.0, 0.5, 1.0, 0.5};

        REQUIRE_THROWS_AS(computeConcentration(huge, 0, 1, unit, blankAverage(),
                                               0.0, CalibrationModel(), 1e10,
                                               1.0, 15),
                          NumericDegeneracyError);
    }

    SECTION("Index range beyond the list") {
        REQUIRE_THROWS_AS(computeConcentration(samplePeaks(), 0, 4, kIstd,
                                               blankAverage(), 500.0, calibration,
                                               10.0, 3.0),
                          std::invalid_argument);
    }
}
