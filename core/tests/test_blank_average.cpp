#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "trh/algorithms/blank_average.hpp"
#include <stdexcept>

using namespace trh;
using namespace trh::algorithms;
using Catch::Approx;

namespace {

// Seven peaks one minute apart; peak 4 is the internal standard
PeakList blankRun(double scale, double istd_area) {
    PeakList peaks;
    peaks.add(1, 1.0, 1.2, 1.4, 100.0);
    peaks.add(2, 2.0, 2.2, 2.4, 200.0);
    peaks.add(3, 3.0, 3.2, 3.4, 300.0 * scale);
    peaks.add(4, 4.0, 4.2, 4.4, istd_area);
    peaks.add(5, 5.0, 5.2, 5.4, 500.0 * scale);
    peaks.add(6, 6.0, 6.2, 6.4, 600.0 * scale);
    peaks.add(7, 7.0, 7.2, 7.4, 700.0 * scale);
    return peaks;
}

FractionBoundaries boundaries() {
    FractionBoundaries b;
    b.c6_c10_end = 3.3;
    b.c10_c16_start = 2.1;
    b.c10_c16_end = 3.3;
    b.c16_c34_end = 5.3;
    b.c34_c40_end = 6.5;
    return b;
}

const IstdTarget kIstd{4.2, 0.3, 4500.0, 1000.0};

} // namespace

TEST_CASE("Fraction slices for full TRH", "[fractions]") {
    PeakList peaks = blankRun(1.0, 5000.0);
    auto slices = sliceFractions(peaks, AnalysisMode::FULL_TRH, boundaries());

    REQUIRE(slices.size() == 4);

    SECTION("Slices in reporting order") {
        REQUIRE(slices[0].fraction == Fraction::C10_C16);
        REQUIRE(slices[1].fraction == Fraction::C16_C34);
        REQUIRE(slices[2].fraction == Fraction::C34_C40);
        REQUIRE(slices[3].fraction == Fraction::C10_C40);
    }

    SECTION("Start peak excluded, end peak included") {
        // C10 start resolves to peak 2, C16 end to peak 3
        REQUIRE(slices[0].low == 2);
        REQUIRE(slices[0].high == 3);
        REQUIRE(slices[0].area(peaks) == Approx(300.0));
    }

    SECTION("Sub-fractions tile the combined range") {
        REQUIRE(slices[1].area(peaks) == Approx(5000.0 + 500.0));
        REQUIRE(slices[2].area(peaks) == Approx(600.0 + 700.0));
        REQUIRE(slices[3].area(peaks) ==
                Approx(slices[0].area(peaks) + slices[1].area(peaks) +
                       slices[2].area(peaks)));
    }
}

TEST_CASE("Fraction slices for C6-C10", "[fractions]") {
    PeakList peaks = blankRun(1.0, 5000.0);
    auto slices = sliceFractions(peaks, AnalysisMode::C6_C10, boundaries());

    REQUIRE(slices.size() == 1);
    REQUIRE(slices[0].fraction == Fraction::C6_C10);
    REQUIRE(slices[0].low == 0);
    REQUIRE(slices[0].high == 3);
    REQUIRE(slices[0].area(peaks) == Approx(600.0));
}

TEST_CASE("Fraction slices with overlapping integration windows", "[fractions]") {
    // Peak 1 is integrated past the C16 cutoff, so the C16 end resolves
    // to a peak before the C10 start
    PeakList peaks;
    peaks.add(1, 0.0, 0.5, 5.0, 10.0);
    peaks.add(2, 1.0, 1.5, 2.0, 20.0);
    peaks.add(3, 2.5, 3.0, 3.5, 30.0);
    peaks.add(4, 4.0, 4.5, 6.0, 40.0);

    FractionBoundaries b;
    b.c10_c16_start = 1.2;
    b.c10_c16_end = 4.8;
    b.c16_c34_end = 5.5;
    b.c34_c40_end = 5.8;

    REQUIRE(fractionStartIndex(peaks, b.c10_c16_start) == 2);
    REQUIRE(fractionEndIndex(peaks, b.c10_c16_end) == 1);

    auto slices = sliceFractions(peaks, AnalysisMode::FULL_TRH, b);
    REQUIRE(slices.size() == 4);

    SECTION("Inverted fraction is empty") {
        REQUIRE(slices[0].low == 2);
        REQUIRE(slices[0].high == 2);
        REQUIRE(slices[0].area(peaks) == Approx(0.0));
    }

    SECTION("Later fractions start at the clamped boundary") {
        REQUIRE(slices[1].low == 2);
        REQUIRE(slices[1].high == 4);
        REQUIRE(slices[1].area(peaks) == Approx(70.0));
        REQUIRE(slices[2].low == 4);
        REQUIRE(slices[2].high == 4);
        REQUIRE(slices[3].low == 2);
        REQUIRE(slices[3].high == 4);
    }

    SECTION("Sub-fractions still tile the combined range") {
        REQUIRE(slices[3].area(peaks) ==
                Approx(slices[0].area(peaks) + slices[1].area(peaks) +
                       slices[2].area(peaks)));
        REQUIRE(slices[3].area(peaks) == Approx(70.0));
    }
}

TEST_CASE("Fraction slices with unresolvable end", "[fractions]") {
    PeakList peaks = blankRun(1.0, 5000.0);
    FractionBoundaries b = boundaries();
    b.c34_c40_end = 30.0;

    REQUIRE_THROWS_AS(sliceFractions(peaks, AnalysisMode::FULL_TRH, b),
                      BoundaryResolutionError);
}

TEST_CASE("Blank average in full TRH mode", "[blank]") {
    std::vector<PeakList> blanks = {blankRun(1.0, 5000.0), blankRun(2.0, 4000.0)};
    BlankAverage blank = buildBlankAverage(blanks, AnalysisMode::FULL_TRH,
                                           boundaries(), kIstd);

    SECTION("Per-fraction means") {
        REQUIRE(blank.fractionArea(Fraction::C10_C16) == Approx((300.0 + 600.0) / 2));
        REQUIRE(blank.fractionArea(Fraction::C16_C34) == Approx((5500.0 + 5000.0) / 2));
        REQUIRE(blank.fractionArea(Fraction::C34_C40) == Approx((1300.0 + 2600.0) / 2));
        REQUIRE(blank.fractionArea(Fraction::C10_C40) == Approx((7100.0 + 8200.0) / 2));
    }

    SECTION("Combined span equals the sum of its parts") {
        REQUIRE(blank.fractionArea(Fraction::C10_C40) ==
                Approx(blank.fractionArea(Fraction::C10_C16) +
                       blank.fractionArea(Fraction::C16_C34) +
                       blank.fractionArea(Fraction::C34_C40)));
    }

    SECTION("ISTD mean") {
        REQUIRE(blank.istd() == Approx(4500.0));
    }

    SECTION("Bookkeeping") {
        REQUIRE(blank.mode() == AnalysisMode::FULL_TRH);
        REQUIRE(blank.runCount() == 2);
        REQUIRE(blank.fractionAreas().size() == 4);
        REQUIRE_FALSE(blank.hasFraction(Fraction::C6_C10));
        REQUIRE_THROWS_AS(blank.fractionArea(Fraction::C6_C10), std::out_of_range);
    }
}

TEST_CASE("Blank average in C6-C10 mode", "[blank]") {
    std::vector<PeakList> blanks = {blankRun(1.0, 5000.0), blankRun(2.0, 4000.0)};
    BlankAverage blank = buildBlankAverage(blanks, AnalysisMode::C6_C10,
                                           boundaries(), kIstd);

    REQUIRE(blank.fractionArea(Fraction::C6_C10) == Approx((600.0 + 900.0) / 2));
    REQUIRE(blank.istd() == Approx(4500.0));
    REQUIRE(blank.fractionAreas().size() == 1);
    REQUIRE_THROWS_AS(blank.fractionArea(Fraction::C10_C16), std::out_of_range);
}

TEST_CASE("Blank average from sample runs", "[blank]") {
    std::vector<SampleRun> runs = {SampleRun("Blank 1", blankRun(1.0, 5000.0))};
    BlankAverage blank = buildBlankAverage(runs, AnalysisMode::C6_C10,
                                           boundaries(), kIstd);

    REQUIRE(blank.runCount() == 1);
    REQUIRE(blank.fractionArea(Fraction::C6_C10) == Approx(600.0));
    REQUIRE(blank.istd() == Approx(5000.0));
}

TEST_CASE("Blank run summaries", "[blank]") {
    BlankRunSummary a = summarizeBlankRun(blankRun(1.0, 5000.0),
                                          AnalysisMode::FULL_TRH, boundaries(), kIstd);
    BlankRunSummary b = summarizeBlankRun(blankRun(2.0, 4000.0),
                                          AnalysisMode::FULL_TRH, boundaries(), kIstd);

    SECTION("One run") {
        REQUIRE(a.fraction_areas.size() == 4);
        REQUIRE(a.fraction_areas.at(Fraction::C16_C34) == Approx(5500.0));
        REQUIRE(a.istd == Approx(5000.0));
    }

    SECTION("Averaging summaries matches building from peaks") {
        BlankAverage averaged = averageBlankRuns({a, b}, AnalysisMode::FULL_TRH);
        REQUIRE(averaged.runCount() == 2);
        REQUIRE(averaged.fractionArea(Fraction::C10_C40) == Approx(7650.0));
        REQUIRE(averaged.istd() == Approx(4500.0));
    }

    SECTION("No summaries") {
        REQUIRE_THROWS_AS(averageBlankRuns({}, AnalysisMode::FULL_TRH),
                          std::invalid_argument);
    }

    SECTION("Run without an ISTD") {
        REQUIRE_THROWS_AS(summarizeBlankRun(blankRun(1.0, 100.0),
                                            AnalysisMode::FULL_TRH, boundaries(),
                                            kIstd),
                          IstdError);
    }
}

TEST_CASE("Blank average failures", "[blank]") {
    SECTION("No blank runs") {
        REQUIRE_THROWS_AS(buildBlankAverage(std::vector<PeakList>{},
                                            AnalysisMode::FULL_TRH,
                                            boundaries(), kIstd),
                          std::invalid_argument);
    }

    SECTION("One run without an ISTD aborts the batch") {
        std::vector<PeakList> blanks = {blankRun(1.0, 5000.0), blankRun(1.0, 100.0)};
        REQUIRE_THROWS_AS(buildBlankAverage(blanks, AnalysisMode::FULL_TRH,
                                            boundaries(), kIstd),
                          IstdError);
    }

    SECTION("One run with an unresolvable boundary aborts the batch") {
        PeakList short_run;
        short_run.add(1, 1.0, 1.2, 1.4, 100.0);
        short_run.add(2, 4.0, 4.2, 4.4, 4500.0);
        std::vector<PeakList> blanks = {blankRun(1.0, 5000.0), short_run};
        REQUIRE_THROWS_AS(buildBlankAverage(blanks, AnalysisMode::FULL_TRH,
                                            boundaries(), kIstd),
                          BoundaryResolutionError);
    }
}
