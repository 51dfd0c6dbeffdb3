/**
 * Example usage of the TRH C++ library.
 *
 * Compile with:
 *   g++ -std=c++17 -I../core/include cpp_example.cpp -L<build> -ltrh_core -lpugixml -lz -o example
 */

#include <iostream>
#include <vector>
#include <cmath>
#include <random>
#include <algorithm>

#include "trh/trh.hpp"

using namespace trh;

/**
 * Create a synthetic run: a ladder of alkane peaks plus the internal
 * standard at 8.45 min.
 */
PeakList createSyntheticRun(double alkane_scale, double istd_area, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<> jitter(0.0, 0.01);

    std::vector<std::pair<double, double>> apexes;
    for (double rt = 3.0; rt < 21.0; rt += 0.75) {
        apexes.emplace_back(rt + jitter(gen), alkane_scale * (1.0 + 0.1 * std::sin(rt)));
    }
    apexes.emplace_back(8.45, istd_area);
    std::sort(apexes.begin(), apexes.end());

    PeakList peaks;
    Index number = 1;
    for (const auto& [rt, area] : apexes) {
        peaks.add(number++, rt - 0.05, rt, rt + 0.05, area);
    }
    return peaks;
}

MethodConfig createMethod() {
    MethodConfig method;
    method.name = "Synthetic TRH";
    method.mode = AnalysisMode::FULL_TRH;
    method.boundaries.c10_c16_start = 5.2;
    method.boundaries.c10_c16_end = 9.8;
    method.boundaries.c16_c34_end = 17.4;
    method.boundaries.c34_c40_end = 20.1;
    method.istd = {8.45, 0.1, 250000.0, 75000.0};
    method.istd_concentration = 20.0;
    method.calibrations[Fraction::C10_C16] = {0.82, 0.01};
    method.calibrations[Fraction::C16_C34] = {0.91, 0.02};
    method.calibrations[Fraction::C34_C40] = {0.77, 0.00};
    method.calibrations[Fraction::C10_C40] = {0.85, 0.01};
    return method;
}

void exampleBoundaries(const PeakList& peaks, const MethodConfig& method) {
    std::cout << "========================================\n";
    std::cout << "Fraction Boundaries\n";
    std::cout << "========================================\n";

    auto start = algorithms::fractionStartIndex(peaks, method.boundaries.c10_c16_start);
    auto end = algorithms::fractionEndIndex(peaks, method.boundaries.c10_c16_end);
    std::cout << "C10-C16 starts after peak " << start << ", ends at peak " << end << "\n";

    for (const auto& slice : algorithms::sliceFractions(peaks, method.mode,
                                                        method.boundaries)) {
        std::cout << "  " << toString(slice.fraction) << ": peaks "
                  << slice.low + 1 << "-" << slice.high
                  << ", area " << slice.area(peaks) << "\n";
    }
}

void exampleInternalStandard(const PeakList& peaks, const MethodConfig& method) {
    std::cout << "\n========================================\n";
    std::cout << "Internal Standard\n";
    std::cout << "========================================\n";

    auto match = algorithms::findInternalStandard(peaks, method.istd);
    std::cout << "ISTD peak " << match.peak.index() << " at RT " << match.peak.rt()
              << ", area " << match.peak.area()
              << " (" << match.candidate_count << " candidate(s))\n";
}

void exampleBatch(const MethodConfig& method) {
    std::cout << "\n========================================\n";
    std::cout << "Batch Quantification\n";
    std::cout << "========================================\n";

    std::vector<SampleRun> blanks = {
        SampleRun("Blank 1", createSyntheticRun(400.0, 248000.0, 1)),
        SampleRun("Blank 2", createSyntheticRun(450.0, 252000.0, 2)),
    };
    std::vector<SampleRun> samples = {
        SampleRun("Soil 01", createSyntheticRun(52000.0, 245000.0, 3)),
        SampleRun("Soil 02", createSyntheticRun(8000.0, 260000.0, 4)),
        // No ISTD within tolerance: reported as a failure
        SampleRun("Soil 03", createSyntheticRun(9000.0, 40000.0, 5)),
    };

    BatchProcessor processor(method);
    BatchResult result = processor.run(blanks, samples);

    io::CsvWriter writer;
    std::cout << writer.toString(result.records,
                                 {"sample_name", "fraction", "concentration"});
    for (const auto& failure : result.failures) {
        std::cout << "Failed: " << failure.describe() << "\n";
    }
}

int main() {
    std::cout << "TRH C++ Library Examples\n\n";

    try {
        MethodConfig method = createMethod();
        PeakList peaks = createSyntheticRun(52000.0, 245000.0, 42);

        exampleBoundaries(peaks, method);
        exampleInternalStandard(peaks, method);
        exampleBatch(method);

        std::cout << "\n========================================\n";
        std::cout << "Examples completed successfully!\n";
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
