#include "trh/method.hpp"

namespace trh {

void MethodConfig::validate() const {
    const auto& b = boundaries;
    if (mode == AnalysisMode::FULL_TRH &&
        !(b.c10_c16_start <= b.c10_c16_end && b.c10_c16_end <= b.c16_c34_end &&
          b.c16_c34_end <= b.c34_c40_end)) {
        throw std::invalid_argument("Fraction boundaries must ascend "
                                    "(C10 start <= C16 end <= C34 end <= C40 end)");
    }

    if (istd.rt_tolerance < 0.0 || istd.area_tolerance < 0.0) {
        throw std::invalid_argument("ISTD tolerances must be non-negative");
    }
    if (default_dilution <= 0.0) {
        throw std::invalid_argument("Default dilution factor must be positive");
    }
    for (const auto& [sample, factor] : sample_dilutions) {
        if (factor <= 0.0) {
            throw std::invalid_argument("Dilution factor for sample '" + sample +
                                        "' must be positive");
        }
    }
    if (decimal_places < 0) {
        throw std::invalid_argument("Decimal places must be non-negative");
    }

    for (Fraction f : fractionsFor(mode)) {
        auto it = calibrations.find(f);
        if (it == calibrations.end()) {
            throw std::invalid_argument("No calibration for fraction " + toString(f) +
                                        " required by " + toString(mode) + " mode");
        }
        if (it->second.slope == 0.0) {
            throw std::invalid_argument("Calibration slope for fraction " +
                                        toString(f) + " is zero");
        }
    }
}

} // namespace trh
