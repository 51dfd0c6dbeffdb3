#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <functional>
#include <limits>
#include <cmath>

namespace trh {

/// Retention time in minutes
using RetentionTime = double;

/// Integrated peak area
using Area = double;

/// Position or 1-based peak number within a peak list
using Index = std::size_t;

/// Hydrocarbon fraction (carbon-number range)
enum class Fraction : std::uint8_t {
    C6_C10 = 0,
    C10_C16,
    C16_C34,
    C34_C40,
    C10_C40  // Combined span of the three heavy sub-fractions
};

/// Analysis mode selecting the set of fractions to quantify
enum class AnalysisMode : std::uint8_t {
    C6_C10,     // Volatile fraction only
    FULL_TRH    // C10-C16, C16-C34, C34-C40 and C10-C40
};

/// Range template for min/max values
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::max();
    T max_value = std::numeric_limits<T>::lowest();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    /// Range centred on a value with symmetric tolerance
    static Range around(T center, T tolerance) {
        return Range(center - tolerance, center + tolerance);
    }

    bool contains(T value) const {
        return value >= min_value && value <= max_value;
    }

    void extend(T value) {
        if (value < min_value) min_value = value;
        if (value > max_value) max_value = value;
    }
};

using RTRange = Range<RetentionTime>;
using AreaRange = Range<Area>;

/**
 * @brief Progress callback signature.
 *
 * @param current Current progress (e.g., samples processed)
 * @param total Total expected items (-1 if unknown)
 * @return false to cancel, true to continue
 */
using ProgressCallback = std::function<bool(int current, int total)>;

/// Fractions quantified in a given analysis mode, in reporting order
inline std::vector<Fraction> fractionsFor(AnalysisMode mode) {
    if (mode == AnalysisMode::C6_C10) {
        return {Fraction::C6_C10};
    }
    return {Fraction::C10_C16, Fraction::C16_C34, Fraction::C34_C40,
            Fraction::C10_C40};
}

/// Convert fraction to its report label
inline std::string toString(Fraction f) {
    switch (f) {
        case Fraction::C6_C10: return "C6-C10";
        case Fraction::C10_C16: return "C10-C16";
        case Fraction::C16_C34: return "C16-C34";
        case Fraction::C34_C40: return "C34-C40";
        case Fraction::C10_C40: return "C10-C40";
    }
    return "unknown";
}

/// Convert analysis mode to string
inline std::string toString(AnalysisMode m) {
    switch (m) {
        case AnalysisMode::C6_C10: return "c6c10";
        case AnalysisMode::FULL_TRH: return "full";
    }
    return "unknown";
}

/// Parse a fraction label ("C10-C16"); returns false if unrecognised
inline bool parseFraction(const std::string& label, Fraction& out) {
    for (Fraction f : {Fraction::C6_C10, Fraction::C10_C16, Fraction::C16_C34,
                       Fraction::C34_C40, Fraction::C10_C40}) {
        if (toString(f) == label) {
            out = f;
            return true;
        }
    }
    return false;
}

} // namespace trh
