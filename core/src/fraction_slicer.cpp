#include "trh/algorithms/fraction_slicer.hpp"
#include <algorithm>

namespace trh {
namespace algorithms {

namespace {

FractionSlice makeSlice(Fraction f, Index low, Index high) {
    FractionSlice slice;
    slice.fraction = f;
    slice.low = low;
    slice.high = high;
    return slice;
}

} // namespace

std::vector<FractionSlice> sliceFractions(const PeakList& peaks,
                                          AnalysisMode mode,
                                          const FractionBoundaries& boundaries) {
    std::vector<FractionSlice> slices;

    if (mode == AnalysisMode::C6_C10) {
        Index i_c10 = fractionEndIndex(peaks, boundaries.c6_c10_end);
        slices.push_back(makeSlice(Fraction::C6_C10, 0, i_c10));
        return slices;
    }

    Index i_c10 = fractionStartIndex(peaks, boundaries.c10_c16_start);
    Index i_c16 = fractionEndIndex(peaks, boundaries.c10_c16_end);
    Index i_c34 = fractionEndIndex(peaks, boundaries.c16_c34_end);
    Index i_c40 = fractionEndIndex(peaks, boundaries.c34_c40_end);

    // Overlapping integration windows can resolve a later boundary to an
    // earlier peak; such a fraction is empty and the sub-fractions still
    // tile the combined C10-C40 range.
    i_c16 = std::max(i_c16, i_c10);
    i_c34 = std::max(i_c34, i_c16);
    i_c40 = std::max(i_c40, i_c34);

    slices.reserve(4);
    slices.push_back(makeSlice(Fraction::C10_C16, i_c10, i_c16));
    slices.push_back(makeSlice(Fraction::C16_C34, i_c16, i_c34));
    slices.push_back(makeSlice(Fraction::C34_C40, i_c34, i_c40));
    slices.push_back(makeSlice(Fraction::C10_C40, i_c10, i_c40));
    return slices;
}

} // namespace algorithms
} // namespace trh
