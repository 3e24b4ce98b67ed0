// ==============================================================================
// Layer 0: Core Utility - Time and Frequency Axes
// ==============================================================================
// Axis values paired with pipeline outputs for display. Bin k of an N-point
// transform sits at k * samplingRate / N; sample n sits at n / samplingRate.
// ==============================================================================

#pragma once

#include <cstddef>
#include <vector>

namespace Fourlab {
namespace DSP {

/// @brief Frequency of bin k for an N-point transform
/// @return 0.0 if numPoints is 0 (division-by-zero guard)
[[nodiscard]] constexpr double binToFrequency(size_t bin, size_t numPoints,
                                              double samplingRate) noexcept {
    if (numPoints == 0) {
        return 0.0;
    }
    return static_cast<double>(bin) * samplingRate / static_cast<double>(numPoints);
}

/// @brief Spacing between adjacent bins (samplingRate / numPoints)
/// @return 0.0 if numPoints is 0
[[nodiscard]] constexpr double frequencyResolution(size_t numPoints,
                                                   double samplingRate) noexcept {
    return binToFrequency(1, numPoints, samplingRate);
}

/// @brief Sample times n / samplingRate for n in [0, numPoints)
/// @note Returns an empty axis when samplingRate is not positive
[[nodiscard]] inline std::vector<double> timeAxis(size_t numPoints, double samplingRate) {
    std::vector<double> axis;
    if (!(samplingRate > 0.0)) {
        return axis;
    }
    axis.resize(numPoints);
    for (size_t n = 0; n < numPoints; ++n) {
        axis[n] = static_cast<double>(n) / samplingRate;
    }
    return axis;
}

/// @brief Single-sided frequency axis, bins [0, numPoints/2)
[[nodiscard]] inline std::vector<double> frequencyAxis(size_t numPoints, double samplingRate) {
    std::vector<double> axis(numPoints / 2);
    for (size_t k = 0; k < axis.size(); ++k) {
        axis[k] = binToFrequency(k, numPoints, samplingRate);
    }
    return axis;
}

} // namespace DSP
} // namespace Fourlab
