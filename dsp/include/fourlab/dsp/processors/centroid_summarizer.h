// ==============================================================================
// Layer 2: DSP Processor - Centroid Summarizer
// ==============================================================================
// Reduces a projector trajectory to one point: the mean of its real and
// imaginary parts times a convention scale. With the default scale of 2
// (matching the single-sided amplitude convention) a sinusoid of amplitude A
// whose frequency equals the projection frequency lands at radius A.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>
#include <fourlab/dsp/core/spectral_simd.h>

#include <cmath>

namespace Fourlab {
namespace DSP {

/// Default centroid scale (single-sided amplitude convention)
inline constexpr double kDefaultCentroidScale = 2.0;

/// @brief Scaled mean of a trajectory
/// @param trajectory Output of projectAtFrequency (non-empty)
/// @param scale Finite multiplier applied to the mean
/// @return {mean(real) * scale, mean(imag) * scale},
///         InvalidLength for an empty trajectory,
///         InvalidParameter for a non-finite scale or sample
[[nodiscard]] inline EngineResult<Complex> centroidOf(const Signal& trajectory,
                                                      double scale = kDefaultCentroidScale) {
    if (trajectory.empty()) {
        return fail<Complex>(EngineError::InvalidLength, "centroidOf",
                             "trajectory is empty");
    }
    if (!std::isfinite(scale)) {
        return fail<Complex>(EngineError::InvalidParameter, "centroidOf",
                             "scale must be finite");
    }
    if (!allFinite(trajectory)) {
        return fail<Complex>(EngineError::InvalidParameter, "centroidOf",
                             "trajectory samples must be finite");
    }

    double sumReal = 0.0;
    double sumImag = 0.0;
    const auto interleaved = interleave(trajectory, trajectory.size());
    sumComplexBulk(interleaved.data(), trajectory.size(), &sumReal, &sumImag);

    const double count = static_cast<double>(trajectory.size());
    return EngineResult<Complex>::success({(sumReal / count) * scale,
                                           (sumImag / count) * scale});
}

} // namespace DSP
} // namespace Fourlab
