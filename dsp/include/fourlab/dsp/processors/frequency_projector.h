// ==============================================================================
// Layer 2: DSP Processor - Frequency Projector
// ==============================================================================
// Rotates every sample of a signal by the phasor of an arbitrary target
// frequency, producing a full trajectory instead of one DFT coefficient:
//
//   angle[n] = 2pi * targetFrequency * n / samplingRate
//   out[n]   = data[n] * exp(i * angle[n])
//
// The target need not sit on an FFT bin. Averaging the trajectory
// (centroid_summarizer.h) collapses it to a single DFT-like coefficient.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/math_constants.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace Fourlab {
namespace DSP {

/// @brief Per-sample phasor rotation of a signal at targetFrequency
/// @param signal Composite signal (any length, no power-of-two requirement)
/// @param targetFrequency Frequency in Hz, any finite value
/// @param numPoints Number of samples to project; must equal signal.size()
/// @param samplingRate Sampling rate in Hz (> 0)
/// @return Trajectory of numPoints samples.
///         A targetFrequency of 0 returns the input unchanged.
///         InvalidParameter for non-finite samples, or when
///         targetFrequency / samplingRate is too large to represent.
[[nodiscard]] inline EngineResult<Signal> projectAtFrequency(const Signal& signal,
                                                             double targetFrequency,
                                                             size_t numPoints,
                                                             double samplingRate) {
    if (numPoints == 0 || numPoints != signal.size()) {
        return fail<Signal>(EngineError::InvalidLength, "projectAtFrequency",
                            "numPoints " + std::to_string(numPoints)
                            + " does not match signal length "
                            + std::to_string(signal.size()));
    }
    if (!std::isfinite(targetFrequency)) {
        return fail<Signal>(EngineError::InvalidParameter, "projectAtFrequency",
                            "target frequency must be finite");
    }
    if (!isValidSamplingRate(samplingRate)) {
        return fail<Signal>(EngineError::InvalidParameter, "projectAtFrequency",
                            "sampling rate must be finite and positive");
    }

    if (!allFinite(signal)) {
        return fail<Signal>(EngineError::InvalidParameter, "projectAtFrequency",
                            "signal samples must be finite");
    }

    const double radiansPerSample = kTwoPi * targetFrequency / samplingRate;
    const double lastAngle = radiansPerSample * static_cast<double>(numPoints - 1);
    if (!std::isfinite(radiansPerSample) || !std::isfinite(lastAngle)) {
        return fail<Signal>(EngineError::InvalidParameter, "projectAtFrequency",
                            "frequency / sampling rate ratio overflows");
    }

    Signal trajectory(numPoints);
    for (size_t n = 0; n < numPoints; ++n) {
        const double angle = radiansPerSample * static_cast<double>(n);
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        const Complex& x = signal[n];
        trajectory[n].real = x.real * c - x.imag * s;
        trajectory[n].imag = x.imag * c + x.real * s;
    }
    return EngineResult<Signal>::success(std::move(trajectory));
}

} // namespace DSP
} // namespace Fourlab
