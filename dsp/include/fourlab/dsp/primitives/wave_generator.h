// ==============================================================================
// Layer 1: DSP Primitive - Damped Sine Wave Generator
// ==============================================================================
// Produces one damped, phase-shifted sinusoid spanning a fixed sample window:
//
//   angle[n] = (n / numPoints) * frequency * 2pi + phaseDegrees * pi/180
//   x[n]     = sin(angle[n]) * amplitude * exp(-decayCoefficient * n)
//
// frequency counts cycles across the whole window (not Hz). The decay
// envelope is keyed to the raw sample index n, so the same coefficient
// decays faster in wall-clock terms for shorter windows.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/math_constants.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>

#include <cmath>
#include <cstddef>
#include <utility>

namespace Fourlab {
namespace DSP {

// =============================================================================
// WaveParams
// =============================================================================

/// @brief Parameters of one damped sinusoid
struct WaveParams {
    double frequency = 1.0;         ///< Cycles spanned by the sample window
    double amplitude = 1.0;         ///< Peak amplitude at n = 0
    double decayCoefficient = 0.0;  ///< Per-sample exponential decay (>= 0)
    double phaseDegrees = 0.0;      ///< Initial phase in degrees

    /// @brief All fields finite and decay non-negative
    [[nodiscard]] bool isValid() const noexcept {
        return std::isfinite(frequency) &&
               std::isfinite(amplitude) &&
               std::isfinite(decayCoefficient) &&
               std::isfinite(phaseDegrees) &&
               decayCoefficient >= 0.0;
    }
};

// =============================================================================
// generateWave
// =============================================================================

/// @brief Generate one damped sinusoid as a real-valued Signal
/// @param numPoints Number of samples (> 0)
/// @param params Wave parameters
/// @return Signal of numPoints samples with zero imaginary parts,
///         InvalidLength for numPoints == 0,
///         InvalidParameter for non-finite fields or negative decay
[[nodiscard]] inline EngineResult<Signal> generateWave(size_t numPoints,
                                                       const WaveParams& params) {
    if (numPoints == 0) {
        return fail<Signal>(EngineError::InvalidLength, "generateWave",
                            "numPoints must be positive");
    }
    if (!params.isValid()) {
        return fail<Signal>(EngineError::InvalidParameter, "generateWave",
                            "wave parameters must be finite with decay >= 0");
    }

    const double phaseOffset = params.phaseDegrees * kDegreesToRadians;
    const double length = static_cast<double>(numPoints);

    Signal wave(numPoints);
    for (size_t n = 0; n < numPoints; ++n) {
        const double index = static_cast<double>(n);
        const double angle = (index / length) * params.frequency * kTwoPi + phaseOffset;
        wave[n].real = std::sin(angle) * params.amplitude
                     * std::exp(-params.decayCoefficient * index);
    }
    return EngineResult<Signal>::success(std::move(wave));
}

} // namespace DSP
} // namespace Fourlab
