// ==============================================================================
// Layer 2: DSP Processor - Spectrum Deriver
// ==============================================================================
// Converts N FFT coefficients into single-sided amplitude and phase spectra
// over bins [0, N/2):
//
//   amplitude[k] = 2 * |X[k]| / N
//   phase[k]     = atan2(Im X[k], Re X[k]) * 180/pi + phaseOffsetDegrees,
//                  wrapped into (-180, 180]
//
// Each point carries frequencyHz = k * samplingRate / N. Magnitudes and
// angles come from the SIMD bulk kernel in spectral_simd.h.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/axis_utils.h>
#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/math_constants.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>
#include <fourlab/dsp/core/spectral_simd.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Fourlab {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Phase offset used by the spectrum display: a sine at phase 0 reads 0 deg
inline constexpr double kDisplayPhaseOffsetDegrees = 90.0;

// =============================================================================
// Helpers
// =============================================================================

/// @brief Wrap a phase in degrees into (-180, 180]
/// @note Assumes the input lies within one turn of the target range, which
///       holds for atan2 output plus an offset in [-360, 360].
[[nodiscard]] constexpr double wrapPhaseDegrees(double degrees) noexcept {
    if (degrees > 180.0) {
        degrees -= 360.0;
    } else if (degrees <= -180.0) {
        degrees += 360.0;
    }
    return degrees;
}

namespace detail {

[[nodiscard]] inline EngineResult<Spectrum> validateCoefficients(const Signal& coeffs,
                                                                 size_t numPoints,
                                                                 double samplingRate,
                                                                 const char* where) {
    if (coeffs.empty() || coeffs.size() != numPoints) {
        return fail<Spectrum>(EngineError::InvalidLength, where,
                              "expected " + std::to_string(numPoints)
                              + " coefficients, got " + std::to_string(coeffs.size()));
    }
    if (!isValidSamplingRate(samplingRate)) {
        return fail<Spectrum>(EngineError::InvalidParameter, where,
                              "sampling rate must be finite and positive");
    }
    if (!allFinite(coeffs)) {
        return fail<Spectrum>(EngineError::InvalidParameter, where,
                              "coefficients must be finite");
    }
    return EngineResult<Spectrum>::success({});
}

/// Polar form of the lower half of the coefficients
struct PolarBins {
    std::vector<double> magnitudes;
    std::vector<double> phases;  // radians
};

[[nodiscard]] inline PolarBins lowerHalfPolar(const Signal& coeffs) {
    const size_t numBins = coeffs.size() / 2;
    PolarBins bins;
    bins.magnitudes.resize(numBins);
    bins.phases.resize(numBins);
    if (numBins > 0) {
        const auto interleaved = interleave(coeffs, numBins);
        computePolarBulk(interleaved.data(), numBins,
                         bins.magnitudes.data(), bins.phases.data());
    }
    return bins;
}

} // namespace detail

// =============================================================================
// Spectrum Derivation
// =============================================================================

/// @brief Single-sided amplitude spectrum
/// @param coeffs FFT coefficients, exactly numPoints of them
/// @param numPoints Transform length N
/// @param samplingRate Sampling rate in Hz (> 0)
/// @return N/2 points {frequencyHz, 2|X[k]|/N}
[[nodiscard]] inline EngineResult<Spectrum> deriveAmplitudeSpectrum(const Signal& coeffs,
                                                                    size_t numPoints,
                                                                    double samplingRate) {
    auto check = detail::validateCoefficients(coeffs, numPoints, samplingRate,
                                              "deriveAmplitudeSpectrum");
    if (!check) {
        return check;
    }

    const auto bins = detail::lowerHalfPolar(coeffs);
    const auto frequencies = frequencyAxis(numPoints, samplingRate);
    const double scale = 2.0 / static_cast<double>(numPoints);

    Spectrum spectrum(bins.magnitudes.size());
    for (size_t k = 0; k < spectrum.size(); ++k) {
        spectrum[k].frequencyHz = frequencies[k];
        spectrum[k].value = bins.magnitudes[k] * scale;
    }
    return EngineResult<Spectrum>::success(std::move(spectrum));
}

/// @brief Single-sided phase spectrum in degrees
/// @param coeffs FFT coefficients, exactly numPoints of them
/// @param numPoints Transform length N
/// @param samplingRate Sampling rate in Hz (> 0)
/// @param phaseOffsetDegrees Constant added before wrapping (finite)
/// @return N/2 points {frequencyHz, phase in (-180, 180]}
[[nodiscard]] inline EngineResult<Spectrum> derivePhaseSpectrum(const Signal& coeffs,
                                                                size_t numPoints,
                                                                double samplingRate,
                                                                double phaseOffsetDegrees = 0.0) {
    auto check = detail::validateCoefficients(coeffs, numPoints, samplingRate,
                                              "derivePhaseSpectrum");
    if (!check) {
        return check;
    }
    if (!std::isfinite(phaseOffsetDegrees)) {
        return fail<Spectrum>(EngineError::InvalidParameter, "derivePhaseSpectrum",
                              "phase offset must be finite");
    }

    const auto bins = detail::lowerHalfPolar(coeffs);
    const auto frequencies = frequencyAxis(numPoints, samplingRate);

    Spectrum spectrum(bins.phases.size());
    for (size_t k = 0; k < spectrum.size(); ++k) {
        spectrum[k].frequencyHz = frequencies[k];
        spectrum[k].value = wrapPhaseDegrees(bins.phases[k] * kRadiansToDegrees
                                             + phaseOffsetDegrees);
    }
    return EngineResult<Spectrum>::success(std::move(spectrum));
}

// =============================================================================
// Spectrum Queries
// =============================================================================

/// @brief Points with minHz <= frequencyHz <= maxHz, in input order
/// @return InvalidParameter for non-finite bounds or minHz > maxHz
[[nodiscard]] inline EngineResult<Spectrum> filterByFrequencyRange(const Spectrum& spectrum,
                                                                   double minHz,
                                                                   double maxHz) {
    if (!std::isfinite(minHz) || !std::isfinite(maxHz) || minHz > maxHz) {
        return fail<Spectrum>(EngineError::InvalidParameter, "filterByFrequencyRange",
                              "range bounds must be finite with min <= max");
    }

    Spectrum visible;
    for (const auto& point : spectrum) {
        if (point.frequencyHz >= minHz && point.frequencyHz <= maxHz) {
            visible.push_back(point);
        }
    }
    return EngineResult<Spectrum>::success(std::move(visible));
}

/// @brief Point with the largest value (first one on ties)
/// @return InvalidLength for an empty spectrum
[[nodiscard]] inline EngineResult<SpectrumPoint> findPeak(const Spectrum& spectrum) {
    if (spectrum.empty()) {
        return fail<SpectrumPoint>(EngineError::InvalidLength, "findPeak",
                                   "spectrum is empty");
    }

    size_t best = 0;
    for (size_t k = 1; k < spectrum.size(); ++k) {
        if (spectrum[k].value > spectrum[best].value) {
            best = k;
        }
    }
    return EngineResult<SpectrumPoint>::success(spectrum[best]);
}

} // namespace DSP
} // namespace Fourlab
