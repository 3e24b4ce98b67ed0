// ==============================================================================
// Layer 0: Core Utility - Signal Types
// ==============================================================================
// Value types shared by every stage of the synthesis/analysis pipeline:
// Complex samples, Signals (sample sequences) and Spectrum points.
//
// Complex is a POD pair of doubles. The SIMD kernels in spectral_simd.h take
// interleaved {real, imag} double arrays; interleave() builds one from a
// Signal.
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <type_traits>
#include <vector>

namespace Fourlab {
namespace DSP {

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for spectral operations
/// @note POD type for performance - no virtual functions
struct Complex {
    double real = 0.0;  ///< Real component
    double imag = 0.0;  ///< Imaginary component

    // -------------------------------------------------------------------------
    // Arithmetic Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    // -------------------------------------------------------------------------
    // Polar Representation
    // -------------------------------------------------------------------------

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] double magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    /// @brief Get phase angle in radians, in (-pi, pi]
    [[nodiscard]] double phase() const noexcept {
        return std::atan2(imag, real);
    }

    /// @brief True when both components are finite
    [[nodiscard]] bool isFinite() const noexcept {
        return std::isfinite(real) && std::isfinite(imag);
    }
};

static_assert(std::is_standard_layout_v<Complex>);

// =============================================================================
// Sequences
// =============================================================================

/// Ordered sequence of complex samples. All signals taking part in one
/// composition share the same length.
using Signal = std::vector<Complex>;

/// @brief One point of a single-sided spectrum
/// @note value is an amplitude or a phase in degrees, depending on which
///       derivation produced the spectrum.
struct SpectrumPoint {
    double frequencyHz = 0.0;  ///< bin * samplingRate / numPoints
    double value = 0.0;        ///< Amplitude or phase (degrees)
};

using Spectrum = std::vector<SpectrumPoint>;

/// @brief Copy the first count samples as {re0, im0, re1, im1, ...}
/// @param count Number of samples to copy (clamped to signal.size())
[[nodiscard]] inline std::vector<double> interleave(const Signal& signal, size_t count) {
    if (count > signal.size()) count = signal.size();
    std::vector<double> data(count * 2);
    for (size_t i = 0; i < count; ++i) {
        data[2 * i] = signal[i].real;
        data[2 * i + 1] = signal[i].imag;
    }
    return data;
}

} // namespace DSP
} // namespace Fourlab
