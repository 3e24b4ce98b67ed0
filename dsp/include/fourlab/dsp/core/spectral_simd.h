// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude/phase computation using Google Highway for runtime SIMD
// dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These functions are the vectorized equivalents of per-bin sqrt/atan2.
// The spectrum derivation calls them once per transform instead of looping
// over Complex::magnitude() and Complex::phase().
// ==============================================================================

#pragma once

#include <cstddef>

namespace Fourlab {
namespace DSP {

/// @brief Bulk compute magnitude and phase from interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} double pairs
/// @param numBins Number of complex bins (NOT number of doubles)
/// @param mags Output magnitude array (must hold numBins doubles)
/// @param phases Output phase array in radians (must hold numBins doubles)
/// @note SIMD-accelerated with runtime ISA dispatch
void computePolarBulk(const double* complexData, size_t numBins,
                      double* mags, double* phases) noexcept;

/// @brief Bulk sum of interleaved Complex data
/// @param complexData Pointer to interleaved {real, imag} double pairs
/// @param count Number of complex values
/// @param sumReal Receives the sum of real parts
/// @param sumImag Receives the sum of imaginary parts
/// @note Lane-parallel accumulation; the summation order depends only on the
///       selected ISA target, so results are repeatable on a given machine.
void sumComplexBulk(const double* complexData, size_t count,
                    double* sumReal, double* sumImag) noexcept;

} // namespace DSP
} // namespace Fourlab
