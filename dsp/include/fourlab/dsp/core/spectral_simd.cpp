// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk magnitude/phase computation and complex summation using Google
// Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "fourlab/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion by design
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Fourlab {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// ComputePolarImpl: Complex[] -> mags[] + phases[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePolarImpl(const double* HWY_RESTRICT complexData, size_t numBins,
                      double* HWY_RESTRICT mags, double* HWY_RESTRICT phases) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        // Load interleaved [real0, imag0, real1, imag1, ...] into separate vectors
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);

        // Magnitude: sqrt(re^2 + im^2)
        const auto reSq = hn::Mul(re, re);
        const auto mag = hn::Sqrt(hn::MulAdd(im, im, reSq));

        // Phase: atan2(im, re)
        const auto phase = hn::Atan2(d, im, re);

        hn::StoreU(mag, d, mags + k);
        hn::StoreU(phase, d, phases + k);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        const double re = complexData[k * 2];
        const double im = complexData[k * 2 + 1];
        mags[k] = std::sqrt(re * re + im * im);
        phases[k] = std::atan2(im, re);
    }
}

// -----------------------------------------------------------------------------
// SumComplexImpl: sum of real parts and imaginary parts
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void SumComplexImpl(const double* HWY_RESTRICT complexData, size_t count,
                    double* HWY_RESTRICT sumReal, double* HWY_RESTRICT sumImag) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    auto accRe = hn::Zero(d);
    auto accIm = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexData + k * 2, re, im);
        accRe = hn::Add(accRe, re);
        accIm = hn::Add(accIm, im);
    }

    double re = hn::ReduceSum(d, accRe);
    double im = hn::ReduceSum(d, accIm);

    // Scalar tail
    for (; k < count; ++k) {
        re += complexData[k * 2];
        im += complexData[k * 2 + 1];
    }

    *sumReal = re;
    *sumImag = im;
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Fourlab

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "fourlab/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Fourlab {
namespace DSP {

HWY_EXPORT(ComputePolarImpl);
HWY_EXPORT(SumComplexImpl);

void computePolarBulk(const double* complexData, size_t numBins,
                      double* mags, double* phases) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePolarImpl)(complexData, numBins, mags, phases);
}

void sumComplexBulk(const double* complexData, size_t count,
                    double* sumReal, double* sumImag) noexcept {
    HWY_DYNAMIC_DISPATCH(SumComplexImpl)(complexData, count, sumReal, sumImag);
}

}  // namespace DSP
}  // namespace Fourlab

#endif  // HWY_ONCE
