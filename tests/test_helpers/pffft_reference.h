#pragma once
// ==============================================================================
// Reference FFT (pffft)
// ==============================================================================
// Independent transform used as an oracle for Fourlab's radix-2 FFT.
// pffft computes in single precision, so comparisons against it need
// float-level tolerances.
//
// Complex transforms require the size to be a multiple of 16.
// ==============================================================================

#include <fourlab/dsp/core/signal_types.h>

#include <cstddef>
#include <memory>

#include <pffft.h>

namespace TestHelpers {

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

/// Allocate a SIMD-aligned float buffer via pffft
inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

/// @brief Forward complex FFT via pffft, widened back to double
/// @return Empty signal if pffft rejects the size
inline Fourlab::DSP::Signal referenceFFT(const Fourlab::DSP::Signal& input) {
    const size_t size = input.size();
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup(
        pffft_new_setup(static_cast<int>(size), PFFFT_COMPLEX));
    if (!setup) {
        return {};
    }

    auto in = detail::makeAlignedBuffer(size * 2);
    auto out = detail::makeAlignedBuffer(size * 2);
    auto work = detail::makeAlignedBuffer(size * 2);

    for (size_t i = 0; i < size; ++i) {
        in.get()[i * 2] = static_cast<float>(input[i].real);
        in.get()[i * 2 + 1] = static_cast<float>(input[i].imag);
    }

    pffft_transform_ordered(setup.get(), in.get(), out.get(), work.get(), PFFFT_FORWARD);

    Fourlab::DSP::Signal result(size);
    for (size_t i = 0; i < size; ++i) {
        result[i].real = static_cast<double>(out.get()[i * 2]);
        result[i].imag = static_cast<double>(out.get()[i * 2 + 1]);
    }
    return result;
}

} // namespace TestHelpers
