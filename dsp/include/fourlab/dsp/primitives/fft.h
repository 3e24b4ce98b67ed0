// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Radix-2 Decimation-in-Time FFT over complex signals.
//
// The recurrence is the classic even/odd split:
//   X[k]       = E[k] + W_N^k * O[k]
//   X[k + N/2] = E[k] - W_N^k * O[k],   W_N^k = exp(-2pi i k / N)
// evaluated bottom-up over a single buffer: the input is copied once in
// bit-reversed order, then log2(N) butterfly stages run in place. No
// allocation happens per stage.
//
// Algorithm: Cooley-Tukey Radix-2 DIT
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/math_constants.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>

#include <bit>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace Fourlab {
namespace DSP {

namespace detail {

/// @brief Reverse the low numBits bits of index
[[nodiscard]] constexpr size_t reverseBits(size_t index, size_t numBits) noexcept {
    size_t reversed = 0;
    for (size_t b = 0; b < numBits; ++b) {
        reversed = (reversed << 1) | (index & 1);
        index >>= 1;
    }
    return reversed;
}

} // namespace detail

// =============================================================================
// fft
// =============================================================================

/// @brief Forward FFT: complex time-domain -> complex frequency-domain
/// @param signal N samples, N a power of two
/// @return N coefficients; bin k corresponds to k * samplingRate / N.
///         For real input bins [N/2, N) are the conjugate mirror of the
///         lower half. A single-sample signal is returned unchanged.
///         InvalidLength if N is 0 or not a power of two,
///         InvalidParameter if any sample is NaN or infinite.
[[nodiscard]] inline EngineResult<Signal> fft(const Signal& signal) {
    const size_t size = signal.size();

    if (!isPowerOfTwo(size)) {
        return fail<Signal>(EngineError::InvalidLength, "fft",
                            "length " + std::to_string(size) + " is not a power of two");
    }

    if (!allFinite(signal)) {
        return fail<Signal>(EngineError::InvalidParameter, "fft",
                            "input samples must be finite");
    }

    if (size == 1) {
        return EngineResult<Signal>::success(signal);
    }

    // Step 1: Copy input to work buffer with bit-reversal permutation
    const size_t numBits = static_cast<size_t>(std::countr_zero(size));
    Signal work(size);
    for (size_t i = 0; i < size; ++i) {
        work[detail::reverseBits(i, numBits)] = signal[i];
    }

    // Step 2: Butterfly stages, from 2-point DFTs up to the N-point DFT.
    // At each stage `span` is the length of the sub-transforms being merged.
    for (size_t half = 1; half < size; half <<= 1) {
        const size_t span = half << 1;
        const double step = -kTwoPi / static_cast<double>(span);

        for (size_t k = 0; k < half; ++k) {
            const double angle = step * static_cast<double>(k);
            const Complex twiddle{std::cos(angle), std::sin(angle)};

            for (size_t start = 0; start < size; start += span) {
                const size_t evenIdx = start + k;
                const size_t oddIdx = evenIdx + half;

                const Complex even = work[evenIdx];
                const Complex odd = twiddle * work[oddIdx];

                work[evenIdx] = even + odd;
                work[oddIdx] = even - odd;
            }
        }
    }

    return EngineResult<Signal>::success(std::move(work));
}

} // namespace DSP
} // namespace Fourlab
