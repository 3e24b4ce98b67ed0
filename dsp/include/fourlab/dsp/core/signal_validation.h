// ==============================================================================
// Layer 0: Core Utility - Input Validation
// ==============================================================================
// Entry checks shared by the pipeline stages, plus the failure constructor
// that logs (when FOURLAB_DSP_DEBUG is enabled) and builds an EngineResult.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/debug_log.h>
#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/signal_types.h>

#include <bit>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace Fourlab {
namespace DSP {

/// @brief True for 1, 2, 4, 8, ... (zero is not a power of two)
[[nodiscard]] constexpr bool isPowerOfTwo(size_t n) noexcept {
    return std::has_single_bit(n);
}

/// @brief Sampling rates must be finite and strictly positive
[[nodiscard]] inline bool isValidSamplingRate(double samplingRate) noexcept {
    return std::isfinite(samplingRate) && samplingRate > 0.0;
}

/// @brief True when every sample of the signal is finite
[[nodiscard]] inline bool allFinite(const Signal& signal) noexcept {
    for (const auto& sample : signal) {
        if (!sample.isFinite()) return false;
    }
    return true;
}

/// @brief Build a failed result and trace it
/// @param where Name of the failing operation
template <typename T>
[[nodiscard]] EngineResult<T> fail(EngineError code, const char* where, std::string message) {
    FOURLAB_DSP_LOG("%s: %s (%s)", where, message.c_str(), toString(code));
    return EngineResult<T>::failure(code, std::string(where) + ": " + std::move(message));
}

} // namespace DSP
} // namespace Fourlab
