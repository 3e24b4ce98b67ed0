// ==============================================================================
// Layer 1: DSP Primitive - Wave Compositor
// ==============================================================================
// Sums equal-length signals sample by sample into one composite signal.
// Both real and imaginary parts are summed, so complex inputs compose too.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>

#include <cstddef>
#include <span>
#include <string>
#include <utility>

namespace Fourlab {
namespace DSP {

/// @brief Elementwise sum of one or more signals
/// @param signals Signals to sum; every length must equal the first one's
/// @return Composite signal,
///         InvalidLength if the list is empty or the first signal is empty,
///         MismatchedLength if any signal's length differs from the first,
///         InvalidParameter if any sample is NaN or infinite
[[nodiscard]] inline EngineResult<Signal> composeWaves(std::span<const Signal> signals) {
    if (signals.empty()) {
        return fail<Signal>(EngineError::InvalidLength, "composeWaves",
                            "at least one signal is required");
    }

    const size_t numPoints = signals.front().size();
    if (numPoints == 0) {
        return fail<Signal>(EngineError::InvalidLength, "composeWaves",
                            "signals must not be empty");
    }

    for (size_t j = 1; j < signals.size(); ++j) {
        if (signals[j].size() != numPoints) {
            return fail<Signal>(EngineError::MismatchedLength, "composeWaves",
                                "signal " + std::to_string(j) + " has "
                                + std::to_string(signals[j].size())
                                + " samples, expected " + std::to_string(numPoints));
        }
    }

    for (size_t j = 0; j < signals.size(); ++j) {
        if (!allFinite(signals[j])) {
            return fail<Signal>(EngineError::InvalidParameter, "composeWaves",
                                "signal " + std::to_string(j) + " has a non-finite sample");
        }
    }

    Signal composite = signals.front();
    for (size_t j = 1; j < signals.size(); ++j) {
        const Signal& wave = signals[j];
        for (size_t n = 0; n < numPoints; ++n) {
            composite[n] = composite[n] + wave[n];
        }
    }
    return EngineResult<Signal>::success(std::move(composite));
}

} // namespace DSP
} // namespace Fourlab
