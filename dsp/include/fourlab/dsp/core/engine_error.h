// ==============================================================================
// Layer 0: Core Utility - Engine Error Reporting
// ==============================================================================
// Error codes and the result wrapper returned by every pipeline operation.
// No exceptions are thrown from DSP code: an operation either returns its
// complete value with EngineError::Success, or a default value with the
// failing error code and a human-readable message. Partial results are
// never returned.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Fourlab {
namespace DSP {

// =============================================================================
// EngineError
// =============================================================================

/// Engine error codes
enum class EngineError : uint8_t {
    Success,
    InvalidLength,     ///< Non-positive length, or not a power of two where required
    MismatchedLength,  ///< Signals of unequal length composed together
    InvalidParameter   ///< Non-finite or out-of-domain parameter
};

/// @brief Stable name of an error code (for logs and reports)
[[nodiscard]] constexpr const char* toString(EngineError error) noexcept {
    switch (error) {
        case EngineError::Success:          return "Success";
        case EngineError::InvalidLength:    return "InvalidLength";
        case EngineError::MismatchedLength: return "MismatchedLength";
        case EngineError::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

// =============================================================================
// EngineResult
// =============================================================================

/// @brief Value-or-error result of an engine operation
/// @tparam T Produced value (Signal, Spectrum, Complex, ...)
template <typename T>
struct EngineResult {
    T value{};                                ///< Valid only when ok()
    EngineError error = EngineError::Success;
    std::string errorMessage;                 ///< Human-readable error description

    [[nodiscard]] bool ok() const noexcept { return error == EngineError::Success; }

    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] static EngineResult success(T result) {
        EngineResult r;
        r.value = std::move(result);
        return r;
    }

    [[nodiscard]] static EngineResult failure(EngineError code, std::string message) {
        EngineResult r;
        r.error = code;
        r.errorMessage = std::move(message);
        return r;
    }
};

} // namespace DSP
} // namespace Fourlab
