// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for spectral calculations.
// All DSP components should import these constants instead of defining locally.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// The engine works in double precision throughout.
// ==============================================================================

#pragma once

#include <numbers>

namespace Fourlab {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr double kPi = std::numbers::pi;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr double kTwoPi = 2.0 * kPi;

// =============================================================================
// Angle Conversion
// =============================================================================

/// Multiply degrees by this to get radians
inline constexpr double kDegreesToRadians = kPi / 180.0;

/// Multiply radians by this to get degrees
inline constexpr double kRadiansToDegrees = 180.0 / kPi;

} // namespace DSP
} // namespace Fourlab
