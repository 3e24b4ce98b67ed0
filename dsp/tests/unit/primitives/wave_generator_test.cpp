// ==============================================================================
// Layer 1: DSP Primitive Tests - Damped Sine Wave Generator
// ==============================================================================
// Tests for: fourlab/dsp/primitives/wave_generator.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fourlab/dsp/primitives/wave_generator.h>
#include <fourlab/dsp/core/math_constants.h>

#include <cmath>
#include <cstddef>
#include <limits>

using namespace Fourlab::DSP;
using Catch::Approx;

// ==============================================================================
// Shape
// ==============================================================================

TEST_CASE("generateWave produces numPoints real samples", "[dsp][primitives][wave_generator]") {
    const auto result = generateWave(512, WaveParams{17.0, 5.0, 0.003, -120.0});

    REQUIRE(result.ok());
    REQUIRE(result.value.size() == 512);
    for (const auto& sample : result.value) {
        REQUIRE(sample.imag == 0.0);
        REQUIRE(sample.isFinite());
    }
}

TEST_CASE("Undamped unit wave reproduces sin(2 pi f n / N)", "[dsp][primitives][wave_generator]") {
    const size_t numPoints = 512;

    for (double frequency : {1.0, 5.0, 10.0, 33.201, 255.0}) {
        const auto result = generateWave(numPoints, WaveParams{frequency, 1.0, 0.0, 0.0});
        REQUIRE(result.ok());

        for (size_t n = 0; n < numPoints; ++n) {
            const double expected = std::sin(kTwoPi * frequency * static_cast<double>(n)
                                             / static_cast<double>(numPoints));
            INFO("frequency " << frequency << " sample " << n);
            REQUIRE(result.value[n].real == Approx(expected).margin(1e-9));
        }
    }
}

TEST_CASE("Phase offset is applied in degrees", "[dsp][primitives][wave_generator]") {

    SECTION("90 degrees turns sine into cosine") {
        const auto result = generateWave(64, WaveParams{3.0, 1.0, 0.0, 90.0});
        REQUIRE(result.ok());
        for (size_t n = 0; n < 64; ++n) {
            const double expected = std::cos(kTwoPi * 3.0 * static_cast<double>(n) / 64.0);
            REQUIRE(result.value[n].real == Approx(expected).margin(1e-9));
        }
    }

    SECTION("first sample is amplitude * sin(phase)") {
        const auto result = generateWave(16, WaveParams{4.0, 5.0, 0.01, -120.0});
        REQUIRE(result.ok());
        REQUIRE(result.value[0].real == Approx(5.0 * std::sin(-120.0 * kPi / 180.0)).margin(1e-12));
    }
}

// ==============================================================================
// Decay Envelope
// ==============================================================================

TEST_CASE("Decay envelope follows exp(-decay * n)", "[dsp][primitives][wave_generator]") {
    // Zero cycles at 90 degrees keeps sin() at 1, exposing the envelope
    const double decay = 0.005;
    const auto result = generateWave(256, WaveParams{0.0, 2.0, decay, 90.0});
    REQUIRE(result.ok());

    for (size_t n = 0; n < 256; ++n) {
        REQUIRE(result.value[n].real
                == Approx(2.0 * std::exp(-decay * static_cast<double>(n))).margin(1e-12));
    }
}

TEST_CASE("Decay is keyed to the sample index, not to the window length",
          "[dsp][primitives][wave_generator]") {
    const WaveParams params{0.0, 1.0, 0.01, 90.0};
    const auto shortWave = generateWave(128, params);
    const auto longWave = generateWave(1024, params);
    REQUIRE(shortWave.ok());
    REQUIRE(longWave.ok());

    // Same envelope value at the same index regardless of numPoints
    for (size_t n = 0; n < 128; ++n) {
        REQUIRE(shortWave.value[n].real == longWave.value[n].real);
    }
    // So the shorter window ends far less decayed than the longer one
    REQUIRE(shortWave.value.back().real > longWave.value.back().real);
}

// ==============================================================================
// Determinism
// ==============================================================================

TEST_CASE("generateWave is deterministic", "[dsp][primitives][wave_generator]") {
    const WaveParams params{23.0, 5.0, 0.005, 77.0};
    const auto a = generateWave(512, params);
    const auto b = generateWave(512, params);
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    for (size_t n = 0; n < 512; ++n) {
        REQUIRE(a.value[n].real == b.value[n].real);
    }
}

// ==============================================================================
// Validation
// ==============================================================================

TEST_CASE("generateWave rejects invalid input", "[dsp][primitives][wave_generator]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("zero length") {
        const auto r = generateWave(0, WaveParams{});
        REQUIRE(r.error == EngineError::InvalidLength);
        REQUIRE(r.value.empty());
    }

    SECTION("non-finite frequency") {
        REQUIRE(generateWave(16, WaveParams{nan, 1.0, 0.0, 0.0}).error
                == EngineError::InvalidParameter);
    }

    SECTION("non-finite amplitude") {
        REQUIRE(generateWave(16, WaveParams{1.0, inf, 0.0, 0.0}).error
                == EngineError::InvalidParameter);
    }

    SECTION("negative decay") {
        REQUIRE(generateWave(16, WaveParams{1.0, 1.0, -0.001, 0.0}).error
                == EngineError::InvalidParameter);
    }

    SECTION("non-finite phase") {
        REQUIRE(generateWave(16, WaveParams{1.0, 1.0, 0.0, -inf}).error
                == EngineError::InvalidParameter);
    }
}

TEST_CASE("WaveParams::isValid", "[dsp][primitives][wave_generator]") {
    REQUIRE(WaveParams{}.isValid());
    REQUIRE(WaveParams{-3.0, -2.0, 0.0, 720.0}.isValid());
    REQUIRE_FALSE(WaveParams{1.0, 1.0, -1.0, 0.0}.isValid());
}
