// ==============================================================================
// Layer 0: Core Tests - Engine Error Reporting
// ==============================================================================
// Tests for: fourlab/dsp/core/engine_error.h, fourlab/dsp/core/signal_validation.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/signal_validation.h>

#include <cmath>
#include <limits>
#include <string>

using namespace Fourlab::DSP;

TEST_CASE("toString names every error code", "[dsp][core][engine_error]") {
    REQUIRE(std::string(toString(EngineError::Success)) == "Success");
    REQUIRE(std::string(toString(EngineError::InvalidLength)) == "InvalidLength");
    REQUIRE(std::string(toString(EngineError::MismatchedLength)) == "MismatchedLength");
    REQUIRE(std::string(toString(EngineError::InvalidParameter)) == "InvalidParameter");
}

TEST_CASE("EngineResult success and failure", "[dsp][core][engine_error]") {

    SECTION("success carries the value") {
        auto r = EngineResult<int>::success(42);
        REQUIRE(r.ok());
        REQUIRE(static_cast<bool>(r));
        REQUIRE(r.value == 42);
        REQUIRE(r.errorMessage.empty());
    }

    SECTION("failure carries code and message, default value") {
        auto r = EngineResult<Signal>::failure(EngineError::InvalidLength, "bad length");
        REQUIRE_FALSE(r.ok());
        REQUIRE_FALSE(static_cast<bool>(r));
        REQUIRE(r.error == EngineError::InvalidLength);
        REQUIRE(r.errorMessage == "bad length");
        REQUIRE(r.value.empty());
    }

    SECTION("fail() prefixes the operation name") {
        auto r = fail<Complex>(EngineError::InvalidParameter, "centroidOf", "scale must be finite");
        REQUIRE(r.error == EngineError::InvalidParameter);
        REQUIRE(r.errorMessage == "centroidOf: scale must be finite");
        REQUIRE(r.value.real == 0.0);
        REQUIRE(r.value.imag == 0.0);
    }
}

TEST_CASE("isPowerOfTwo", "[dsp][core][signal_validation]") {
    REQUIRE_FALSE(isPowerOfTwo(0));
    REQUIRE(isPowerOfTwo(1));
    REQUIRE(isPowerOfTwo(2));
    REQUIRE(isPowerOfTwo(512));
    REQUIRE(isPowerOfTwo(4096));
    REQUIRE_FALSE(isPowerOfTwo(3));
    REQUIRE_FALSE(isPowerOfTwo(100));
    REQUIRE_FALSE(isPowerOfTwo(513));
}

TEST_CASE("isValidSamplingRate", "[dsp][core][signal_validation]") {
    REQUIRE(isValidSamplingRate(1000.0));
    REQUIRE(isValidSamplingRate(1e-3));
    REQUIRE_FALSE(isValidSamplingRate(0.0));
    REQUIRE_FALSE(isValidSamplingRate(-44100.0));
    REQUIRE_FALSE(isValidSamplingRate(std::numeric_limits<double>::infinity()));
    REQUIRE_FALSE(isValidSamplingRate(std::numeric_limits<double>::quiet_NaN()));
}

TEST_CASE("allFinite rejects NaN and infinity in either component",
          "[dsp][core][signal_validation]") {
    Signal signal(4, Complex{1.0, -1.0});
    REQUIRE(allFinite(signal));

    signal[2].imag = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_FALSE(allFinite(signal));

    signal[2].imag = 0.0;
    signal[3].real = -std::numeric_limits<double>::infinity();
    REQUIRE_FALSE(allFinite(signal));
}
