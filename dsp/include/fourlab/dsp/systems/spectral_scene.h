// ==============================================================================
// Layer 3: System Component - Spectral Scene
// ==============================================================================
// One complete pass of the synthesis/analysis pipeline:
//
//   WaveParams (x k) -> generateWave -> composeWaves -> composite
//   composite -> fft -> amplitude / phase spectra -> visible-range spectra
//   composite -> projectAtFrequency(selected) -> centroidOf
//
// analyzeScene() is a pure function of its SceneConfig. Nothing is cached
// between calls; callers that recompute on every parameter change own any
// memoization or debouncing.
// ==============================================================================

#pragma once

#include <fourlab/dsp/core/axis_utils.h>
#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/signal_validation.h>
#include <fourlab/dsp/primitives/fft.h>
#include <fourlab/dsp/primitives/wave_compositor.h>
#include <fourlab/dsp/primitives/wave_generator.h>
#include <fourlab/dsp/processors/centroid_summarizer.h>
#include <fourlab/dsp/processors/frequency_projector.h>
#include <fourlab/dsp/processors/spectrum_deriver.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Fourlab {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Presentation constants applied to derived values
struct SpectrumConventions {
    double phaseOffsetDegrees = kDisplayPhaseOffsetDegrees;  ///< Added to every phase bin
    double centroidScale = kDefaultCentroidScale;            ///< Multiplies the trajectory mean

    [[nodiscard]] bool isValid() const noexcept {
        return std::isfinite(phaseOffsetDegrees) && std::isfinite(centroidScale);
    }
};

/// @brief Full parameter set for one scene recompute
/// @note Defaults reproduce the three-wave demonstration scene.
struct SceneConfig {
    size_t numPoints = 512;          ///< Samples per signal (power of two)
    double samplingRate = 1000.0;    ///< Hz
    std::vector<WaveParams> waves = {
        {17.0, 5.0, 0.003, -120.0},
        {23.0, 5.0, 0.005, 77.0},
        {31.0, 5.0, 0.001, 0.0},
    };
    double selectedFrequency = 33.201;  ///< Projection frequency in Hz
    double rangeMinHz = 0.0;            ///< Visible spectrum lower bound
    double rangeMaxHz = 100.0;          ///< Visible spectrum upper bound
    SpectrumConventions conventions;

    /// @brief Structural validity (every stage re-checks its own inputs)
    [[nodiscard]] bool isValid() const noexcept {
        if (!isPowerOfTwo(numPoints) || !isValidSamplingRate(samplingRate)) {
            return false;
        }
        if (waves.empty()) {
            return false;
        }
        for (const auto& wave : waves) {
            if (!wave.isValid()) return false;
        }
        return std::isfinite(selectedFrequency) &&
               std::isfinite(rangeMinHz) &&
               std::isfinite(rangeMaxHz) &&
               rangeMinHz <= rangeMaxHz &&
               conventions.isValid();
    }
};

// =============================================================================
// SceneSnapshot
// =============================================================================

/// @brief Every numeric output of one scene recompute
struct SceneSnapshot {
    std::vector<Signal> waves;        ///< One generated signal per WaveParams
    Signal composite;                 ///< Sum of waves
    std::vector<double> timeAxis;     ///< Seconds per sample
    Signal coefficients;              ///< FFT of composite
    Spectrum amplitudeSpectrum;       ///< Bins [0, N/2)
    Spectrum phaseSpectrum;           ///< Bins [0, N/2), degrees
    Spectrum visibleAmplitude;        ///< amplitudeSpectrum within the range
    Spectrum visiblePhase;            ///< phaseSpectrum within the range
    Signal trajectory;                ///< Projection at selectedFrequency
    Complex centroid;                 ///< Scaled mean of trajectory
    double frequencyResolution = 0.0; ///< samplingRate / numPoints
};

// =============================================================================
// analyzeScene
// =============================================================================

/// @brief Run the whole pipeline for one configuration
/// @return Complete snapshot, or the error of the first failing stage
[[nodiscard]] inline EngineResult<SceneSnapshot> analyzeScene(const SceneConfig& config) {
    using Result = EngineResult<SceneSnapshot>;

    // Forward a failed stage's error unchanged
    auto forward = [](EngineError code, const std::string& message) {
        return Result::failure(code, message);
    };

    SceneSnapshot snapshot;
    snapshot.waves.reserve(config.waves.size());
    for (const auto& params : config.waves) {
        auto wave = generateWave(config.numPoints, params);
        if (!wave) return forward(wave.error, wave.errorMessage);
        snapshot.waves.push_back(std::move(wave.value));
    }

    auto composite = composeWaves(snapshot.waves);
    if (!composite) return forward(composite.error, composite.errorMessage);
    snapshot.composite = std::move(composite.value);

    auto coefficients = fft(snapshot.composite);
    if (!coefficients) return forward(coefficients.error, coefficients.errorMessage);
    snapshot.coefficients = std::move(coefficients.value);

    auto amplitude = deriveAmplitudeSpectrum(snapshot.coefficients, config.numPoints,
                                             config.samplingRate);
    if (!amplitude) return forward(amplitude.error, amplitude.errorMessage);
    snapshot.amplitudeSpectrum = std::move(amplitude.value);

    auto phase = derivePhaseSpectrum(snapshot.coefficients, config.numPoints,
                                     config.samplingRate,
                                     config.conventions.phaseOffsetDegrees);
    if (!phase) return forward(phase.error, phase.errorMessage);
    snapshot.phaseSpectrum = std::move(phase.value);

    auto visibleAmplitude = filterByFrequencyRange(snapshot.amplitudeSpectrum,
                                                   config.rangeMinHz, config.rangeMaxHz);
    if (!visibleAmplitude) return forward(visibleAmplitude.error, visibleAmplitude.errorMessage);
    snapshot.visibleAmplitude = std::move(visibleAmplitude.value);

    auto visiblePhase = filterByFrequencyRange(snapshot.phaseSpectrum,
                                               config.rangeMinHz, config.rangeMaxHz);
    if (!visiblePhase) return forward(visiblePhase.error, visiblePhase.errorMessage);
    snapshot.visiblePhase = std::move(visiblePhase.value);

    auto trajectory = projectAtFrequency(snapshot.composite, config.selectedFrequency,
                                         config.numPoints, config.samplingRate);
    if (!trajectory) return forward(trajectory.error, trajectory.errorMessage);
    snapshot.trajectory = std::move(trajectory.value);

    auto centroid = centroidOf(snapshot.trajectory, config.conventions.centroidScale);
    if (!centroid) return forward(centroid.error, centroid.errorMessage);
    snapshot.centroid = centroid.value;

    snapshot.timeAxis = timeAxis(config.numPoints, config.samplingRate);
    snapshot.frequencyResolution = frequencyResolution(config.numPoints, config.samplingRate);

    return Result::success(std::move(snapshot));
}

} // namespace DSP
} // namespace Fourlab
