// ==============================================================================
// Spectrum Report for Fourlab
// ==============================================================================
// Runs the default three-wave scene once and prints its numeric outputs as
// CSV sections on stdout: centroid, amplitude peaks, then the visible
// amplitude and phase spectra.
//
// Usage: spectrum_report [selectedFrequencyHz]
// ==============================================================================

#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/systems/spectral_scene.h>

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace Fourlab::DSP;

namespace {

bool parseFrequency(const char* text, double& frequency) {
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value)) {
        return false;
    }
    frequency = value;
    return true;
}

void printSpectrum(const std::string& title, const Spectrum& spectrum) {
    std::cout << "# " << title << "\n";
    std::cout << "frequency_hz,value\n";
    for (const auto& point : spectrum) {
        std::cout << point.frequencyHz << "," << point.value << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    SceneConfig config;

    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [selectedFrequencyHz]" << std::endl;
        return 2;
    }
    if (argc == 2 && !parseFrequency(argv[1], config.selectedFrequency)) {
        std::cerr << "Invalid frequency: " << argv[1] << std::endl;
        return 2;
    }

    const auto result = analyzeScene(config);
    if (!result) {
        std::cerr << "Analysis failed (" << toString(result.error) << "): "
                  << result.errorMessage << std::endl;
        return 1;
    }
    const SceneSnapshot& scene = result.value;

    std::cout << std::fixed << std::setprecision(6);

    std::cout << "# centroid\n";
    std::cout << "selected_hz,real,imag\n";
    std::cout << config.selectedFrequency << "," << scene.centroid.real << ","
              << scene.centroid.imag << "\n";

    // Strongest bin overall and within the visible range (absent if empty)
    Spectrum peaks;
    for (const Spectrum* spectrum : {&scene.amplitudeSpectrum, &scene.visibleAmplitude}) {
        const auto peak = findPeak(*spectrum);
        if (peak) {
            peaks.push_back(peak.value);
        }
    }
    printSpectrum("peaks", peaks);

    printSpectrum("amplitude", scene.visibleAmplitude);
    printSpectrum("phase", scene.visiblePhase);

    return 0;
}
