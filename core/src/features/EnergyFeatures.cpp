#include "voicescope/features/EnergyFeatures.h"
#include "voicescope/Errors.h"

#include <cmath>
#include <string>

namespace voicescope {
namespace features {

double window_energy(const float* window, std::size_t n) {
    if (window == nullptr || n == 0) return 0.0;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(window[i]);
        acc += x * x;
    }
    return acc / static_cast<double>(n);
}

double rms(const std::vector<float>& samples) {
    return std::sqrt(window_energy(samples.data(), samples.size()));
}

std::size_t window_size_samples(int sampleRate, double seconds, AnalysisStage stage) {
    if (sampleRate <= 0 || !(seconds > 0.0)) {
        throw AnalysisError(stage, "window needs a positive sample rate and length");
    }
    const double n = std::floor(static_cast<double>(sampleRate) * seconds);
    if (n < 1.0) {
        throw AnalysisError(stage, "window of " + std::to_string(seconds) + " s is shorter than one sample");
    }
    return static_cast<std::size_t>(n);
}

}  // namespace features
}  // namespace voicescope
