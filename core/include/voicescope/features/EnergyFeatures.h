#pragma once

#include "../DeliveryTypes.h"

#include <cstddef>
#include <vector>

namespace voicescope {
namespace features {

// Mean of squared amplitudes over [window, window + n). 0 for an empty window.
double window_energy(const float* window, std::size_t n);

// Root-mean-square amplitude of the whole sequence. 0 for an empty sequence.
double rms(const std::vector<float>& samples);

/**
 * Number of samples in a window of the given length: floor(sampleRate * seconds)
 * @throws AnalysisError if the result is zero or the inputs are not positive
 */
std::size_t window_size_samples(int sampleRate, double seconds, AnalysisStage stage);

}  // namespace features
}  // namespace voicescope
