#pragma once

#include "../DeliveryTypes.h"
#include <vector>

namespace voicescope {
namespace features {

struct LoudnessMeasurement {
    double rms{0.0};
    double db{0.0};    // 20*log10(rms + eps), about -200 dBFS for digital silence
};

/**
 * LoudnessAnalyzer: whole-clip RMS level and the volume score
 */
class LoudnessAnalyzer {
public:
    LoudnessAnalyzer() = default;

    // @throws AnalysisError on an empty buffer or a non-finite level
    LoudnessMeasurement measure(const std::vector<float>& samples) const;

    /**
     * Volume bucket table (dBFS)
     *   <-40 -> 2, <-25 -> 3, <-10 -> 5, <-5 -> 4, else 3
     */
    double scoreVolume(double db) const;
};

}  // namespace features
}  // namespace voicescope
