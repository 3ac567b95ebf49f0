#include "voicescope/features/LoudnessFeatures.h"
#include "voicescope/features/EnergyFeatures.h"
#include "voicescope/Errors.h"

#include <cmath>

namespace voicescope {
namespace features {

LoudnessMeasurement LoudnessAnalyzer::measure(const std::vector<float>& samples) const {
    if (samples.empty()) {
        throw AnalysisError(AnalysisStage::Loudness, "cannot measure loudness of an empty buffer");
    }
    LoudnessMeasurement m;
    m.rms = rms(samples);
    m.db = 20.0 * std::log10(m.rms + contract::SCORE_EPS);
    if (!std::isfinite(m.db)) {
        throw AnalysisError(AnalysisStage::Loudness, "loudness is not finite");
    }
    return m;
}

double LoudnessAnalyzer::scoreVolume(double db) const {
    if (db < -40.0) return 2.0; // too quiet
    if (db < -25.0) return 3.0;
    if (db < -10.0) return 5.0;
    if (db < -5.0) return 4.0;
    return 3.0;                 // too loud
}

}  // namespace features
}  // namespace voicescope
