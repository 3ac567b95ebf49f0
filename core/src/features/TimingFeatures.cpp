#include "voicescope/features/TimingFeatures.h"
#include "voicescope/Errors.h"

#include <cmath>

namespace voicescope {
namespace features {

double TimingAnalyzer::speechRate(const SegmentationResult& speech) const {
    const double total = speech.totalSeconds();
    if (!(total > 0.0)) return 0.0;
    return static_cast<double>(speech.segments.size()) / total;
}

double TimingAnalyzer::silenceRatio(const SegmentationResult& silence, double durationSeconds) const {
    if (!(durationSeconds > 0.0) || !std::isfinite(durationSeconds)) {
        throw AnalysisError(AnalysisStage::Segmentation, "silence ratio needs a positive clip duration");
    }
    return silence.totalSeconds() / durationSeconds;
}

double TimingAnalyzer::scorePace(double speechRate) const {
    if (speechRate < 1.5) return 2.0; // too slow
    if (speechRate < 2.5) return 3.0;
    if (speechRate < 4.0) return 5.0;
    if (speechRate < 5.0) return 4.0;
    return 3.0;                       // too fast
}

double TimingAnalyzer::scorePauses(double silenceRatio) const {
    if (silenceRatio < 0.05) return 2.0; // too few pauses
    if (silenceRatio < 0.15) return 5.0;
    if (silenceRatio < 0.25) return 4.0;
    if (silenceRatio < 0.35) return 3.0;
    return 2.0;                          // excessive pauses
}

}  // namespace features
}  // namespace voicescope
