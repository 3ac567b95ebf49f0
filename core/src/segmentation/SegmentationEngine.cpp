#include "voicescope/segmentation/SegmentationEngine.h"
#include "voicescope/features/EnergyFeatures.h"
#include "voicescope/Errors.h"

#include <algorithm>
#include <cmath>

namespace voicescope {
namespace segmentation {

namespace {

enum class GateState {
    Quiet,
    Active
};

bool is_active_energy(double energy, const SegmentationParams& params) {
    return params.activeWhen == ActiveWhen::AboveThreshold ? (energy > params.threshold)
                                                           : (energy < params.threshold);
}

} // namespace

SegmentationParams SegmentationEngine::speechParams(const AnalysisConfig& config) {
    SegmentationParams p;
    p.windowSeconds = config.speechWindowSeconds;
    p.threshold = config.speechEnergyThreshold;
    p.activeWhen = ActiveWhen::AboveThreshold;
    p.minSegmentSeconds = 0.0;
    return p;
}

SegmentationParams SegmentationEngine::silenceParams(const AnalysisConfig& config) {
    SegmentationParams p;
    p.windowSeconds = config.silenceWindowSeconds;
    p.threshold = config.silenceEnergyThreshold;
    p.activeWhen = ActiveWhen::BelowThreshold;
    p.minSegmentSeconds = config.minPauseSeconds;
    return p;
}

SegmentationResult SegmentationEngine::detect(const SampleBuffer& buffer, const SegmentationParams& params) const {
    if (buffer.samples.empty()) {
        throw AnalysisError(AnalysisStage::Segmentation, "cannot segment an empty sample buffer");
    }
    if (!std::isfinite(params.threshold)) {
        throw AnalysisError(AnalysisStage::Segmentation, "segmentation threshold is not finite");
    }

    const std::size_t N = buffer.samples.size();
    const std::size_t W = features::window_size_samples(buffer.sampleRate, params.windowSeconds,
                                                        AnalysisStage::Segmentation);
    const double sr = static_cast<double>(buffer.sampleRate);

    SegmentationResult result;
    GateState state = GateState::Quiet;
    double segmentStart = 0.0;

    for (std::size_t i = 0; i < N; i += W) {
        const std::size_t len = std::min(W, N - i);
        const double energy = features::window_energy(buffer.samples.data() + i, len);
        if (!std::isfinite(energy)) {
            throw AnalysisError(AnalysisStage::Segmentation, "non-finite window energy");
        }
        const double t = static_cast<double>(i) / sr;
        const bool active = is_active_energy(energy, params);

        if (active && state == GateState::Quiet) {
            state = GateState::Active;
            segmentStart = t;
        } else if (!active && state == GateState::Active) {
            state = GateState::Quiet;
            // Closed at a later window start, so t > segmentStart.
            if (t - segmentStart >= params.minSegmentSeconds) {
                result.segments.push_back(TimeSegment{segmentStart, t});
            }
        }
    }

    if (state == GateState::Active) {
        result.trailingOpen = true;
        result.trailingStartSeconds = segmentStart;
    }
    return result;
}

SegmentationResult SegmentationEngine::detectSpeech(const SampleBuffer& buffer, const AnalysisConfig& config) const {
    return detect(buffer, speechParams(config));
}

SegmentationResult SegmentationEngine::detectSilence(const SampleBuffer& buffer, const AnalysisConfig& config) const {
    return detect(buffer, silenceParams(config));
}

}  // namespace segmentation
}  // namespace voicescope
