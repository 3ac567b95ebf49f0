#include "voicescope/features/PitchFeatures.h"
#include "voicescope/features/EnergyFeatures.h"
#include "voicescope/Normalization.h"
#include "voicescope/Errors.h"

#include <algorithm>
#include <cmath>

namespace voicescope {
namespace features {

namespace {

struct LagRange {
    std::size_t minLag{0};
    std::size_t maxLag{0};
};

LagRange lag_range(int sampleRate, const AnalysisConfig& config) {
    if (sampleRate <= 0 || !(config.pitchMinHz > 0.0) || !(config.pitchMaxHz > config.pitchMinHz)) {
        throw AnalysisError(AnalysisStage::Pitch, "pitch search range is empty");
    }
    const double sr = static_cast<double>(sampleRate);
    LagRange r;
    r.minLag = static_cast<std::size_t>(std::max(1.0, std::floor(sr / config.pitchMaxHz)));
    r.maxLag = static_cast<std::size_t>(std::floor(sr / config.pitchMinHz));
    if (r.maxLag < r.minLag) {
        throw AnalysisError(AnalysisStage::Pitch, "sample rate too low for the pitch search range");
    }
    return r;
}

} // namespace

double PitchEstimator::estimateWindow(const float* window,
                                      std::size_t n,
                                      int sampleRate,
                                      const AnalysisConfig& config) const {
    if (window == nullptr || n == 0) return 0.0;
    const LagRange range = lag_range(sampleRate, config);

    // corr[lag - minLag]; lags with no overlapping terms stay at 0
    const std::size_t span = range.maxLag - range.minLag + 1;
    std::vector<double> corr(span, 0.0);
    double best = 0.0;

    for (std::size_t lag = range.minLag; lag <= range.maxLag; ++lag) {
        if (lag >= n) break;
        const std::size_t count = n - lag;
        double acc = 0.0;
        for (std::size_t i = 0; i < count; ++i) {
            acc += static_cast<double>(window[i]) * static_cast<double>(window[i + lag]);
        }
        const double c = acc / static_cast<double>(count);
        corr[lag - range.minLag] = c;
        best = std::max(best, c);
    }

    if (!(best > 0.0) || !std::isfinite(best)) return 0.0;

    const double accept = config.pitchPeakRatio * best;
    for (std::size_t j = 0; j < span; ++j) {
        const double c = corr[j];
        if (c <= 0.0 || c < accept) continue;
        const bool risingIn = (j == 0) || (corr[j - 1] <= c);
        const bool fallingOut = (j + 1 == span) || (corr[j + 1] < c);
        if (risingIn && fallingOut) {
            return static_cast<double>(sampleRate) / static_cast<double>(j + range.minLag);
        }
    }
    return 0.0;
}

PitchTrack PitchEstimator::track(const SampleBuffer& buffer, const AnalysisConfig& config) const {
    if (buffer.samples.empty()) {
        throw AnalysisError(AnalysisStage::Pitch, "cannot track pitch of an empty buffer");
    }
    const std::size_t N = buffer.samples.size();
    const std::size_t W = window_size_samples(buffer.sampleRate, config.pitchWindowSeconds, AnalysisStage::Pitch);

    PitchTrack out;
    for (std::size_t i = 0; i + W < N; i += W) {
        const double hz = estimateWindow(buffer.samples.data() + i, W, buffer.sampleRate, config);
        if (hz > 0.0) out.push_back(hz);
    }
    return out;
}

PitchStatistics PitchEstimator::statistics(const PitchTrack& track) const {
    PitchStatistics s;
    if (track.empty()) return s;
    s.meanHz = mean(track);
    s.stddevHz = population_stddev(track, s.meanHz);
    s.variationRatio = (s.meanHz > 0.0) ? (s.stddevHz / s.meanHz) : 0.0;
    return s;
}

double PitchEstimator::scoreTonalVariation(const PitchTrack& track) const {
    if (track.empty()) return 2.0; // monotone / no voiced signal

    const double ratio = statistics(track).variationRatio;
    if (ratio < 0.05) return 2.0;  // monotone
    if (ratio < 0.15) return 3.0;
    if (ratio < 0.25) return 5.0;
    if (ratio < 0.35) return 4.0;
    return 3.0;                    // excessive variation
}

}  // namespace features
}  // namespace voicescope
