#pragma once

#include "../DeliveryTypes.h"
#include <cstddef>
#include <vector>

namespace voicescope {
namespace features {

struct PitchStatistics {
    double meanHz{0.0};
    double stddevHz{0.0};
    double variationRatio{0.0};   // stddev / mean
};

/**
 * PitchEstimator: autocorrelation pitch track over non-overlapping windows
 *
 * For each window, corr(lag) = sum(w[i]*w[i+lag]) / count over lags
 * [floor(sr/maxHz), floor(sr/minHz)]. The chosen lag is the shortest local peak
 * with corr >= peakRatio * max(corr); windows with no positive correlation are
 * unvoiced and dropped.
 *
 * peakRatio = 1.0 takes the strongest lag outright. On clean tones that lag is
 * often a multiple of the period: a 2 s 440 Hz tone then tracks near 230.6 Hz
 * with tonal score 3, where the default 0.9 tracks 441 Hz with score 2.
 */
class PitchEstimator {
public:
    PitchEstimator() = default;

    /**
     * Estimate the fundamental of one window
     * @return Frequency in Hz, or 0 when the window is unvoiced
     */
    double estimateWindow(const float* window,
                          std::size_t n,
                          int sampleRate,
                          const AnalysisConfig& config) const;

    /**
     * Build the pitch track of a whole buffer
     * @throws AnalysisError on an empty buffer or an unusable lag range
     */
    PitchTrack track(const SampleBuffer& buffer, const AnalysisConfig& config) const;

    PitchStatistics statistics(const PitchTrack& track) const;

    /**
     * Tonal-variation score: 2 for an empty track, otherwise on stddev/mean
     *   <0.05 -> 2, <0.15 -> 3, <0.25 -> 5, <0.35 -> 4, else 3
     */
    double scoreTonalVariation(const PitchTrack& track) const;
};

}  // namespace features
}  // namespace voicescope
