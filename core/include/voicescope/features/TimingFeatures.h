#pragma once

#include "../DeliveryTypes.h"
#include <vector>

namespace voicescope {
namespace features {

/**
 * TimingAnalyzer: pace and pause scores from speech/silence segments
 *
 * Both bucket tables are deliberately non-monotonic: too fast and too slow,
 * too few and too many pauses, are all penalized relative to a sweet spot.
 */
class TimingAnalyzer {
public:
    TimingAnalyzer() = default;

    // segments per second of detected speech; 0 when there is no speech time
    double speechRate(const SegmentationResult& speech) const;

    // fraction of the clip covered by qualifying pauses
    double silenceRatio(const SegmentationResult& silence, double durationSeconds) const;

    /**
     * Pace bucket table
     *   <1.5 -> 2, <2.5 -> 3, <4.0 -> 5, <5.0 -> 4, else 3
     */
    double scorePace(double speechRate) const;

    /**
     * Pause bucket table
     *   <0.05 -> 2, <0.15 -> 5, <0.25 -> 4, <0.35 -> 3, else 2
     */
    double scorePauses(double silenceRatio) const;
};

}  // namespace features
}  // namespace voicescope
