#pragma once

#include "../DeliveryTypes.h"
#include <vector>

namespace voicescope {
namespace segmentation {

/**
 * SegmentationEngine: two-state (Quiet/Active) energy gate over fixed windows
 *
 * Speech and silence detection are the same machine with different params:
 *   - Speech: 20ms windows, Active while energy > 0.001, no minimum length
 *   - Silence: 10ms windows, Active while energy < 0.01, runs shorter than 0.2s dropped
 *
 * Windows do not overlap; the last one may be partial. An Active run still open
 * when the buffer ends is reported through trailingOpen and is not closed.
 */
class SegmentationEngine {
public:
    SegmentationEngine() = default;

    /**
     * Run the gate over a buffer
     * @param buffer Decoded samples
     * @param params Window length, threshold, direction, minimum segment length
     * @return Closed segments in time order plus the trailing-run state
     * @throws AnalysisError on an empty buffer or a window shorter than one sample
     */
    SegmentationResult detect(const SampleBuffer& buffer, const SegmentationParams& params) const;

    SegmentationResult detectSpeech(const SampleBuffer& buffer, const AnalysisConfig& config) const;
    SegmentationResult detectSilence(const SampleBuffer& buffer, const AnalysisConfig& config) const;

    static SegmentationParams speechParams(const AnalysisConfig& config);
    static SegmentationParams silenceParams(const AnalysisConfig& config);
};

}  // namespace segmentation
}  // namespace voicescope
