#pragma once

#include "../DeliveryTypes.h"
#include <vector>

namespace voicescope {
namespace features {

/**
 * SpectralAnalyzer: magnitude spectrum of the clip prefix and band-energy clarity
 *
 * Input: normalized samples, of which at most frameSize leading samples are used
 * Output: SpectralFrame with floor(N/2) magnitude bins (FFTW r2c, N = min(frameSize, len))
 *
 * Clarity compares speech-band (300-3400 Hz) magnitude against the 0-300 Hz and
 * 3400-8000 Hz bands.
 */
class SpectralAnalyzer {
public:
    SpectralAnalyzer() = default;

    /**
     * Compute the magnitude spectrum of the leading samples
     * @param samples Normalized samples (longer inputs are truncated, not downsampled)
     * @param sampleRate Sample rate in Hz
     * @param frameSize Maximum number of samples fed to the transform
     * @return SpectralFrame; binWidthHz = sampleRate / (2 * (N/2))
     * @throws AnalysisError when fewer than two samples are available
     */
    SpectralFrame analyze(const std::vector<float>& samples,
                          int sampleRate,
                          int frameSize = contract::SPECTRAL_FRAME_SIZE) const;

    /**
     * Sum of magnitudes over bins floor(loHz/binWidth)..floor(hiHz/binWidth), clamped to valid bins
     */
    double bandEnergy(const SpectralFrame& frame, double loHz, double hiHz) const;

    // speech / (speech + noise + eps)
    double clarityRatio(const SpectralFrame& frame) const;

    /**
     * Clarity bucket table
     *   >0.8 -> 5, >0.6 -> 4, >0.4 -> 3, >0.2 -> 2, else 1
     */
    double scoreClarity(double clarityRatio) const;
};

}  // namespace features
}  // namespace voicescope
