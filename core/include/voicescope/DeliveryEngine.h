#pragma once

#include "voicescope/Diagnostics.h"
#include "voicescope/MetricEngine.h"
#include "voicescope/SQLiteStore.h"
#include "voicescope/SampleDecoder.h"
#include "voicescope/features/LoudnessFeatures.h"
#include "voicescope/features/PitchFeatures.h"
#include "voicescope/features/SpectralFeatures.h"
#include "voicescope/features/TimingFeatures.h"
#include "voicescope/segmentation/SegmentationEngine.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace voicescope {

/**
 * DeliveryEngine: Complete delivery analysis pipeline
 *
 * Orchestrates: Decode -> Segmentation / Spectrum / Loudness / Pitch -> Scores -> Diagnostics -> Storage
 *
 * Analysis never throws: any decode or numeric failure yields the fixed fallback
 * record, with the cause carried on DeliveryReport::failure and logged.
 */
class DeliveryEngine {
  public:
    /**
     * @param config Analysis parameters, validated here
     * @throws std::invalid_argument if config is unusable
     */
    explicit DeliveryEngine(AnalysisConfig config = {});

    /**
     * Engine with an attached evaluation history database
     * @throws std::invalid_argument if config is unusable
     * @throws std::runtime_error if the database cannot be opened
     */
    DeliveryEngine(AnalysisConfig config, const std::string& databasePath);

    DeliveryReport analyze(const std::vector<std::uint8_t>& rawBytes) const;
    DeliveryReport analyze(const DeliveryAnalysisRequest& request) const;

    /**
     * Analyze and persist the report when a store is attached
     * @throws std::runtime_error on storage failure (analysis failures never throw)
     */
    DeliveryReport analyze_and_store(const DeliveryAnalysisRequest& request);

    const AnalysisConfig& config() const { return config_; }

    // nullptr when constructed without a database
    SQLiteStore* store() { return store_.get(); }

  private:
    DeliveryReport analyze_bytes(const std::vector<std::uint8_t>& rawBytes,
                                 const std::string& clipId,
                                 const std::string& clipName) const;

    // Throws DecodeError / AnalysisError; stage is updated as the pipeline advances.
    void run_pipeline(const SampleBuffer& buffer, DeliveryReport& report, AnalysisStage& stage) const;

    AnalysisConfig config_;

    SampleDecoder decoder_;
    segmentation::SegmentationEngine segmentationEngine_;
    features::TimingAnalyzer timingAnalyzer_;
    features::SpectralAnalyzer spectralAnalyzer_;
    features::LoudnessAnalyzer loudnessAnalyzer_;
    features::PitchEstimator pitchEstimator_;

    MetricEngine metricEngine_;
    DiagnosticsEngine diagnostics_;

    std::unique_ptr<SQLiteStore> store_;
};

/**
 * Single-call boundary for the upload handler: raw PCM bytes in, scores out.
 * Never throws; any failure (including an invalid config) returns the fallback record.
 */
DeliveryMetrics compute_delivery_metrics(const std::vector<std::uint8_t>& rawAudioBytes,
                                         const AnalysisConfig& config = {});

}  // namespace voicescope
