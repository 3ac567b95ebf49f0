#include "voicescope/DeliveryEngine.h"
#include "voicescope/Errors.h"
#include "voicescope/Log.h"
#include "voicescope/Utility.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace voicescope {

namespace {

constexpr const char* kComponent = "Delivery Engine";

const AnalysisConfig& validated(const AnalysisConfig& config) {
    config.validate();
    return config;
}

void require_finite(double value, AnalysisStage stage, const char* what) {
    if (!std::isfinite(value)) {
        throw AnalysisError(stage, std::string(what) + " is not finite");
    }
}

} // namespace

DeliveryEngine::DeliveryEngine(AnalysisConfig config)
    : config_(validated(config)), decoder_(config_.sampleRate) {}

DeliveryEngine::DeliveryEngine(AnalysisConfig config, const std::string& databasePath)
    : config_(validated(config)),
      decoder_(config_.sampleRate),
      store_(std::make_unique<SQLiteStore>(databasePath)) {
    store_->initialize();
}

void DeliveryEngine::run_pipeline(const SampleBuffer& buffer, DeliveryReport& report, AnalysisStage& stage) const {
    DeliveryMeasurements& m = report.measurements;
    PrimaryScores scores;

    // Step 1: Speech segments -> pace
    stage = AnalysisStage::Segmentation;
    const SegmentationResult speech = segmentationEngine_.detectSpeech(buffer, config_);
    m.speechSegmentCount = static_cast<int>(speech.segments.size());
    m.totalSpeechSeconds = speech.totalSeconds();
    m.speechRate = timingAnalyzer_.speechRate(speech);
    m.trailingSpeechDropped = speech.trailingOpen;
    m.trailingSpeechStartSeconds = speech.trailingStartSeconds;
    require_finite(m.speechRate, stage, "speech rate");
    scores.pace = timingAnalyzer_.scorePace(m.speechRate);

    // Step 2: Silence segments -> pause usage
    const SegmentationResult silence = segmentationEngine_.detectSilence(buffer, config_);
    m.totalSilenceSeconds = silence.totalSeconds();
    m.silenceRatio = timingAnalyzer_.silenceRatio(silence, buffer.durationSeconds());
    require_finite(m.silenceRatio, stage, "silence ratio");
    scores.pauseDuration = timingAnalyzer_.scorePauses(m.silenceRatio);

    // Step 3: Loudness (whole clip, not the spectral frame)
    stage = AnalysisStage::Loudness;
    const auto loudness = loudnessAnalyzer_.measure(buffer.samples);
    m.rms = loudness.rms;
    m.loudnessDb = loudness.db;
    scores.volume = loudnessAnalyzer_.scoreVolume(loudness.db);

    // Step 4: Spectrum of the leading frame -> clarity
    stage = AnalysisStage::Spectral;
    const SpectralFrame frame = spectralAnalyzer_.analyze(buffer.samples, buffer.sampleRate, config_.spectralFrameSize);
    m.spectralSamplesUsed = static_cast<int>(std::min<std::size_t>(buffer.samples.size(),
                                                                    static_cast<std::size_t>(config_.spectralFrameSize)));
    m.clarityRatio = spectralAnalyzer_.clarityRatio(frame);
    scores.clarity = spectralAnalyzer_.scoreClarity(m.clarityRatio);

    // Step 5: Pitch track -> tonal variation
    stage = AnalysisStage::Pitch;
    const PitchTrack track = pitchEstimator_.track(buffer, config_);
    const auto stats = pitchEstimator_.statistics(track);
    m.voicedWindowCount = static_cast<int>(track.size());
    m.pitchMeanHz = stats.meanHz;
    m.pitchVariationRatio = stats.variationRatio;
    require_finite(m.pitchVariationRatio, stage, "pitch variation");
    scores.tonalVariation = pitchEstimator_.scoreTonalVariation(track);

    // Step 6: Derived scores
    stage = AnalysisStage::Scoring;
    report.metrics = metricEngine_.derive(scores);
    report.speechSegments = speech.segments;
    report.silenceSegments = silence.segments;
}

DeliveryReport DeliveryEngine::analyze(const std::vector<std::uint8_t>& rawBytes) const {
    return analyze_bytes(rawBytes, std::string(), std::string());
}

DeliveryReport DeliveryEngine::analyze(const DeliveryAnalysisRequest& request) const {
    return analyze_bytes(request.rawBytes, request.clipId, request.clipName);
}

DeliveryReport DeliveryEngine::analyze_bytes(const std::vector<std::uint8_t>& rawBytes,
                                             const std::string& clipId,
                                             const std::string& clipName) const {
    DeliveryReport report;
    report.clipId = clipId;
    report.clipName = clipName;
    report.sampleRate = config_.sampleRate;

    AnalysisStage stage = AnalysisStage::Decode;
    try {
        const SampleBuffer buffer = decoder_.decode(rawBytes);
        report.durationSeconds = buffer.durationSeconds();
        run_pipeline(buffer, report, stage);
    } catch (const DecodeError& e) {
        report.failure = AnalysisFailure{AnalysisStage::Decode, e.what()};
    } catch (const AnalysisError& e) {
        report.failure = AnalysisFailure{e.stage(), e.what()};
    } catch (const std::exception& e) {
        report.failure = AnalysisFailure{stage, e.what()};
    }

    if (report.failure) {
        report.usedFallback = true;
        report.metrics = MetricEngine::fallback();
        report.measurements = DeliveryMeasurements{};
        report.speechSegments.clear();
        report.silenceSegments.clear();
        log_warn(kComponent, "fallback scores for clip '" + report.clipId + "': " +
                                 analysis_stage_to_string(report.failure->stage) + " stage failed: " +
                                 report.failure->message);
    }

    report.issues = diagnostics_.detect(report);
    return report;
}

DeliveryReport DeliveryEngine::analyze_and_store(const DeliveryAnalysisRequest& request) {
    DeliveryReport report = analyze(request);
    if (store_) {
        store_->save_report(report);
    }
    return report;
}

DeliveryMetrics compute_delivery_metrics(const std::vector<std::uint8_t>& rawAudioBytes, const AnalysisConfig& config) {
    try {
        const DeliveryEngine engine(config);
        return engine.analyze(rawAudioBytes).metrics;
    } catch (const std::invalid_argument& e) {
        log_error(kComponent, std::string("invalid analysis config: ") + e.what());
    } catch (const std::exception& e) {
        log_error(kComponent, std::string("analysis aborted: ") + e.what());
    }
    return MetricEngine::fallback();
}

}  // namespace voicescope
