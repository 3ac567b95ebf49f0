#pragma once

#include "voicescope/CoreContract.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voicescope {

// ========== Analysis Configuration ==========
struct AnalysisConfig {
    int sampleRate{contract::DEFAULT_SAMPLE_RATE_HZ};

    // Speech detection (pace)
    double speechWindowSeconds{contract::SPEECH_WINDOW_SEC};
    double speechEnergyThreshold{contract::SPEECH_ENERGY_THRESHOLD};

    // Silence detection (pauses)
    double silenceWindowSeconds{contract::SILENCE_WINDOW_SEC};
    double silenceEnergyThreshold{contract::SILENCE_ENERGY_THRESHOLD};
    double minPauseSeconds{contract::MIN_PAUSE_SEC};

    // Spectral analysis (clarity)
    int spectralFrameSize{contract::SPECTRAL_FRAME_SIZE};

    // Pitch tracking (tonal variation)
    double pitchWindowSeconds{contract::PITCH_WINDOW_SEC};
    double pitchMinHz{contract::PITCH_MIN_HZ};
    double pitchMaxHz{contract::PITCH_MAX_HZ};
    double pitchPeakRatio{contract::PITCH_PEAK_RATIO};

    // Throws std::invalid_argument on an unusable configuration.
    void validate() const;
};

// ========== Decoded Audio ==========
struct SampleBuffer {
    std::vector<float> samples;         // normalized mono amplitudes in [-1,1]
    int sampleRate{contract::DEFAULT_SAMPLE_RATE_HZ};
    int channels{1};                    // mono enforced upstream

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / static_cast<double>(sampleRate) : 0.0;
    }
};

// ========== Segmentation ==========
struct TimeSegment {
    double startSeconds{0.0};
    double endSeconds{0.0};             // exclusive, always > startSeconds

    double duration() const { return endSeconds - startSeconds; }
};

enum class ActiveWhen {
    AboveThreshold,                     // speech: energy > threshold
    BelowThreshold                      // silence: energy < threshold
};

struct SegmentationParams {
    double windowSeconds{contract::SPEECH_WINDOW_SEC};
    double threshold{contract::SPEECH_ENERGY_THRESHOLD};
    ActiveWhen activeWhen{ActiveWhen::AboveThreshold};
    double minSegmentSeconds{0.0};
};

struct SegmentationResult {
    std::vector<TimeSegment> segments;  // time-ordered, non-overlapping
    // An Active run still open when the buffer ran out. It is NOT part of segments.
    bool trailingOpen{false};
    double trailingStartSeconds{0.0};

    double totalSeconds() const {
        double total = 0.0;
        for (const auto& s : segments) total += s.duration();
        return total;
    }
};

// ========== Spectrum / Pitch ==========
struct SpectralFrame {
    std::vector<double> magnitudes;     // N/2 bins, non-negative
    double binWidthHz{0.0};
};

using PitchTrack = std::vector<double>; // voiced fundamentals in Hz

// ========== Output ==========
struct DeliveryMetrics {
    double pace{contract::FALLBACK_PACE};
    double volume{contract::FALLBACK_VOLUME};
    double clarity{contract::FALLBACK_CLARITY};
    double pauseDuration{contract::FALLBACK_PAUSE_DURATION};
    double tonalVariation{contract::FALLBACK_TONAL_VARIATION};
    double confidence{contract::FALLBACK_CONFIDENCE};     // derived
    double enthusiasm{contract::FALLBACK_ENTHUSIASM};     // derived
};

enum class MetricKind {
    Pace,
    Volume,
    Clarity,
    PauseDuration,
    TonalVariation,
    Confidence,
    Enthusiasm
};

// Raw measurements behind the scores (diagnostics / persistence only)
struct DeliveryMeasurements {
    double speechRate{0.0};             // segments per second of speech
    int speechSegmentCount{0};
    double totalSpeechSeconds{0.0};
    bool trailingSpeechDropped{false};
    double trailingSpeechStartSeconds{0.0};

    double silenceRatio{0.0};
    double totalSilenceSeconds{0.0};

    double rms{0.0};
    double loudnessDb{0.0};

    double clarityRatio{0.0};
    int spectralSamplesUsed{0};

    double pitchMeanHz{0.0};
    double pitchVariationRatio{0.0};
    int voicedWindowCount{0};
};

enum class AnalysisStage {
    Decode,
    Segmentation,
    Spectral,
    Loudness,
    Pitch,
    Scoring
};

struct AnalysisFailure {
    AnalysisStage stage{AnalysisStage::Decode};
    std::string message;
};

struct DeliveryIssue {
    std::string type;                   // e.g. "NoVoicedPitch", "TrailingSpeechDropped"
    double startTime{0.0};
    double endTime{0.0};
    double severity{0.0};               // [0,1]
    std::string explanation;
};

struct DeliveryReport {
    std::string clipId;                 // logical id (e.g., upload id)
    std::string clipName;               // display name
    double durationSeconds{0.0};
    int sampleRate{0};

    DeliveryMetrics metrics;
    DeliveryMeasurements measurements;

    std::vector<TimeSegment> speechSegments;
    std::vector<TimeSegment> silenceSegments;
    std::vector<DeliveryIssue> issues;

    bool usedFallback{false};
    std::optional<AnalysisFailure> failure;
};

struct DeliveryAnalysisRequest {
    std::string clipId;
    std::string clipName;
    std::vector<std::uint8_t> rawBytes; // 16-bit LE mono PCM
};

// Row of the evaluation history listing.
struct ClipSummary {
    std::string clipId;
    std::string clipName;
    double durationSeconds{0.0};
    double deliveryAverage{0.0};
    bool usedFallback{false};
    std::string createdAt;
};

}  // namespace voicescope
