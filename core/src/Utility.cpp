
#include "voicescope/Utility.h"

#include <cmath>
#include <stdexcept>

namespace voicescope {

std::string metric_kind_to_string(MetricKind kind) {
    switch (kind) {
        case MetricKind::Pace:
            return "pace";
        case MetricKind::Volume:
            return "volume";
        case MetricKind::Clarity:
            return "clarity";
        case MetricKind::PauseDuration:
            return "pause_duration";
        case MetricKind::TonalVariation:
            return "tonal_variation";
        case MetricKind::Confidence:
            return "confidence";
        case MetricKind::Enthusiasm:
            return "enthusiasm";
    }
    return "pace";
}

MetricKind metric_kind_from_string(const std::string& value) {
    if (value == "pace") {
        return MetricKind::Pace;
    }
    if (value == "volume") {
        return MetricKind::Volume;
    }
    if (value == "clarity") {
        return MetricKind::Clarity;
    }
    if (value == "pause_duration") {
        return MetricKind::PauseDuration;
    }
    if (value == "tonal_variation") {
        return MetricKind::TonalVariation;
    }
    if (value == "confidence") {
        return MetricKind::Confidence;
    }
    if (value == "enthusiasm") {
        return MetricKind::Enthusiasm;
    }
    throw std::runtime_error("Unknown metric kind: " + value);
}

std::string analysis_stage_to_string(AnalysisStage stage) {
    switch (stage) {
        case AnalysisStage::Decode:
            return "decode";
        case AnalysisStage::Segmentation:
            return "segmentation";
        case AnalysisStage::Spectral:
            return "spectral";
        case AnalysisStage::Loudness:
            return "loudness";
        case AnalysisStage::Pitch:
            return "pitch";
        case AnalysisStage::Scoring:
            return "scoring";
    }
    return "decode";
}

std::vector<std::pair<MetricKind, double>> metric_values(const DeliveryMetrics& metrics) {
    return {
        {MetricKind::Pace, metrics.pace},
        {MetricKind::Volume, metrics.volume},
        {MetricKind::Clarity, metrics.clarity},
        {MetricKind::PauseDuration, metrics.pauseDuration},
        {MetricKind::TonalVariation, metrics.tonalVariation},
        {MetricKind::Confidence, metrics.confidence},
        {MetricKind::Enthusiasm, metrics.enthusiasm},
    };
}

void set_metric_value(DeliveryMetrics& metrics, MetricKind kind, double value) {
    switch (kind) {
        case MetricKind::Pace:
            metrics.pace = value;
            break;
        case MetricKind::Volume:
            metrics.volume = value;
            break;
        case MetricKind::Clarity:
            metrics.clarity = value;
            break;
        case MetricKind::PauseDuration:
            metrics.pauseDuration = value;
            break;
        case MetricKind::TonalVariation:
            metrics.tonalVariation = value;
            break;
        case MetricKind::Confidence:
            metrics.confidence = value;
            break;
        case MetricKind::Enthusiasm:
            metrics.enthusiasm = value;
            break;
    }
}

void AnalysisConfig::validate() const {
    if (sampleRate <= 0) {
        throw std::invalid_argument("sampleRate must be positive");
    }
    if (!(speechWindowSeconds > 0.0) || !(silenceWindowSeconds > 0.0) || !(pitchWindowSeconds > 0.0)) {
        throw std::invalid_argument("analysis windows must be positive");
    }
    if (!std::isfinite(speechEnergyThreshold) || !std::isfinite(silenceEnergyThreshold)) {
        throw std::invalid_argument("energy thresholds must be finite");
    }
    if (!(minPauseSeconds >= 0.0)) {
        throw std::invalid_argument("minPauseSeconds must be non-negative");
    }
    if (spectralFrameSize < 2) {
        throw std::invalid_argument("spectralFrameSize must be at least 2");
    }
    if (!(pitchMinHz > 0.0) || !(pitchMaxHz > pitchMinHz)) {
        throw std::invalid_argument("pitch range must satisfy 0 < pitchMinHz < pitchMaxHz");
    }
    if (!(pitchPeakRatio > 0.0) || pitchPeakRatio > 1.0) {
        throw std::invalid_argument("pitchPeakRatio must be in (0,1]");
    }
}

}  // namespace voicescope
