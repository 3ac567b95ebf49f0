#include "voicescope/MetricEngine.h"
#include "voicescope/Normalization.h"

namespace voicescope {

double MetricEngine::confidence(double volume, double clarity, double pace, double tonalVariation) const {
    double score = 0.0;
    score += volume * 0.3;
    score += clarity * 0.3;
    score += pace * 0.2;
    if (tonalVariation >= 3.0 && tonalVariation <= 4.0) {
        score += 1.0;
    } else {
        score += tonalVariation * 0.2;
    }
    return round_to_tenths(clamp_score(score));
}

double MetricEngine::enthusiasm(double volume, double tonalVariation, double pace) const {
    double score = 0.0;
    score += volume * 0.4;
    score += tonalVariation * 0.4;
    if (pace >= 4.0) {
        score += 1.0;
    } else {
        score += pace * 0.2;
    }
    return round_to_tenths(clamp_score(score));
}

DeliveryMetrics MetricEngine::derive(const PrimaryScores& scores) const {
    DeliveryMetrics m;
    m.pace = clamp_score(scores.pace);
    m.volume = clamp_score(scores.volume);
    m.clarity = clamp_score(scores.clarity);
    m.pauseDuration = clamp_score(scores.pauseDuration);
    m.tonalVariation = clamp_score(scores.tonalVariation);

    m.confidence = confidence(m.volume, m.clarity, m.pace, m.tonalVariation);
    m.enthusiasm = enthusiasm(m.volume, m.tonalVariation, m.pace);
    return m;
}

DeliveryMetrics MetricEngine::fallback() {
    DeliveryMetrics m;
    m.pace = contract::FALLBACK_PACE;
    m.volume = contract::FALLBACK_VOLUME;
    m.clarity = contract::FALLBACK_CLARITY;
    m.pauseDuration = contract::FALLBACK_PAUSE_DURATION;
    m.tonalVariation = contract::FALLBACK_TONAL_VARIATION;
    m.confidence = contract::FALLBACK_CONFIDENCE;
    m.enthusiasm = contract::FALLBACK_ENTHUSIASM;
    return m;
}

double delivery_average(const DeliveryMetrics& metrics) {
    return mean({metrics.pace, metrics.tonalVariation, metrics.clarity, metrics.confidence, metrics.enthusiasm});
}

}  // namespace voicescope
