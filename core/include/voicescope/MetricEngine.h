#pragma once

#include "voicescope/DeliveryTypes.h"

namespace voicescope {

struct PrimaryScores {
    double pace{0.0};
    double volume{0.0};
    double clarity{0.0};
    double pauseDuration{0.0};
    double tonalVariation{0.0};
};

/**
 * MetricEngine: turns the five measured scores into the DeliveryMetrics record
 *
 * Confidence and enthusiasm are not measured; they are weighted heuristics over the
 * primary scores and are part of the scoring contract:
 *
 *   confidence = 0.3*volume + 0.3*clarity + 0.2*pace
 *                + (tonalVariation in [3,4] ? 1.0 : 0.2*tonalVariation)
 *   enthusiasm = 0.4*volume + 0.4*tonalVariation
 *                + (pace >= 4 ? 1.0 : 0.2*pace)
 *
 * Both are clamped to [1,5] and rounded to one decimal.
 */
class MetricEngine {
  public:
    DeliveryMetrics derive(const PrimaryScores& scores) const;

    double confidence(double volume, double clarity, double pace, double tonalVariation) const;
    double enthusiasm(double volume, double tonalVariation, double pace) const;

    // Fixed record returned when analysis fails.
    static DeliveryMetrics fallback();
};

// Mean of the five delivery fields shown next to content scores
// (pace, tonalVariation, clarity, confidence, enthusiasm).
double delivery_average(const DeliveryMetrics& metrics);

}  // namespace voicescope
