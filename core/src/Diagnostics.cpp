#include "voicescope/Diagnostics.h"
#include "voicescope/CoreContract.h"
#include "voicescope/Utility.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace {

using voicescope::DeliveryIssue;
using voicescope::DeliveryReport;

constexpr double kEps = 1e-9;

inline double clamp01(double x) { return std::min(1.0, std::max(0.0, x)); }

inline double safe_div(double num, double den) { return (std::abs(den) > kEps) ? (num / den) : 0.0; }

DeliveryIssue make_issue(const char* type, double startT, double endT, double severity, std::string explanation) {
    DeliveryIssue issue;
    issue.type = type;
    issue.startTime = startT;
    issue.endTime = std::max(startT, endT);
    issue.severity = clamp01(severity);
    issue.explanation = std::move(explanation);
    return issue;
}

std::string format_seconds(double s) {
    const double r = std::round(s * 100.0) / 100.0;
    std::string out = std::to_string(r);
    // std::to_string prints six decimals; keep two
    const auto dot = out.find('.');
    if (dot != std::string::npos && out.size() > dot + 3) out.erase(dot + 3);
    return out + "s";
}

} // namespace

namespace voicescope {

std::vector<DeliveryIssue> DiagnosticsEngine::detect(const DeliveryReport& report) const {
    std::vector<DeliveryIssue> issues;
    const double duration = std::max(0.0, report.durationSeconds);

    if (report.usedFallback) {
        std::string why = "analysis failed; default scores returned";
        if (report.failure) {
            why = "analysis failed at " + analysis_stage_to_string(report.failure->stage) + " stage (" +
                  report.failure->message + "); default scores returned";
        }
        issues.push_back(make_issue("AnalysisFallback", 0.0, duration, 1.0, std::move(why)));
        // Measurements are not populated on the fallback path.
        return issues;
    }

    const auto& m = report.measurements;

    if (m.speechSegmentCount == 0) {
        std::string why = "no closed speech segment; pace scored from a zero speech rate";
        if (m.trailingSpeechDropped) {
            why += " (speech running to the end of the clip is not counted)";
        }
        issues.push_back(make_issue("NoSpeechDetected", 0.0, duration, 0.8, std::move(why)));
    }

    if (m.trailingSpeechDropped) {
        const double start = std::min(m.trailingSpeechStartSeconds, duration);
        issues.push_back(make_issue("TrailingSpeechDropped", start, duration,
                                    safe_div(duration - start, duration),
                                    "speech still active at end of clip from " + format_seconds(start) +
                                        " was not counted toward pace"));
    }

    if (m.voicedWindowCount == 0) {
        issues.push_back(make_issue("NoVoicedPitch", 0.0, duration, 0.6,
                                    "no voiced window found; tonal variation scored as monotone"));
    }

    const double totalSamples = duration * static_cast<double>(report.sampleRate);
    if (m.spectralSamplesUsed > 0 && static_cast<double>(m.spectralSamplesUsed) + kEps < totalSamples) {
        const double coveredSec = safe_div(static_cast<double>(m.spectralSamplesUsed), static_cast<double>(report.sampleRate));
        issues.push_back(make_issue("ClarityFromPrefixOnly", coveredSec, duration,
                                    1.0 - safe_div(static_cast<double>(m.spectralSamplesUsed), totalSamples),
                                    "clarity computed from the first " + format_seconds(coveredSec) + " of " +
                                        format_seconds(duration)));
    }

    if (m.loudnessDb >= contract::CLIPPING_RISK_DB) {
        issues.push_back(make_issue("ClippingRisk", 0.0, duration, 1.0,
                                    "whole-clip level near full scale; input is likely clipped"));
    }

    return issues;
}

}  // namespace voicescope
