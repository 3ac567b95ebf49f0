#include <gtest/gtest.h>

#include "TestSignals.h"

#include "voicescope/DeliveryEngine.h"
#include "voicescope/Log.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace voicescope;
using namespace voicescope::test;

namespace {

void expect_scores_in_range(const DeliveryMetrics& m) {
    for (double v : {m.pace, m.volume, m.clarity, m.pauseDuration, m.tonalVariation, m.confidence, m.enthusiasm}) {
        EXPECT_GE(v, 1.0);
        EXPECT_LE(v, 5.0);
    }
}

void expect_fallback(const DeliveryMetrics& m) {
    const DeliveryMetrics f = MetricEngine::fallback();
    EXPECT_DOUBLE_EQ(m.pace, f.pace);
    EXPECT_DOUBLE_EQ(m.volume, f.volume);
    EXPECT_DOUBLE_EQ(m.clarity, f.clarity);
    EXPECT_DOUBLE_EQ(m.pauseDuration, f.pauseDuration);
    EXPECT_DOUBLE_EQ(m.tonalVariation, f.tonalVariation);
    EXPECT_DOUBLE_EQ(m.confidence, f.confidence);
    EXPECT_DOUBLE_EQ(m.enthusiasm, f.enthusiasm);
}

bool has_issue(const DeliveryReport& report, const std::string& type) {
    for (const auto& issue : report.issues) {
        if (issue.type == type) return true;
    }
    return false;
}

// Captures log lines for the lifetime of the object.
class LogCapture {
  public:
    LogCapture() {
        set_log_sink([this](LogLevel level, const std::string& line) {
            levels.push_back(level);
            lines.push_back(line);
        });
    }
    ~LogCapture() { set_log_sink(nullptr); }

    std::vector<LogLevel> levels;
    std::vector<std::string> lines;
};

// Restores console logging when it goes out of scope.
struct SinkReset {
    ~SinkReset() { set_log_sink(nullptr); }
};

}  // namespace

TEST(DeliveryEngineTest, SteadyToneScores) {
    const DeliveryEngine engine;
    const DeliveryReport report = engine.analyze(to_pcm(tone(440.0, 2.0, 0.5)));

    ASSERT_FALSE(report.usedFallback);
    EXPECT_FALSE(report.failure.has_value());
    EXPECT_DOUBLE_EQ(report.durationSeconds, 2.0);

    const DeliveryMetrics& m = report.metrics;
    EXPECT_DOUBLE_EQ(m.pace, 2.0);            // the tone never stops, so no closed speech segment
    EXPECT_DOUBLE_EQ(m.volume, 4.0);          // about -9 dBFS
    EXPECT_DOUBLE_EQ(m.clarity, 5.0);
    EXPECT_DOUBLE_EQ(m.pauseDuration, 2.0);
    EXPECT_DOUBLE_EQ(m.tonalVariation, 2.0);
    EXPECT_DOUBLE_EQ(m.confidence, 3.5);
    EXPECT_DOUBLE_EQ(m.enthusiasm, 2.8);

    EXPECT_NEAR(report.measurements.pitchMeanHz, 440.0, 44.0);
    EXPECT_EQ(report.measurements.spectralSamplesUsed, 1024);
    EXPECT_TRUE(report.measurements.trailingSpeechDropped);

    EXPECT_TRUE(has_issue(report, "NoSpeechDetected"));
    EXPECT_TRUE(has_issue(report, "TrailingSpeechDropped"));
    EXPECT_TRUE(has_issue(report, "ClarityFromPrefixOnly"));
    EXPECT_FALSE(has_issue(report, "AnalysisFallback"));
}

TEST(DeliveryEngineTest, BurstPattern) {
    const DeliveryEngine engine;
    const DeliveryReport report = engine.analyze(to_pcm(burst_pattern()));

    ASSERT_FALSE(report.usedFallback);
    EXPECT_EQ(report.speechSegments.size(), 5u);
    EXPECT_EQ(report.silenceSegments.size(), 4u);
    EXPECT_NEAR(report.measurements.speechRate, 3.25, 0.1);
    EXPECT_NEAR(report.measurements.silenceRatio, 0.36, 0.02);

    EXPECT_DOUBLE_EQ(report.metrics.pace, 5.0);
    EXPECT_DOUBLE_EQ(report.metrics.pauseDuration, 2.0);
    EXPECT_DOUBLE_EQ(report.metrics.volume, 5.0);
    EXPECT_DOUBLE_EQ(report.metrics.clarity, 2.0);
    expect_scores_in_range(report.metrics);
    EXPECT_FALSE(has_issue(report, "NoSpeechDetected"));
    EXPECT_FALSE(has_issue(report, "TrailingSpeechDropped"));
}

TEST(DeliveryEngineTest, AllZeroInput) {
    const std::vector<std::uint8_t> bytes(88200, 0);
    const DeliveryReport report = DeliveryEngine().analyze(bytes);

    ASSERT_FALSE(report.usedFallback);
    EXPECT_DOUBLE_EQ(report.metrics.volume, 2.0);
    EXPECT_DOUBLE_EQ(report.metrics.pace, 2.0);
    EXPECT_DOUBLE_EQ(report.metrics.tonalVariation, 2.0);
    expect_scores_in_range(report.metrics);
    EXPECT_TRUE(has_issue(report, "NoVoicedPitch"));

    EXPECT_DOUBLE_EQ(compute_delivery_metrics(bytes).volume, 2.0);
}

TEST(DeliveryEngineTest, EmptyInputFallsBack) {
    const DeliveryReport report = DeliveryEngine().analyze(std::vector<std::uint8_t>{});

    EXPECT_TRUE(report.usedFallback);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, AnalysisStage::Decode);
    expect_fallback(report.metrics);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].type, "AnalysisFallback");

    expect_fallback(compute_delivery_metrics({}));
}

TEST(DeliveryEngineTest, OddLengthFallsBack) {
    const std::vector<std::uint8_t> bytes = {0x10, 0x20, 0x30};
    const DeliveryReport report = DeliveryEngine().analyze(bytes);

    EXPECT_TRUE(report.usedFallback);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, AnalysisStage::Decode);
    expect_fallback(compute_delivery_metrics(bytes));
}

TEST(DeliveryEngineTest, SingleSampleFailsInSpectralStage) {
    const std::vector<std::uint8_t> bytes = {0x00, 0x40};
    const DeliveryReport report = DeliveryEngine().analyze(bytes);

    EXPECT_TRUE(report.usedFallback);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, AnalysisStage::Spectral);
    expect_fallback(report.metrics);
    EXPECT_TRUE(report.speechSegments.empty());
}

TEST(DeliveryEngineTest, FallbackIsLogged) {
    LogCapture capture;
    DeliveryAnalysisRequest request;
    request.clipId = "clip-7";
    request.rawBytes = {0x01};

    const DeliveryReport report = DeliveryEngine().analyze(request);
    EXPECT_TRUE(report.usedFallback);
    EXPECT_EQ(report.clipId, "clip-7");

    ASSERT_EQ(capture.lines.size(), 1u);
    EXPECT_EQ(capture.levels[0], LogLevel::Warn);
    EXPECT_EQ(capture.lines[0].rfind("[Delivery Engine] [WARN]", 0), 0u);
    EXPECT_NE(capture.lines[0].find("clip-7"), std::string::npos);
    EXPECT_NE(capture.lines[0].find("decode"), std::string::npos);
}

TEST(DeliveryEngineTest, SuccessfulAnalysisIsSilent) {
    LogCapture capture;
    DeliveryEngine().analyze(to_pcm(tone(220.0, 0.5, 0.5)));
    EXPECT_TRUE(capture.lines.empty());
}

TEST(DeliveryEngineTest, IsDeterministic) {
    const DeliveryEngine engine;
    const auto bytes = to_pcm(burst_pattern());
    const DeliveryMetrics a = engine.analyze(bytes).metrics;
    const DeliveryMetrics b = engine.analyze(bytes).metrics;
    EXPECT_EQ(a.pace, b.pace);
    EXPECT_EQ(a.volume, b.volume);
    EXPECT_EQ(a.clarity, b.clarity);
    EXPECT_EQ(a.pauseDuration, b.pauseDuration);
    EXPECT_EQ(a.tonalVariation, b.tonalVariation);
    EXPECT_EQ(a.confidence, b.confidence);
    EXPECT_EQ(a.enthusiasm, b.enthusiasm);
}

TEST(DeliveryEngineTest, InvalidConfig) {
    AnalysisConfig config;
    config.sampleRate = 0;
    EXPECT_THROW(DeliveryEngine{config}, std::invalid_argument);

    LogCapture capture;
    expect_fallback(compute_delivery_metrics(to_pcm(tone(440.0, 1.0, 0.5)), config));
    ASSERT_EQ(capture.levels.size(), 1u);
    EXPECT_EQ(capture.levels[0], LogLevel::Error);
}

TEST(DeliveryEngineTest, CustomSampleRate) {
    AnalysisConfig config;
    config.sampleRate = 16000;
    const DeliveryEngine engine(config);
    const DeliveryReport report = engine.analyze(to_pcm(tone(220.0, 1.0, 0.5, 16000)));

    ASSERT_FALSE(report.usedFallback);
    EXPECT_EQ(report.sampleRate, 16000);
    EXPECT_DOUBLE_EQ(report.durationSeconds, 1.0);
    EXPECT_NEAR(report.measurements.pitchMeanHz, 220.0, 22.0);
}

TEST(DeliveryEngineTest, AnalyzeAndStore) {
    DeliveryEngine engine(AnalysisConfig{}, ":memory:");
    ASSERT_NE(engine.store(), nullptr);

    DeliveryAnalysisRequest request;
    request.clipId = "talk-1";
    request.clipName = "Practice talk";
    request.rawBytes = to_pcm(tone(440.0, 1.0, 0.5));
    const DeliveryReport report = engine.analyze_and_store(request);

    const auto stored = engine.store()->load_metrics("talk-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_DOUBLE_EQ(stored->confidence, report.metrics.confidence);
    EXPECT_DOUBLE_EQ(stored->enthusiasm, report.metrics.enthusiasm);

    const auto clips = engine.store()->list_clips();
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0].clipName, "Practice talk");
}

TEST(DeliveryEngineTest, AnalyzeAndStoreWithoutDatabase) {
    DeliveryEngine engine;
    EXPECT_EQ(engine.store(), nullptr);

    DeliveryAnalysisRequest request;
    request.clipId = "talk-2";
    request.rawBytes = to_pcm(tone(440.0, 0.5, 0.5));
    EXPECT_FALSE(engine.analyze_and_store(request).usedFallback);
}

TEST(DeliveryEngineTest, OddFrameLengthIsAnalyzed) {
    std::vector<double> samples = tone(1000.0, 1.0, 0.5);
    samples.resize(1023);
    const DeliveryEngine engine;
    const DeliveryReport report = engine.analyze(to_pcm(samples));

    ASSERT_FALSE(report.usedFallback);
    EXPECT_EQ(report.measurements.spectralSamplesUsed, 1023);
    EXPECT_DOUBLE_EQ(report.metrics.clarity, 5.0);
    expect_scores_in_range(report.metrics);
}

TEST(DeliveryEngineTest, SinkMayLogFromInsideCallback) {
    SinkReset reset;
    std::vector<std::string> lines;
    bool forwarding = false;
    set_log_sink([&](LogLevel, const std::string& line) {
        lines.push_back(line);
        if (!forwarding) {
            forwarding = true;
            log_info("Relay", "forwarded");
            forwarding = false;
        }
    });

    expect_fallback(compute_delivery_metrics({}));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[WARN]"), std::string::npos);
    EXPECT_EQ(lines[1], "[Relay] [INFO] forwarded");
}

TEST(DeliveryEngineTest, ThrowingSinkDoesNotEscape) {
    SinkReset reset;
    set_log_sink([](LogLevel, const std::string&) { throw std::runtime_error("sink down"); });

    DeliveryMetrics metrics;
    EXPECT_NO_THROW(metrics = compute_delivery_metrics({}));
    expect_fallback(metrics);

    AnalysisConfig bad;
    bad.sampleRate = 0;
    EXPECT_NO_THROW(metrics = compute_delivery_metrics(to_pcm(tone(440.0, 0.5, 0.5)), bad));
    expect_fallback(metrics);

    const DeliveryEngine engine;
    DeliveryReport report;
    EXPECT_NO_THROW(report = engine.analyze(std::vector<std::uint8_t>{}));
    EXPECT_TRUE(report.usedFallback);
}
