#include <gtest/gtest.h>

#include "TestSignals.h"

#include "voicescope/Errors.h"
#include "voicescope/features/PitchFeatures.h"

#include <stdexcept>

using namespace voicescope;
using namespace voicescope::test;

namespace {

const features::PitchEstimator kPitch{};
const AnalysisConfig kConfig{};

}  // namespace

TEST(PitchFeaturesTest, SteadyToneAt440Hz) {
    const SampleBuffer buffer = decoded(tone(440.0, 2.0, 0.5));
    const PitchTrack track = kPitch.track(buffer, kConfig);

    // 882-sample windows stepped while a full window fits
    EXPECT_EQ(track.size(), 99u);

    const auto stats = kPitch.statistics(track);
    EXPECT_NEAR(stats.meanHz, 440.0, 44.0);
    EXPECT_LT(stats.variationRatio, 0.05);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track), 2.0);
}

TEST(PitchFeaturesTest, StrongestLagRuleHalvesCleanTone) {
    AnalysisConfig config;
    config.pitchPeakRatio = 1.0;
    const PitchTrack track = kPitch.track(decoded(tone(440.0, 2.0, 0.5)), config);

    ASSERT_EQ(track.size(), 99u);
    const auto stats = kPitch.statistics(track);
    EXPECT_NEAR(stats.meanHz, 230.6, 0.5);
    EXPECT_GT(stats.variationRatio, 0.35);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track), 3.0);
}

TEST(PitchFeaturesTest, SingleWindowResolvesWholeSamplePeriod) {
    // 441 Hz has a period of exactly 100 samples at 44.1 kHz.
    const SampleBuffer buffer = decoded(tone(441.0, 0.02, 0.5));
    const double hz = kPitch.estimateWindow(buffer.samples.data(), buffer.samples.size(), buffer.sampleRate, kConfig);
    EXPECT_DOUBLE_EQ(hz, 441.0);
}

TEST(PitchFeaturesTest, LowVoiceIsNotHalved) {
    for (double f0 : {120.0, 150.0, 220.0}) {
        const PitchTrack track = kPitch.track(decoded(tone(f0, 2.0, 0.5)), kConfig);
        ASSERT_FALSE(track.empty()) << f0;
        EXPECT_NEAR(kPitch.statistics(track).meanHz, f0, 0.05 * f0) << f0;
    }
}

TEST(PitchFeaturesTest, SilenceIsUnvoiced) {
    const PitchTrack track = kPitch.track(decoded(std::vector<double>(44100, 0.0)), kConfig);
    EXPECT_TRUE(track.empty());
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track), 2.0);

    const auto stats = kPitch.statistics(track);
    EXPECT_DOUBLE_EQ(stats.meanHz, 0.0);
    EXPECT_DOUBLE_EQ(stats.variationRatio, 0.0);
}

TEST(PitchFeaturesTest, FifthStepIsExpressive) {
    std::vector<double> samples;
    append_tone(samples, 200.0, 1.0, 0.5);
    append_tone(samples, 300.0, 1.0, 0.5);
    const PitchTrack track = kPitch.track(decoded(samples), kConfig);

    const double ratio = kPitch.statistics(track).variationRatio;
    EXPECT_GT(ratio, 0.15);
    EXPECT_LT(ratio, 0.25);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track), 5.0);
}

TEST(PitchFeaturesTest, SmallAlternationIsSomewhatVaried) {
    std::vector<double> samples;
    for (int k = 0; k < 2; ++k) {
        append_tone(samples, 200.0, 0.5, 0.5);
        append_tone(samples, 240.0, 0.5, 0.5);
    }
    const PitchTrack track = kPitch.track(decoded(samples), kConfig);

    const double ratio = kPitch.statistics(track).variationRatio;
    EXPECT_GE(ratio, 0.05);
    EXPECT_LT(ratio, 0.15);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track), 3.0);
}

TEST(PitchFeaturesTest, TonalVariationBuckets) {
    // mean 100, population stddev r*100 for a symmetric two-point track
    auto track_with_ratio = [](double r) { return PitchTrack{100.0 - 100.0 * r, 100.0 + 100.0 * r}; };
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track_with_ratio(0.0)), 2.0);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track_with_ratio(0.1)), 3.0);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track_with_ratio(0.2)), 5.0);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track_with_ratio(0.3)), 4.0);
    EXPECT_DOUBLE_EQ(kPitch.scoreTonalVariation(track_with_ratio(0.5)), 3.0);
}

TEST(PitchFeaturesTest, ShorterThanOneWindowHasNoTrack) {
    const SampleBuffer buffer = decoded(tone(440.0, 0.01, 0.5));
    EXPECT_TRUE(kPitch.track(buffer, kConfig).empty());
}

TEST(PitchFeaturesTest, RejectsEmptyBuffer) {
    EXPECT_THROW(kPitch.track(SampleBuffer{}, kConfig), AnalysisError);
}

TEST(PitchFeaturesTest, PeakRatioMustBeAFraction) {
    AnalysisConfig config;
    config.pitchPeakRatio = 0.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.pitchPeakRatio = 1.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.pitchPeakRatio = 1.0;
    EXPECT_NO_THROW(config.validate());
}
