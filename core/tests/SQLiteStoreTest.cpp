#include <gtest/gtest.h>

#include "voicescope/MetricEngine.h"
#include "voicescope/SQLiteStore.h"

#include <stdexcept>

using namespace voicescope;

namespace {

DeliveryReport make_report(const std::string& clipId, double pace) {
    DeliveryReport report;
    report.clipId = clipId;
    report.clipName = "Clip " + clipId;
    report.durationSeconds = 2.0;
    report.sampleRate = 44100;

    PrimaryScores scores;
    scores.pace = pace;
    scores.volume = 4.0;
    scores.clarity = 5.0;
    scores.pauseDuration = 2.0;
    scores.tonalVariation = 3.0;
    report.metrics = MetricEngine().derive(scores);

    report.speechSegments = {{0.0, 0.3}, {0.54, 0.86}};
    report.silenceSegments = {{0.3, 0.55}};
    report.issues.push_back(DeliveryIssue{"ClarityFromPrefixOnly", 0.02, 2.0, 0.99, "prefix"});
    return report;
}

class SQLiteStoreTest : public ::testing::Test {
  protected:
    void SetUp() override { store_.initialize(); }

    SQLiteStore store_{":memory:"};
};

}  // namespace

TEST_F(SQLiteStoreTest, InitializeIsRepeatable) {
    EXPECT_NO_THROW(store_.initialize());
    EXPECT_TRUE(store_.list_clips().empty());
}

TEST_F(SQLiteStoreTest, SaveAndLoadMetrics) {
    const DeliveryReport report = make_report("a", 5.0);
    store_.save_report(report);

    const auto loaded = store_.load_metrics("a");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(loaded->pace, report.metrics.pace);
    EXPECT_DOUBLE_EQ(loaded->volume, report.metrics.volume);
    EXPECT_DOUBLE_EQ(loaded->clarity, report.metrics.clarity);
    EXPECT_DOUBLE_EQ(loaded->pauseDuration, report.metrics.pauseDuration);
    EXPECT_DOUBLE_EQ(loaded->tonalVariation, report.metrics.tonalVariation);
    EXPECT_DOUBLE_EQ(loaded->confidence, report.metrics.confidence);
    EXPECT_DOUBLE_EQ(loaded->enthusiasm, report.metrics.enthusiasm);
}

TEST_F(SQLiteStoreTest, UnknownClipHasNoMetrics) {
    EXPECT_FALSE(store_.load_metrics("missing").has_value());
}

TEST_F(SQLiteStoreTest, SavingTheSameClipReplacesIt) {
    store_.save_report(make_report("a", 2.0));
    store_.save_report(make_report("a", 5.0));

    const auto clips = store_.list_clips();
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_DOUBLE_EQ(store_.load_metrics("a")->pace, 5.0);
}

TEST_F(SQLiteStoreTest, ListClipsSummarizesEachClip) {
    store_.save_report(make_report("a", 2.0));

    DeliveryReport failed;
    failed.clipId = "b";
    failed.clipName = "Broken upload";
    failed.usedFallback = true;
    failed.failure = AnalysisFailure{AnalysisStage::Decode, "empty PCM buffer"};
    failed.metrics = MetricEngine::fallback();
    store_.save_report(failed);

    const auto clips = store_.list_clips();
    ASSERT_EQ(clips.size(), 2u);

    // Newest first
    EXPECT_EQ(clips[0].clipId, "b");
    EXPECT_TRUE(clips[0].usedFallback);
    EXPECT_NEAR(clips[0].deliveryAverage, 3.52, 1e-9);

    EXPECT_EQ(clips[1].clipId, "a");
    EXPECT_EQ(clips[1].clipName, "Clip a");
    EXPECT_FALSE(clips[1].usedFallback);
    EXPECT_DOUBLE_EQ(clips[1].durationSeconds, 2.0);
    EXPECT_NEAR(clips[1].deliveryAverage, delivery_average(make_report("a", 2.0).metrics), 1e-9);
    EXPECT_FALSE(clips[1].createdAt.empty());
}

TEST_F(SQLiteStoreTest, DeleteClip) {
    store_.save_report(make_report("a", 2.0));
    store_.save_report(make_report("b", 3.0));

    EXPECT_TRUE(store_.delete_clip("a"));
    EXPECT_FALSE(store_.delete_clip("a"));
    EXPECT_FALSE(store_.load_metrics("a").has_value());
    EXPECT_TRUE(store_.load_metrics("b").has_value());
    EXPECT_EQ(store_.list_clips().size(), 1u);
}

TEST_F(SQLiteStoreTest, RejectsReportWithoutClipId) {
    EXPECT_THROW(store_.save_report(make_report("", 2.0)), std::runtime_error);
    EXPECT_TRUE(store_.list_clips().empty());
}

TEST(SQLiteStoreOpenTest, UnopenablePathThrows) {
    EXPECT_THROW(SQLiteStore("/nonexistent-dir/voicescope/history.db"), std::runtime_error);
}
