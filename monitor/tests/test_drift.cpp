#include <gtest/gtest.h>

#include <switchboard/monitor/drift.hpp>

using namespace switchboard;

namespace {

  AccuracyMetrics Metrics(double overall, double stddev, size_t n) {
    AccuracyMetrics m;
    m.overall_accuracy = m.cost_accuracy = m.latency_accuracy = m.quality_accuracy = overall;
    m.overall_stddev = stddev;
    m.match_rate = 1.0;
    m.sample_size = n;
    return m;
  }

}  // namespace

TEST(DriftTest, RecommendedActionByMagnitude) {
  EXPECT_EQ(recommend_action(0.30, false), DriftAction::Monitor);
  EXPECT_EQ(recommend_action(0.20, true), DriftAction::Fallback);
  EXPECT_EQ(recommend_action(0.12, true), DriftAction::Alert);
  EXPECT_EQ(recommend_action(0.06, true), DriftAction::Investigate);
}

TEST(DriftTest, SignificanceOfIdenticalSamplesIsZero) {
  EXPECT_DOUBLE_EQ(two_sample_significance(0.9, 0.05, 50, 0.9, 0.05, 50), 0.0);
  EXPECT_DOUBLE_EQ(two_sample_significance(0.9, 0.0, 0, 0.5, 0.0, 10), 0.0);
}

TEST(DriftTest, LargeShiftIsSignificant) {
  EXPECT_GT(two_sample_significance(0.9, 0.05, 50, 0.7, 0.05, 50), 0.99);
  EXPECT_DOUBLE_EQ(two_sample_significance(0.9, 0.0, 20, 0.7, 0.0, 20), 1.0);
}

TEST(DriftTest, RequiresMinimumSamples) {
  auto r = evaluate_drift(Provider::OpenAI, "gpt-4o", Metrics(0.95, 0.02, 50),
                          Metrics(0.5, 0.02, 5), DriftOptions{});
  EXPECT_FALSE(r.drift_detected);
  EXPECT_EQ(r.action, DriftAction::Monitor);
}

TEST(DriftTest, DetectsDegradationWithFallback) {
  auto r = evaluate_drift(Provider::Anthropic, "claude-3-5-sonnet", Metrics(0.95, 0.03, 50),
                          Metrics(0.70, 0.03, 50), DriftOptions{});
  EXPECT_TRUE(r.drift_detected);
  EXPECT_NEAR(r.magnitude, 0.25, 1e-12);
  EXPECT_EQ(r.action, DriftAction::Fallback);
  EXPECT_EQ(r.affected_metrics.size(), 3u);
  EXPECT_EQ(r.model, "claude-3-5-sonnet");
}

TEST(DriftTest, SmallShiftBelowThresholdIsNotDrift) {
  auto r = evaluate_drift(Provider::Google, "gemini-1.5-flash", Metrics(0.95, 0.01, 50),
                          Metrics(0.93, 0.01, 50), DriftOptions{});
  EXPECT_FALSE(r.drift_detected);
  EXPECT_GT(r.significance, 0.95);
  EXPECT_TRUE(r.affected_metrics.empty());
}
