#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <switchboard/monitor/accuracy_monitor.hpp>
#include <thread>
#include <vector>

#pragma GCC diagnostic ignored "-Wunused-result"

using namespace switchboard;
using namespace std::chrono;

// ============================================================================
// Test Fixture
// ============================================================================

class AccuracyMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>(SystemTime(sys_days{year{2025} / March / 10}));
  }

  static MonitorOptions Inline() {
    MonitorOptions options;
    options.start_worker = false;
    options.sampling.seed = 11;
    options.baseline_window = 20;
    options.drift_window = 20;
    return options;
  }

  std::unique_ptr<AccuracyMonitor> Make(MonitorOptions options = Inline()) {
    return std::make_unique<AccuracyMonitor>(options, clock_);
  }

  static CandidatePrediction Prediction(Provider provider = Provider::OpenAI,
                                        std::string model = "gpt-4o-mini") {
    CandidatePrediction p;
    p.provider = provider;
    p.model = std::move(model);
    p.predicted_cost = 0.001;
    p.predicted_latency_ms = 1000.0;
    p.predicted_quality = 0.8;
    return p;
  }

  static ExecutionOutcome Outcome(const std::string& id, double cost = 0.001,
                                  double latency = 1000.0, Provider provider = Provider::OpenAI,
                                  std::string model = "gpt-4o-mini") {
    ExecutionOutcome o;
    o.request_id = id;
    o.provider = provider;
    o.model = std::move(model);
    o.cost = cost;
    o.latency_ms = latency;
    o.success = true;
    o.quality_score = 0.8;
    return o;
  }

  // Registers and records one exchange
  static void Exchange(AccuracyMonitor& monitor, const std::string& id, double cost = 0.001,
                       double latency = 1000.0, Provider provider = Provider::OpenAI,
                       const std::string& model = "gpt-4o-mini") {
    monitor.register_prediction(id, Prediction(provider, model));
    auto result = monitor.record_outcome(Outcome(id, cost, latency, provider, model));
    ASSERT_TRUE(result.has_value()) << result.error().describe();
  }

  std::shared_ptr<ManualClock> clock_;
};

// ============================================================================
// Intake
// ============================================================================

TEST_F(AccuracyMonitorTest, RejectsInvalidOptions) {
  auto options = Inline();
  options.queue_capacity = 0;
  EXPECT_THROW(Make(options), std::invalid_argument);

  options = Inline();
  options.default_quality = 1.5;
  EXPECT_THROW(Make(options), std::invalid_argument);
}

TEST_F(AccuracyMonitorTest, DuplicateOutcomeIsRejected) {
  auto monitor = Make();
  Exchange(*monitor, "req-1");

  auto again = monitor->record_outcome(Outcome("req-1"));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::DuplicateOutcome);
  EXPECT_EQ(http_status(again.error().code), 409);

  monitor->flush();
  EXPECT_EQ(monitor->stats().processed, 1u);
  EXPECT_EQ(monitor->stats().duplicates, 1u);
}

TEST_F(AccuracyMonitorTest, DuplicateCheckPrecedesUnknown) {
  auto monitor = Make();
  Exchange(*monitor, "req-1");
  monitor->register_prediction("req-1", Prediction());
  EXPECT_EQ(monitor->record_outcome(Outcome("req-1")).error().code, ErrorCode::DuplicateOutcome);
}

TEST_F(AccuracyMonitorTest, UnknownRequestIsRejected) {
  auto monitor = Make();
  auto result = monitor->record_outcome(Outcome("never-predicted"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::UnknownRequest);
  EXPECT_EQ(monitor->stats().unknown, 1u);
}

TEST_F(AccuracyMonitorTest, RecordedOutcomesDoNotEvictOpenPredictions) {
  auto options = Inline();
  options.max_tracked_outcomes = 3;
  auto monitor = Make(options);

  monitor->register_prediction("open", Prediction());
  for (int i = 0; i < 20; ++i) Exchange(*monitor, std::format("req-{}", i));

  EXPECT_TRUE(monitor->record_outcome(Outcome("open")).has_value());
}

TEST_F(AccuracyMonitorTest, OldestOpenPredictionIsEvictedPastBound) {
  auto options = Inline();
  options.max_tracked_outcomes = 2;
  auto monitor = Make(options);

  monitor->register_prediction("a", Prediction());
  monitor->register_prediction("b", Prediction());
  monitor->register_prediction("c", Prediction());

  EXPECT_EQ(monitor->record_outcome(Outcome("a")).error().code, ErrorCode::UnknownRequest);
  EXPECT_TRUE(monitor->record_outcome(Outcome("b")).has_value());
  EXPECT_TRUE(monitor->record_outcome(Outcome("c")).has_value());
}

TEST_F(AccuracyMonitorTest, StaleOrderEntriesAreSkippedOnEviction) {
  auto options = Inline();
  options.max_tracked_outcomes = 2;
  auto monitor = Make(options);

  Exchange(*monitor, "a");
  monitor->register_prediction("b", Prediction());
  monitor->register_prediction("c", Prediction());
  monitor->register_prediction("d", Prediction());

  EXPECT_EQ(monitor->record_outcome(Outcome("b")).error().code, ErrorCode::UnknownRequest);
  EXPECT_TRUE(monitor->record_outcome(Outcome("c")).has_value());
  EXPECT_TRUE(monitor->record_outcome(Outcome("d")).has_value());
}

TEST_F(AccuracyMonitorTest, IdOlderThanTrackingBoundIsStillRejected) {
  auto options = Inline();
  options.max_tracked_outcomes = 2;
  auto monitor = Make(options);

  Exchange(*monitor, "a");
  Exchange(*monitor, "b");
  Exchange(*monitor, "c");

  auto again = monitor->record_outcome(Outcome("a"));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::UnknownRequest);
  EXPECT_EQ(monitor->record_outcome(Outcome("c")).error().code, ErrorCode::DuplicateOutcome);
}

TEST_F(AccuracyMonitorTest, SampledOutOutcomesAreStillDeduplicated) {
  auto options = Inline();
  options.sampling.base_rate = 0.0;
  auto monitor = Make(options);

  monitor->register_prediction("req-1", Prediction());
  auto receipt = monitor->record_outcome(Outcome("req-1"));
  ASSERT_TRUE(receipt.has_value());
  EXPECT_FALSE(receipt.value().sampled);
  EXPECT_EQ(monitor->record_outcome(Outcome("req-1")).error().code, ErrorCode::DuplicateOutcome);

  monitor->flush();
  EXPECT_EQ(monitor->stats().sampled_out, 1u);
  EXPECT_FALSE(monitor->metrics(Provider::OpenAI, "gpt-4o-mini").has_value());
}

TEST_F(AccuracyMonitorTest, QueueDropsOldestOnOverflow) {
  auto options = Inline();
  options.queue_capacity = 3;
  auto monitor = Make(options);

  for (int i = 0; i < 5; ++i) Exchange(*monitor, std::format("req-{}", i));
  EXPECT_EQ(monitor->stats().queue_size, 3u);
  EXPECT_EQ(monitor->stats().dropped, 2u);

  monitor->flush();
  EXPECT_EQ(monitor->stats().processed, 3u);
  EXPECT_EQ(monitor->stats().queue_size, 0u);
}

// ============================================================================
// Metrics and Calibration
// ============================================================================

TEST_F(AccuracyMonitorTest, AccurateOutcomesScoreHigh) {
  auto monitor = Make();
  for (int i = 0; i < 12; ++i) Exchange(*monitor, std::format("req-{}", i));
  monitor->flush();

  auto m = monitor->metrics(Provider::OpenAI, "gpt-4o-mini");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->sample_size, 12u);
  EXPECT_NEAR(m->overall_accuracy, 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(m->match_rate, 1.0);
  EXPECT_TRUE(monitor->alerts().alerts(true).empty());
}

TEST_F(AccuracyMonitorTest, CalibrationLearnsFromMatchedOutcomes) {
  auto monitor = Make();
  Exchange(*monitor, "req-1", 0.002, 2000.0);
  monitor->flush();

  auto snap = monitor->calibration().snapshot();
  const auto* entry = snap->find(Provider::OpenAI, "gpt-4o-mini");
  ASSERT_NE(entry, nullptr);
  EXPECT_NEAR(entry->cost_factor, 1.1, 1e-12);
  EXPECT_NEAR(entry->latency_factor, 1.1, 1e-12);
  EXPECT_EQ(entry->samples, 1u);
}

TEST_F(AccuracyMonitorTest, MismatchedServedModelDoesNotCalibrate) {
  auto monitor = Make();
  monitor->register_prediction("req-1", Prediction(Provider::OpenAI, "gpt-4o-mini"));
  ASSERT_TRUE(monitor->record_outcome(Outcome("req-1", 0.01, 3000.0, Provider::Google,
                                              "gemini-1.5-flash"))
                  .has_value());
  monitor->flush();

  EXPECT_TRUE(monitor->calibration().snapshot()->entries.empty());
  auto m = monitor->metrics(Provider::Google, "gemini-1.5-flash");
  ASSERT_TRUE(m.has_value());
  EXPECT_DOUBLE_EQ(m->match_rate, 0.0);
}

TEST_F(AccuracyMonitorTest, DegradedAccuracyRaisesAlert) {
  auto monitor = Make();
  for (int i = 0; i < 10; ++i) Exchange(*monitor, std::format("req-{}", i), 0.004, 1000.0);
  monitor->flush();

  auto open = monitor->alerts().alerts(true);
  ASSERT_FALSE(open.empty());
  EXPECT_EQ(open.front().type, AlertType::AccuracyDegradation);
  EXPECT_EQ(open.front().provider, Provider::OpenAI);
  EXPECT_EQ(open.front().occurrences, 1);
}

TEST_F(AccuracyMonitorTest, LatencySpikeRaisesPerformanceAnomaly) {
  auto monitor = Make();
  Exchange(*monitor, "req-slow", 0.001, 12000.0);
  monitor->flush();

  auto open = monitor->alerts().alerts(true);
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open.front().type, AlertType::PerformanceAnomaly);
  EXPECT_EQ(open.front().severity, Severity::High);
}

// ============================================================================
// Baselines and Drift
// ============================================================================

TEST_F(AccuracyMonitorTest, BaselineCapturedAutomatically) {
  auto monitor = Make();
  for (int i = 0; i < 19; ++i) Exchange(*monitor, std::format("req-{}", i));
  monitor->flush();
  EXPECT_FALSE(monitor->baseline(Provider::OpenAI, "gpt-4o-mini").has_value());

  Exchange(*monitor, "req-19");
  monitor->flush();
  auto baseline = monitor->baseline(Provider::OpenAI, "gpt-4o-mini");
  ASSERT_TRUE(baseline.has_value());
  EXPECT_EQ(baseline->sample_size, 20u);
}

TEST_F(AccuracyMonitorTest, DriftWithoutBaselineIsNotReported) {
  auto monitor = Make();
  auto result = monitor->detect_drift(Provider::Anthropic, "claude-3-5-sonnet");
  EXPECT_FALSE(result.drift_detected);
  EXPECT_EQ(result.action, DriftAction::Monitor);
}

TEST_F(AccuracyMonitorTest, DriftAppliesPenaltyUntilRecovery) {
  auto monitor = Make();
  for (int i = 0; i < 20; ++i) Exchange(*monitor, std::format("good-{}", i));
  for (int i = 0; i < 20; ++i) Exchange(*monitor, std::format("bad-{}", i), 0.003, 3000.0);
  monitor->flush();

  auto drift = monitor->detect_drift(Provider::OpenAI, "gpt-4o-mini");
  EXPECT_TRUE(drift.drift_detected);
  EXPECT_EQ(drift.action, DriftAction::Fallback);

  const auto* entry = monitor->calibration().snapshot()->find(Provider::OpenAI, "gpt-4o-mini");
  ASSERT_NE(entry, nullptr);
  EXPECT_DOUBLE_EQ(entry->drift_penalty, 0.5);

  bool drift_alert = false;
  for (const auto& a : monitor->alerts().alerts(true)) {
    if (a.type == AlertType::DriftDetected) {
      drift_alert = true;
      EXPECT_EQ(a.severity, Severity::Critical);
    }
  }
  EXPECT_TRUE(drift_alert);

  // Predictions catch up with reality: recent window matches the baseline again
  for (int i = 0; i < 20; ++i) Exchange(*monitor, std::format("ok-{}", i));
  monitor->flush();

  EXPECT_FALSE(monitor->detect_drift(Provider::OpenAI, "gpt-4o-mini").drift_detected);
  EXPECT_DOUBLE_EQ(
      monitor->calibration().snapshot()->find(Provider::OpenAI, "gpt-4o-mini")->drift_penalty, 0.0);
  for (const auto& a : monitor->alerts().alerts(true)) {
    EXPECT_NE(a.type, AlertType::DriftDetected);
  }
}

TEST_F(AccuracyMonitorTest, ExplicitBaseline) {
  auto monitor = Make();
  AccuracyMetrics baseline;
  baseline.overall_accuracy = 0.99;
  baseline.sample_size = 100;
  monitor->set_baseline(Provider::Google, "gemini-1.5-pro", baseline);
  EXPECT_DOUBLE_EQ(monitor->baseline(Provider::Google, "gemini-1.5-pro")->overall_accuracy, 0.99);
}

// ============================================================================
// Comparison and Insights
// ============================================================================

TEST_F(AccuracyMonitorTest, CompareModels) {
  auto monitor = Make();
  EXPECT_EQ(monitor
                ->compare_models(Provider::OpenAI, "gpt-4o-mini", Provider::Google,
                                 "gemini-1.5-flash")
                .recommendation,
            ComparisonRecommendation::InsufficientData);

  for (int i = 0; i < 15; ++i) {
    Exchange(*monitor, std::format("a-{}", i), 0.003, 1000.0);
    Exchange(*monitor, std::format("b-{}", i), 0.001, 1000.0, Provider::Google,
             "gemini-1.5-flash");
  }
  monitor->flush();

  auto cmp = monitor->compare_models(Provider::OpenAI, "gpt-4o-mini", Provider::Google,
                                     "gemini-1.5-flash");
  EXPECT_EQ(cmp.recommendation, ComparisonRecommendation::PreferComparison);
  EXPECT_GT(cmp.difference, 0.0);
  EXPECT_EQ(to_string(cmp.recommendation), "prefer_comparison");

  auto same = monitor->compare_models(Provider::OpenAI, "gpt-4o-mini", Provider::OpenAI,
                                      "gpt-4o-mini");
  EXPECT_EQ(same.recommendation, ComparisonRecommendation::Equivalent);
}

TEST_F(AccuracyMonitorTest, InsightsRankPairs) {
  auto monitor = Make();
  for (int i = 0; i < 5; ++i) {
    Exchange(*monitor, std::format("a-{}", i), 0.002, 1000.0);
    Exchange(*monitor, std::format("b-{}", i), 0.001, 1000.0, Provider::Google,
             "gemini-1.5-flash");
  }
  monitor->flush();

  auto insights = monitor->insights();
  EXPECT_EQ(insights.models_tracked, 2u);
  EXPECT_EQ(insights.outcomes_analyzed, 10u);
  ASSERT_EQ(insights.top_performers.size(), 2u);
  EXPECT_EQ(insights.top_performers.front().key, "google/gemini-1.5-flash");
  EXPECT_EQ(insights.performance.requests, 10u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(AccuracyMonitorTest, CheckpointRestoresIntoFreshMonitor) {
  auto monitor = Make();
  for (int i = 0; i < 20; ++i) Exchange(*monitor, std::format("req-{}", i), 0.0012, 1100.0);
  monitor->flush();
  auto cp = monitor->checkpoint();
  ASSERT_EQ(cp.baselines.size(), 1u);

  auto fresh = Make();
  fresh->restore(CalibrationCheckpoint::from_msgpack_string(cp.to_msgpack_string()));

  auto restored = fresh->calibration().snapshot()->find(Provider::OpenAI, "gpt-4o-mini");
  ASSERT_NE(restored, nullptr);
  EXPECT_DOUBLE_EQ(restored->cost_factor,
                   monitor->calibration().snapshot()->find(Provider::OpenAI, "gpt-4o-mini")
                       ->cost_factor);
  EXPECT_TRUE(fresh->baseline(Provider::OpenAI, "gpt-4o-mini").has_value());
}

// ============================================================================
// Worker Thread
// ============================================================================

TEST_F(AccuracyMonitorTest, ConcurrentOutcomesAreEachRecordedOnce) {
  auto options = Inline();
  options.start_worker = true;
  auto monitor = Make(options);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i < kPerThread; ++i) {
      monitor->register_prediction(std::format("req-{}-{}", t, i), Prediction());
    }
  }

  std::atomic<int> accepted{0};
  std::atomic<int> duplicates{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        // Every id is submitted twice from two different threads
        for (int owner : {t, (t + 1) % kThreads}) {
          auto r = monitor->record_outcome(Outcome(std::format("req-{}-{}", owner, i)));
          if (r.has_value()) {
            ++accepted;
          } else if (r.error().code == ErrorCode::DuplicateOutcome) {
            ++duplicates;
          }
        }
      }
    });
  }
  for (auto& th : threads) th.join();
  monitor->flush();

  EXPECT_EQ(accepted.load(), kThreads * kPerThread);
  EXPECT_EQ(duplicates.load(), kThreads * kPerThread);
  EXPECT_EQ(monitor->stats().processed, static_cast<std::uint64_t>(kThreads * kPerThread));
}
