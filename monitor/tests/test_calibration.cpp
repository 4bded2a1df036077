#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <string>
#include <switchboard/monitor/calibration.hpp>

#pragma GCC diagnostic ignored "-Wunused-result"

using namespace switchboard;

// ============================================================================
// Test Fixture
// ============================================================================

class CalibrationTest : public ::testing::Test {
protected:
  static CandidatePrediction Prediction(double cost, double latency, double quality = 0.8) {
    CandidatePrediction p;
    p.provider = Provider::Anthropic;
    p.model = "claude-3-5-haiku";
    p.predicted_cost = cost;
    p.predicted_latency_ms = latency;
    p.predicted_quality = quality;
    return p;
  }

  static ExecutionOutcome Outcome(double cost, double latency, bool success = true) {
    ExecutionOutcome o;
    o.request_id = "req-1";
    o.provider = Provider::Anthropic;
    o.model = "claude-3-5-haiku";
    o.cost = cost;
    o.latency_ms = latency;
    o.success = success;
    return o;
  }

  static CalibrationCheckpoint SampleCheckpoint() {
    CalibrationCheckpoint cp;
    cp.entries["anthropic/claude-3-5-haiku"] = CalibrationEntry{.cost_factor = 1.2,
                                                                .latency_factor = 0.8,
                                                                .learned_quality = 0.82,
                                                                .quality_accuracy = 0.9,
                                                                .samples = 42,
                                                                .drift_penalty = 0.1};
    cp.entries["ollama/llama3.1"] = CalibrationEntry{};
    AccuracyMetrics baseline;
    baseline.overall_accuracy = 0.93;
    baseline.overall_stddev = 0.04;
    baseline.cost_accuracy = 0.9;
    baseline.sample_size = 50;
    cp.baselines["openai/gpt-4o-mini"] = baseline;
    return cp;
  }
};

// ============================================================================
// Keys
// ============================================================================

TEST_F(CalibrationTest, KeyRoundTrip) {
  EXPECT_EQ(calibration_key(Provider::Google, "gemini-1.5-pro"), "google/gemini-1.5-pro");
  auto [provider, model] = parse_calibration_key("ollama/library/llama3");
  EXPECT_EQ(provider, Provider::Ollama);
  EXPECT_EQ(model, "library/llama3");
  EXPECT_THROW(parse_calibration_key("nomodel"), std::invalid_argument);
  EXPECT_THROW(parse_calibration_key("acme/model"), std::invalid_argument);
  EXPECT_THROW(parse_calibration_key("openai/"), std::invalid_argument);
}

// ============================================================================
// CalibrationTable
// ============================================================================

TEST_F(CalibrationTest, RejectsInvalidOptions) {
  EXPECT_THROW(CalibrationTable(CalibrationOptions{.learning_rate = 0.0}), std::invalid_argument);
  EXPECT_THROW(CalibrationTable(CalibrationOptions{.min_factor = 2.0, .max_factor = 1.0}),
               std::invalid_argument);
}

TEST_F(CalibrationTest, FactorsMoveOneStepTowardObservedRatio) {
  CalibrationTable table;
  table.observe(Prediction(0.001, 1000), Outcome(0.002, 500), 0.9, 0.9);

  auto snap = table.snapshot();
  const auto* entry = snap->find(Provider::Anthropic, "claude-3-5-haiku");
  ASSERT_NE(entry, nullptr);
  EXPECT_NEAR(entry->cost_factor, 0.9 + 0.1 * 2.0, 1e-12);
  EXPECT_NEAR(entry->latency_factor, 0.9 + 0.1 * 0.5, 1e-12);
  EXPECT_NEAR(*entry->learned_quality, 0.9 * 0.8 + 0.1 * 0.9, 1e-12);
  EXPECT_EQ(entry->samples, 1u);
  EXPECT_EQ(snap->version, 1u);
}

TEST_F(CalibrationTest, RepeatedObservationsConverge) {
  CalibrationTable table;
  for (int i = 0; i < 200; ++i) {
    const double f = table.snapshot()->entries.empty()
                         ? 1.0
                         : table.snapshot()->entries.begin()->second.cost_factor;
    table.observe(Prediction(0.001 * f, 1000), Outcome(0.003, 1000), std::nullopt, 1.0);
  }
  EXPECT_NEAR(table.snapshot()->find(Provider::Anthropic, "claude-3-5-haiku")->cost_factor, 3.0,
              0.01);
}

TEST_F(CalibrationTest, FailuresDoNotMoveFactors) {
  CalibrationTable table;
  table.observe(Prediction(0.001, 1000), Outcome(0.0, 30000, false), 0.0, 0.2);
  const auto* entry = table.snapshot()->find(Provider::Anthropic, "claude-3-5-haiku");
  ASSERT_NE(entry, nullptr);
  EXPECT_DOUBLE_EQ(entry->cost_factor, 1.0);
  EXPECT_DOUBLE_EQ(entry->latency_factor, 1.0);
  EXPECT_FALSE(entry->learned_quality.has_value());
  EXPECT_DOUBLE_EQ(entry->quality_accuracy, 0.2);
}

TEST_F(CalibrationTest, FactorsAreClamped) {
  CalibrationTable table(CalibrationOptions{.learning_rate = 1.0, .max_factor = 4.0});
  table.observe(Prediction(0.001, 100), Outcome(1.0, 100000), std::nullopt, 1.0);
  const auto* entry = table.snapshot()->find(Provider::Anthropic, "claude-3-5-haiku");
  EXPECT_DOUBLE_EQ(entry->cost_factor, 4.0);
  EXPECT_DOUBLE_EQ(entry->latency_factor, 4.0);
}

TEST_F(CalibrationTest, SnapshotsAreImmutable) {
  CalibrationTable table;
  auto before = table.snapshot();
  table.set_drift_penalty(Provider::Anthropic, "claude-3-5-haiku", 0.3);
  auto after = table.snapshot();

  EXPECT_EQ(before->find(Provider::Anthropic, "claude-3-5-haiku"), nullptr);
  EXPECT_DOUBLE_EQ(after->find(Provider::Anthropic, "claude-3-5-haiku")->drift_penalty, 0.3);
  EXPECT_GT(after->version, before->version);

  // Same penalty again publishes nothing
  table.set_drift_penalty(Provider::Anthropic, "claude-3-5-haiku", 0.3);
  EXPECT_EQ(table.snapshot()->version, after->version);
}

// ============================================================================
// Checkpoint Serialization
// ============================================================================

TEST_F(CalibrationTest, JsonRoundTrip) {
  auto cp = SampleCheckpoint();
  auto restored = CalibrationCheckpoint::from_json_string(cp.to_json_string());

  ASSERT_EQ(restored.entries.size(), 2u);
  const auto& e = restored.entries.at("anthropic/claude-3-5-haiku");
  EXPECT_DOUBLE_EQ(e.cost_factor, 1.2);
  EXPECT_DOUBLE_EQ(*e.learned_quality, 0.82);
  EXPECT_EQ(e.samples, 42u);
  EXPECT_FALSE(restored.entries.at("ollama/llama3.1").learned_quality.has_value());
  EXPECT_DOUBLE_EQ(restored.baselines.at("openai/gpt-4o-mini").overall_accuracy, 0.93);
  EXPECT_EQ(restored.baselines.at("openai/gpt-4o-mini").sample_size, 50u);
}

TEST_F(CalibrationTest, MsgpackMatchesJson) {
  auto cp = SampleCheckpoint();
  auto from_msgpack = CalibrationCheckpoint::from_msgpack_string(cp.to_msgpack_string());
  EXPECT_EQ(from_msgpack.to_json_string(), cp.to_json_string());
}

TEST_F(CalibrationTest, FileRoundTrip) {
  auto dir = std::filesystem::temp_directory_path();
  auto json_path = (dir / "switchboard_calibration_test.json").string();
  auto msgpack_path = (dir / "switchboard_calibration_test.msgpack").string();

  auto cp = SampleCheckpoint();
  cp.to_json(json_path);
  cp.to_msgpack(msgpack_path);

  EXPECT_EQ(CalibrationCheckpoint::from_json(json_path).entries.size(), 2u);
  EXPECT_EQ(CalibrationCheckpoint::from_msgpack(msgpack_path).baselines.size(), 1u);

  std::remove(json_path.c_str());
  std::remove(msgpack_path.c_str());
}

TEST_F(CalibrationTest, MissingFileThrows) {
  EXPECT_THROW(CalibrationCheckpoint::from_json("/nonexistent/calibration.json"),
               std::runtime_error);
  EXPECT_THROW(CalibrationCheckpoint::from_msgpack("/nonexistent/calibration.msgpack"),
               std::runtime_error);
}

TEST_F(CalibrationTest, ValidateRejectsBadState) {
  auto bad_factor = SampleCheckpoint();
  bad_factor.entries["openai/gpt-4o"].cost_factor = 0.0;
  EXPECT_THROW(bad_factor.validate(), std::invalid_argument);

  auto bad_penalty = SampleCheckpoint();
  bad_penalty.entries["openai/gpt-4o"].drift_penalty = 1.0;
  EXPECT_THROW(bad_penalty.validate(), std::invalid_argument);

  auto bad_key = SampleCheckpoint();
  bad_key.entries["mystery"] = CalibrationEntry{};
  EXPECT_THROW(bad_key.validate(), std::invalid_argument);

  auto bad_version = SampleCheckpoint();
  bad_version.version = "9.9";
  EXPECT_THROW(bad_version.validate(), std::invalid_argument);
}
