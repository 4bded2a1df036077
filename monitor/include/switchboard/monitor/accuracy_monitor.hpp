#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_metrics.hpp>
#include <switchboard/monitor/alerts.hpp>
#include <switchboard/monitor/calibration.hpp>
#include <switchboard/monitor/drift.hpp>
#include <switchboard/monitor/performance.hpp>
#include <switchboard/monitor/sampling.hpp>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace switchboard {

  struct MonitorOptions {
    PerformanceThresholds thresholds;
    DriftOptions drift;
    CalibrationOptions calibration;
    SamplingOptions sampling;
    std::chrono::milliseconds alert_cooldown{300000};
    size_t max_history = 1000;       // per (provider, model) window
    size_t baseline_window = 50;     // samples before a baseline is captured automatically
    size_t drift_window = 50;        // most recent samples compared against the baseline
    size_t queue_capacity = 10000;   // drop-oldest beyond this
    // Registered predictions and recorded request ids kept for matching and duplicate checks.
    // An id evicted past this bound is answered as unknown rather than duplicate; either way
    // the outcome is rejected.
    size_t max_tracked_outcomes = 100000;
    size_t max_alerts = 1000;
    double default_quality = 0.7;    // successful outcome without a quality score
    bool start_worker = true;        // false: outcomes are processed by flush()
  };

  struct OutcomeReceipt {
    std::string request_id;
    bool sampled = false;
  };

  enum class ComparisonRecommendation { PreferBaseline, PreferComparison, Equivalent, InsufficientData };

  [[nodiscard]] std::string_view to_string(ComparisonRecommendation r) noexcept;

  struct ModelComparison {
    std::string baseline_key;
    std::string comparison_key;
    AccuracyMetrics baseline;
    AccuracyMetrics comparison;
    double difference = 0.0;  // comparison - baseline overall accuracy
    double significance = 0.0;
    ComparisonRecommendation recommendation = ComparisonRecommendation::InsufficientData;
  };

  struct PairAccuracy {
    std::string key;
    AccuracyMetrics metrics;
  };

  struct MonitoringInsights {
    size_t models_tracked = 0;
    std::uint64_t outcomes_analyzed = 0;
    double overall_accuracy = 0.0;
    AlertSummary alerts;
    std::vector<PairAccuracy> top_performers;  // best overall accuracy first, at most 5
    PerformanceSnapshot performance;
  };

  /// Monitoring overhead counters
  struct MonitorStats {
    size_t queue_size = 0;
    std::uint64_t received = 0;
    std::uint64_t processed = 0;
    std::uint64_t dropped = 0;
    std::uint64_t sampled_out = 0;
    std::uint64_t duplicates = 0;
    std::uint64_t unknown = 0;
    std::uint64_t calibration_version = 0;
  };

  /**
   * Prediction accuracy monitor.
   *
   * record_outcome() does only the idempotency check and sampling on the caller's thread;
   * scoring, calibration, drift and alerting run on a worker behind a bounded queue.
   * Failures inside processing are logged and never reach the caller.
   */
  class AccuracyMonitor {
  public:
    explicit AccuracyMonitor(MonitorOptions options = {},
                             std::shared_ptr<const Clock> clock = make_system_clock());
    ~AccuracyMonitor();

    AccuracyMonitor(const AccuracyMonitor&) = delete;
    AccuracyMonitor& operator=(const AccuracyMonitor&) = delete;
    AccuracyMonitor(AccuracyMonitor&&) = delete;
    AccuracyMonitor& operator=(AccuracyMonitor&&) = delete;

    void register_prediction(const std::string& request_id, CandidatePrediction prediction);

    /// DuplicateOutcome for a repeated request id, UnknownRequest when nothing was predicted
    [[nodiscard]] Result<OutcomeReceipt, RoutingError> record_outcome(ExecutionOutcome outcome);

    /// Blocks until every queued outcome has been processed
    void flush();

    [[nodiscard]] std::optional<AccuracyMetrics> metrics(Provider provider,
                                                         const std::string& model) const;
    [[nodiscard]] std::map<std::string, AccuracyMetrics> all_metrics() const;

    DriftDetectionResult detect_drift(Provider provider, const std::string& model);

    void set_baseline(Provider provider, const std::string& model, AccuracyMetrics baseline);
    [[nodiscard]] std::optional<AccuracyMetrics> baseline(Provider provider,
                                                          const std::string& model) const;

    [[nodiscard]] ModelComparison compare_models(Provider baseline_provider,
                                                 const std::string& baseline_model,
                                                 Provider comparison_provider,
                                                 const std::string& comparison_model) const;

    [[nodiscard]] MonitoringInsights insights() const;
    [[nodiscard]] MonitorStats stats() const;

    void record_routing_latency(double latency_ms);

    [[nodiscard]] CalibrationCheckpoint checkpoint() const;
    void restore(const CalibrationCheckpoint& checkpoint);

    [[nodiscard]] const CalibrationTable& calibration() const noexcept { return calibration_; }
    [[nodiscard]] AlertManager& alerts() noexcept { return alerts_; }
    [[nodiscard]] const AlertManager& alerts() const noexcept { return alerts_; }
    [[nodiscard]] const PerformanceTracker& performance() const noexcept { return performance_; }
    [[nodiscard]] const MonitorOptions& options() const noexcept { return options_; }

  private:
    struct WorkItem {
      CandidatePrediction prediction;
      ExecutionOutcome outcome;
    };

    struct PairState {
      Provider provider;
      std::string model;
      AccuracyWindow window;
      std::optional<AccuracyMetrics> baseline;
    };

    void run(std::stop_token token);
    void drain();
    void process(const WorkItem& item);
    void apply_drift(const DriftDetectionResult& result);

    PairState& pair_locked(Provider provider, const std::string& model);
    void remember_locked(const std::string& request_id);

    MonitorOptions options_;
    std::shared_ptr<const Clock> clock_;
    CalibrationTable calibration_;
    AlertManager alerts_;
    PerformanceTracker performance_;
    Sampler sampler_;

    mutable std::mutex state_mutex_;
    std::map<std::string, PairState> pairs_;
    struct PendingPrediction {
      CandidatePrediction prediction;
      std::uint64_t seq = 0;
    };

    // pending_order_ may hold recorded ids; entries whose seq no longer matches are stale
    std::unordered_map<std::string, PendingPrediction> pending_;
    std::deque<std::pair<std::string, std::uint64_t>> pending_order_;
    std::uint64_t next_seq_ = 0;
    std::unordered_set<std::string> recorded_;
    std::deque<std::string> recorded_order_;
    std::uint64_t received_ = 0;
    std::uint64_t processed_ = 0;
    std::uint64_t sampled_out_ = 0;
    std::uint64_t duplicates_ = 0;
    std::uint64_t unknown_ = 0;

    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::deque<WorkItem> queue_;
    size_t in_flight_ = 0;
    std::uint64_t dropped_ = 0;

    std::jthread worker_;
  };

}  // namespace switchboard
