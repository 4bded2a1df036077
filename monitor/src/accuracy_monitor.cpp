#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <switchboard/common/logging.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/monitor/accuracy_monitor.hpp>

namespace switchboard {

  namespace {

    constexpr double kMaxDriftPenalty = 0.5;
    constexpr size_t kTopPerformers = 5;

    Severity degradation_severity(double accuracy, double threshold) noexcept {
      const double gap = threshold - accuracy;
      if (gap > 0.3) return Severity::Critical;
      if (gap > 0.15) return Severity::High;
      if (gap > 0.05) return Severity::Medium;
      return Severity::Low;
    }

  }  // namespace

  std::string_view to_string(ComparisonRecommendation r) noexcept {
    switch (r) {
      case ComparisonRecommendation::PreferBaseline:
        return "prefer_baseline";
      case ComparisonRecommendation::PreferComparison:
        return "prefer_comparison";
      case ComparisonRecommendation::Equivalent:
        return "equivalent";
      case ComparisonRecommendation::InsufficientData:
        return "insufficient_data";
    }
    return "unknown";
  }

  AccuracyMonitor::AccuracyMonitor(MonitorOptions options, std::shared_ptr<const Clock> clock)
      : options_(std::move(options)),
        clock_(std::move(clock)),
        calibration_(options_.calibration),
        alerts_(options_.alert_cooldown, clock_, options_.max_alerts),
        performance_(options_.thresholds, clock_, options_.max_history),
        sampler_(options_.sampling, clock_) {
    if (options_.max_history == 0) throw std::invalid_argument("max_history must be positive");
    if (options_.queue_capacity == 0) {
      throw std::invalid_argument("queue_capacity must be positive");
    }
    if (options_.drift_window == 0 || options_.baseline_window == 0) {
      throw std::invalid_argument("drift_window and baseline_window must be positive");
    }
    if (options_.max_tracked_outcomes == 0) {
      throw std::invalid_argument("max_tracked_outcomes must be positive");
    }
    if (options_.default_quality < 0.0 || options_.default_quality > 1.0) {
      throw std::invalid_argument(
          std::format("default_quality must be within [0, 1], got {}", options_.default_quality));
    }
    if (options_.start_worker) {
      worker_ = std::jthread([this](std::stop_token token) { run(token); });
    }
  }

  AccuracyMonitor::~AccuracyMonitor() {
    if (worker_.joinable()) {
      worker_.request_stop();
      worker_.join();
    }
  }

  // ============================================================================
  // Intake
  // ============================================================================

  void AccuracyMonitor::register_prediction(const std::string& request_id,
                                            CandidatePrediction prediction) {
    std::lock_guard lock(state_mutex_);
    if (auto it = pending_.find(request_id); it != pending_.end()) {
      it->second.prediction = std::move(prediction);
      return;
    }

    const auto seq = next_seq_++;
    pending_.emplace(request_id, PendingPrediction{.prediction = std::move(prediction), .seq = seq});
    pending_order_.emplace_back(request_id, seq);

    auto live = [this](const std::pair<std::string, std::uint64_t>& entry) {
      auto it = pending_.find(entry.first);
      return it != pending_.end() && it->second.seq == entry.second;
    };
    while (pending_.size() > options_.max_tracked_outcomes) {
      if (live(pending_order_.front())) pending_.erase(pending_order_.front().first);
      pending_order_.pop_front();
    }
    if (pending_order_.size() > 2 * options_.max_tracked_outcomes) {
      std::erase_if(pending_order_, [&](const auto& entry) { return !live(entry); });
    }
  }

  void AccuracyMonitor::remember_locked(const std::string& request_id) {
    recorded_.insert(request_id);
    recorded_order_.push_back(request_id);
    while (recorded_order_.size() > options_.max_tracked_outcomes) {
      recorded_.erase(recorded_order_.front());
      recorded_order_.pop_front();
    }
  }

  Result<OutcomeReceipt, RoutingError> AccuracyMonitor::record_outcome(ExecutionOutcome outcome) {
    SWITCHBOARD_ZONE;
    if (outcome.timestamp == SystemTime{}) outcome.timestamp = clock_->now();

    CandidatePrediction prediction;
    {
      std::lock_guard lock(state_mutex_);
      if (recorded_.contains(outcome.request_id)) {
        ++duplicates_;
        return Unexpected(make_error(
            ErrorCode::DuplicateOutcome,
            std::format("outcome for request '{}' was already recorded", outcome.request_id)));
      }
      auto it = pending_.find(outcome.request_id);
      if (it == pending_.end()) {
        ++unknown_;
        return Unexpected(make_error(
            ErrorCode::UnknownRequest,
            std::format("no prediction registered for request '{}'", outcome.request_id)));
      }
      prediction = std::move(it->second.prediction);
      pending_.erase(it);
      remember_locked(outcome.request_id);
      ++received_;
    }

    performance_.record_request(outcome.latency_ms, outcome.success);

    OutcomeReceipt receipt{.request_id = outcome.request_id, .sampled = false};
    if (!sampler_.should_sample(outcome)) {
      std::lock_guard lock(state_mutex_);
      ++sampled_out_;
      return receipt;
    }
    receipt.sampled = true;

    {
      std::lock_guard lock(queue_mutex_);
      if (queue_.size() >= options_.queue_capacity) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(WorkItem{.prediction = std::move(prediction), .outcome = std::move(outcome)});
    }
    queue_cv_.notify_one();
    return receipt;
  }

  // ============================================================================
  // Worker
  // ============================================================================

  void AccuracyMonitor::run(std::stop_token token) {
    while (!token.stop_requested()) {
      WorkItem item;
      {
        std::unique_lock lock(queue_mutex_);
        if (!queue_cv_.wait(lock, token, [this] { return !queue_.empty(); })) break;
        item = std::move(queue_.front());
        queue_.pop_front();
        ++in_flight_;
      }

      process(item);

      {
        std::lock_guard lock(queue_mutex_);
        --in_flight_;
      }
      idle_cv_.notify_all();
    }
  }

  void AccuracyMonitor::drain() {
    for (;;) {
      WorkItem item;
      {
        std::lock_guard lock(queue_mutex_);
        if (queue_.empty()) return;
        item = std::move(queue_.front());
        queue_.pop_front();
      }
      process(item);
    }
  }

  void AccuracyMonitor::flush() {
    if (!worker_.joinable()) {
      drain();
      return;
    }
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
  }

  AccuracyMonitor::PairState& AccuracyMonitor::pair_locked(Provider provider,
                                                           const std::string& model) {
    auto key = calibration_key(provider, model);
    auto it = pairs_.find(key);
    if (it == pairs_.end()) {
      it = pairs_
               .emplace(std::move(key), PairState{.provider = provider,
                                                  .model = model,
                                                  .window = AccuracyWindow(options_.max_history),
                                                  .baseline = std::nullopt})
               .first;
    }
    return it->second;
  }

  void AccuracyMonitor::process(const WorkItem& item) {
    SWITCHBOARD_ZONE;
    const auto& outcome = item.outcome;
    const auto& prediction = item.prediction;

    try {
      const double quality = outcome.quality_score.value_or(
          outcome.success ? options_.default_quality : 0.0);
      const AccuracySample sample = score_sample(prediction, outcome, quality);
      const auto& thresholds = options_.thresholds;

      std::vector<AlertSpec> to_raise;
      bool recovered = false;
      bool check_drift = false;
      {
        std::lock_guard lock(state_mutex_);
        auto& pair = pair_locked(outcome.provider, outcome.model);
        pair.window.push(sample);
        ++processed_;

        if (!pair.baseline && pair.window.size() >= options_.baseline_window) {
          pair.baseline = pair.window.metrics();
          logger()->info("captured accuracy baseline for {}/{} ({:.3f} over {} samples)",
                         to_string(outcome.provider), outcome.model,
                         pair.baseline->overall_accuracy, pair.baseline->sample_size);
        }

        const auto current = pair.window.metrics();
        if (current.sample_size >= options_.drift.min_sample_size) {
          if (current.overall_accuracy < thresholds.min_accuracy) {
            to_raise.push_back(AlertSpec{
                .type = AlertType::AccuracyDegradation,
                .severity = degradation_severity(current.overall_accuracy, thresholds.min_accuracy),
                .provider = outcome.provider,
                .model = outcome.model,
                .message = std::format("prediction accuracy {:.1f}% below {:.1f}% for {}/{}",
                                       current.overall_accuracy * 100.0,
                                       thresholds.min_accuracy * 100.0,
                                       to_string(outcome.provider), outcome.model),
                .value = current.overall_accuracy,
                .threshold = thresholds.min_accuracy});
          } else {
            recovered = true;
          }
        }
        check_drift = pair.baseline.has_value();
      }

      // Calibration only learns from outcomes served by the predicted pair
      if (sample.selection_match) {
        calibration_.observe(prediction, outcome, quality, sample.quality_accuracy);
      }
      performance_.record_accuracy(sample.overall);

      if (outcome.latency_ms > thresholds.max_response_time_ms) {
        to_raise.push_back(AlertSpec{
            .type = AlertType::PerformanceAnomaly,
            .severity = outcome.latency_ms > 2.0 * thresholds.max_response_time_ms
                            ? Severity::High
                            : Severity::Medium,
            .provider = outcome.provider,
            .model = outcome.model,
            .message = std::format("latency spike {:.0f}ms exceeds {:.0f}ms", outcome.latency_ms,
                                   thresholds.max_response_time_ms),
            .value = outcome.latency_ms,
            .threshold = thresholds.max_response_time_ms});
      }

      const auto perf = performance_.snapshot();
      if (perf.requests >= options_.drift.min_sample_size
          && perf.error_rate > thresholds.max_error_rate) {
        to_raise.push_back(AlertSpec{
            .type = AlertType::PerformanceAnomaly,
            .severity = perf.error_rate > 2.0 * thresholds.max_error_rate ? Severity::Critical
                                                                           : Severity::High,
            .provider = outcome.provider,
            .model = outcome.model,
            .message = std::format("error rate {:.1f}% exceeds {:.1f}%", perf.error_rate * 100.0,
                                   thresholds.max_error_rate * 100.0),
            .value = perf.error_rate,
            .threshold = thresholds.max_error_rate});
      }

      for (auto& spec : to_raise) alerts_.raise(std::move(spec));
      if (recovered) {
        alerts_.resolve_matching(AlertType::AccuracyDegradation, outcome.provider, outcome.model);
      }
      if (check_drift) (void)detect_drift(outcome.provider, outcome.model);
    } catch (const std::exception& e) {
      logger()->error("monitor failed to process outcome for request '{}': {}",
                      outcome.request_id, e.what());
    }
  }

  // ============================================================================
  // Drift
  // ============================================================================

  DriftDetectionResult AccuracyMonitor::detect_drift(Provider provider, const std::string& model) {
    SWITCHBOARD_ZONE;
    DriftDetectionResult result;
    {
      std::lock_guard lock(state_mutex_);
      auto it = pairs_.find(calibration_key(provider, model));
      if (it == pairs_.end() || !it->second.baseline) {
        result.provider = provider;
        result.model = model;
        if (it != pairs_.end()) result.current = it->second.window.metrics();
        return result;
      }
      const auto& pair = it->second;
      result = evaluate_drift(provider, model, *pair.baseline,
                              pair.window.recent_metrics(options_.drift_window), options_.drift);
    }
    apply_drift(result);
    return result;
  }

  void AccuracyMonitor::apply_drift(const DriftDetectionResult& result) {
    if (!result.drift_detected) {
      if (result.current.sample_size >= options_.drift.min_sample_size) {
        calibration_.set_drift_penalty(result.provider, result.model, 0.0);
        alerts_.resolve_matching(AlertType::DriftDetected, result.provider, result.model);
      }
      return;
    }

    const bool degraded = result.current.overall_accuracy < result.baseline.overall_accuracy;
    if (result.action == DriftAction::Fallback && degraded) {
      calibration_.set_drift_penalty(result.provider, result.model,
                                     std::min(kMaxDriftPenalty, result.magnitude * 2.0));
    }

    Severity severity = Severity::Low;
    switch (result.action) {
      case DriftAction::Fallback:
        severity = Severity::Critical;
        break;
      case DriftAction::Alert:
        severity = Severity::High;
        break;
      case DriftAction::Investigate:
        severity = Severity::Medium;
        break;
      case DriftAction::Monitor:
        break;
    }

    std::string affected;
    for (const auto& m : result.affected_metrics) {
      if (!affected.empty()) affected += ", ";
      affected += m;
    }
    alerts_.raise(AlertSpec{
        .type = AlertType::DriftDetected,
        .severity = severity,
        .provider = result.provider,
        .model = result.model,
        .message = std::format("accuracy drifted {:.1f}% from baseline ({}); action {}",
                               result.magnitude * 100.0, affected.empty() ? "overall" : affected,
                               to_string(result.action)),
        .value = result.magnitude,
        .threshold = options_.drift.drift_threshold});
  }

  // ============================================================================
  // Queries
  // ============================================================================

  std::optional<AccuracyMetrics> AccuracyMonitor::metrics(Provider provider,
                                                          const std::string& model) const {
    std::lock_guard lock(state_mutex_);
    auto it = pairs_.find(calibration_key(provider, model));
    if (it == pairs_.end() || it->second.window.empty()) return std::nullopt;
    return it->second.window.metrics();
  }

  std::map<std::string, AccuracyMetrics> AccuracyMonitor::all_metrics() const {
    std::lock_guard lock(state_mutex_);
    std::map<std::string, AccuracyMetrics> out;
    for (const auto& [key, pair] : pairs_) {
      if (!pair.window.empty()) out.emplace(key, pair.window.metrics());
    }
    return out;
  }

  void AccuracyMonitor::set_baseline(Provider provider, const std::string& model,
                                     AccuracyMetrics baseline) {
    std::lock_guard lock(state_mutex_);
    pair_locked(provider, model).baseline = baseline;
  }

  std::optional<AccuracyMetrics> AccuracyMonitor::baseline(Provider provider,
                                                           const std::string& model) const {
    std::lock_guard lock(state_mutex_);
    auto it = pairs_.find(calibration_key(provider, model));
    if (it == pairs_.end()) return std::nullopt;
    return it->second.baseline;
  }

  ModelComparison AccuracyMonitor::compare_models(Provider baseline_provider,
                                                  const std::string& baseline_model,
                                                  Provider comparison_provider,
                                                  const std::string& comparison_model) const {
    ModelComparison cmp;
    cmp.baseline_key = calibration_key(baseline_provider, baseline_model);
    cmp.comparison_key = calibration_key(comparison_provider, comparison_model);
    cmp.baseline = metrics(baseline_provider, baseline_model).value_or(AccuracyMetrics{});
    cmp.comparison = metrics(comparison_provider, comparison_model).value_or(AccuracyMetrics{});

    const size_t min_n = options_.drift.min_sample_size;
    if (cmp.baseline.sample_size < min_n || cmp.comparison.sample_size < min_n) return cmp;

    cmp.difference = cmp.comparison.overall_accuracy - cmp.baseline.overall_accuracy;
    cmp.significance = two_sample_significance(
        cmp.baseline.overall_accuracy, cmp.baseline.overall_stddev, cmp.baseline.sample_size,
        cmp.comparison.overall_accuracy, cmp.comparison.overall_stddev,
        cmp.comparison.sample_size);

    if (cmp.significance >= options_.drift.confidence_level
        && std::abs(cmp.difference) > options_.drift.drift_threshold) {
      cmp.recommendation = cmp.difference > 0.0 ? ComparisonRecommendation::PreferComparison
                                                : ComparisonRecommendation::PreferBaseline;
    } else {
      cmp.recommendation = ComparisonRecommendation::Equivalent;
    }
    return cmp;
  }

  MonitoringInsights AccuracyMonitor::insights() const {
    MonitoringInsights out;
    std::vector<PairAccuracy> pairs;
    {
      std::lock_guard lock(state_mutex_);
      out.outcomes_analyzed = processed_;
      for (const auto& [key, pair] : pairs_) {
        if (pair.window.empty()) continue;
        pairs.push_back(PairAccuracy{.key = key, .metrics = pair.window.metrics()});
      }
    }

    out.models_tracked = pairs.size();
    double weighted = 0.0;
    size_t total = 0;
    for (const auto& p : pairs) {
      weighted += p.metrics.overall_accuracy * static_cast<double>(p.metrics.sample_size);
      total += p.metrics.sample_size;
    }
    out.overall_accuracy = total == 0 ? 0.0 : weighted / static_cast<double>(total);

    std::ranges::sort(pairs, [](const PairAccuracy& a, const PairAccuracy& b) {
      if (a.metrics.overall_accuracy != b.metrics.overall_accuracy) {
        return a.metrics.overall_accuracy > b.metrics.overall_accuracy;
      }
      return a.key < b.key;
    });
    if (pairs.size() > kTopPerformers) pairs.resize(kTopPerformers);
    out.top_performers = std::move(pairs);

    out.alerts = alerts_.summary();
    out.performance = performance_.snapshot();
    return out;
  }

  MonitorStats AccuracyMonitor::stats() const {
    MonitorStats s;
    {
      std::lock_guard lock(state_mutex_);
      s.received = received_;
      s.processed = processed_;
      s.sampled_out = sampled_out_;
      s.duplicates = duplicates_;
      s.unknown = unknown_;
    }
    {
      std::lock_guard lock(queue_mutex_);
      s.queue_size = queue_.size() + in_flight_;
      s.dropped = dropped_;
    }
    s.calibration_version = calibration_.snapshot()->version;
    return s;
  }

  void AccuracyMonitor::record_routing_latency(double latency_ms) {
    performance_.record_routing_latency(latency_ms);
  }

  // ============================================================================
  // Persistence
  // ============================================================================

  CalibrationCheckpoint AccuracyMonitor::checkpoint() const {
    CalibrationCheckpoint cp;
    cp.entries = calibration_.snapshot()->entries;
    std::lock_guard lock(state_mutex_);
    for (const auto& [key, pair] : pairs_) {
      if (pair.baseline) cp.baselines.emplace(key, *pair.baseline);
    }
    return cp;
  }

  void AccuracyMonitor::restore(const CalibrationCheckpoint& checkpoint) {
    checkpoint.validate();

    CalibrationSnapshot snapshot;
    snapshot.entries = checkpoint.entries;
    calibration_.replace(std::move(snapshot));

    std::lock_guard lock(state_mutex_);
    for (const auto& [key, metrics] : checkpoint.baselines) {
      auto [provider, model] = parse_calibration_key(key);
      pair_locked(provider, model).baseline = metrics;
    }
    logger()->info("restored calibration for {} pairs and {} baselines",
                   checkpoint.entries.size(), checkpoint.baselines.size());
  }

}  // namespace switchboard
