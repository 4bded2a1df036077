#include <algorithm>
#include <cmath>
#include <ranges>
#include <stdexcept>
#include <switchboard/monitor/accuracy_metrics.hpp>

namespace switchboard {

  namespace {

    constexpr double kZ95 = 1.96;
    constexpr double kMinCostDenominator = 0.001;
    constexpr double kMinLatencyDenominator = 1.0;

    double clamp01(double v) noexcept { return std::clamp(v, 0.0, 1.0); }

    double relative_accuracy(double predicted, double actual, double floor) noexcept {
      return clamp01(1.0 - std::abs(predicted - actual) / std::max(actual, floor));
    }

    AccuracyMetrics finish(double n, double cost, double latency, double quality, double overall,
                           double overall_sq, double matches, double successes, SystemTime last) {
      AccuracyMetrics m;
      if (n <= 0.0) return m;

      m.sample_size = static_cast<size_t>(n);
      m.cost_accuracy = cost / n;
      m.latency_accuracy = latency / n;
      m.quality_accuracy = quality / n;
      m.overall_accuracy = overall / n;
      m.match_rate = matches / n;
      m.success_rate = successes / n;

      // Sample variance; running sums can drift slightly negative
      const double variance
          = n > 1.0 ? std::max(0.0, (overall_sq - overall * overall / n) / (n - 1.0)) : 0.0;
      m.overall_stddev = std::sqrt(variance);

      const double margin = kZ95 * m.overall_stddev / std::sqrt(n);
      m.confidence_interval = Interval{.low = clamp01(m.overall_accuracy - margin),
                                       .high = clamp01(m.overall_accuracy + margin)};
      m.last_updated = last;
      return m;
    }

  }  // namespace

  AccuracySample score_sample(const CandidatePrediction& predicted, const ExecutionOutcome& actual,
                              double actual_quality) {
    AccuracySample s;
    s.cost_accuracy = relative_accuracy(predicted.predicted_cost, actual.cost, kMinCostDenominator);
    s.latency_accuracy = relative_accuracy(predicted.predicted_latency_ms, actual.latency_ms,
                                           kMinLatencyDenominator);
    s.quality_accuracy = clamp01(1.0 - std::abs(predicted.predicted_quality - actual_quality));
    s.overall = (s.cost_accuracy + s.latency_accuracy + s.quality_accuracy) / 3.0;
    s.selection_match = predicted.provider == actual.provider && predicted.model == actual.model;
    s.success = actual.success;
    s.timestamp = actual.timestamp;
    return s;
  }

  AccuracyMetrics summarize(const std::vector<AccuracySample>& samples) {
    double cost = 0, latency = 0, quality = 0, overall = 0, overall_sq = 0, matches = 0,
           successes = 0;
    SystemTime last{};
    for (const auto& s : samples) {
      cost += s.cost_accuracy;
      latency += s.latency_accuracy;
      quality += s.quality_accuracy;
      overall += s.overall;
      overall_sq += s.overall * s.overall;
      matches += s.selection_match ? 1.0 : 0.0;
      successes += s.success ? 1.0 : 0.0;
      last = std::max(last, s.timestamp);
    }
    return finish(static_cast<double>(samples.size()), cost, latency, quality, overall, overall_sq,
                  matches, successes, last);
  }

  // ============================================================================
  // AccuracyWindow
  // ============================================================================

  AccuracyWindow::AccuracyWindow(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("AccuracyWindow capacity must be positive");
    }
  }

  void AccuracyWindow::add(const AccuracySample& s, double sign) noexcept {
    sum_cost_ += sign * s.cost_accuracy;
    sum_latency_ += sign * s.latency_accuracy;
    sum_quality_ += sign * s.quality_accuracy;
    sum_overall_ += sign * s.overall;
    sum_overall_sq_ += sign * s.overall * s.overall;
    matches_ += sign * (s.selection_match ? 1.0 : 0.0);
    successes_ += sign * (s.success ? 1.0 : 0.0);
  }

  void AccuracyWindow::push(const AccuracySample& sample) {
    if (samples_.size() == capacity_) {
      add(samples_.front(), -1.0);
      samples_.pop_front();
    }
    samples_.push_back(sample);
    add(sample, 1.0);
  }

  void AccuracyWindow::clear() noexcept {
    samples_.clear();
    sum_cost_ = sum_latency_ = sum_quality_ = sum_overall_ = sum_overall_sq_ = 0.0;
    matches_ = successes_ = 0.0;
  }

  AccuracyMetrics AccuracyWindow::metrics() const {
    return finish(static_cast<double>(samples_.size()), sum_cost_, sum_latency_, sum_quality_,
                  sum_overall_, sum_overall_sq_, matches_, successes_,
                  samples_.empty() ? SystemTime{} : samples_.back().timestamp);
  }

  AccuracyMetrics AccuracyWindow::recent_metrics(size_t n) const {
    if (n >= samples_.size()) return metrics();
    auto recent = samples_ | std::views::drop(static_cast<std::ptrdiff_t>(samples_.size() - n));
    return summarize(std::vector<AccuracySample>(recent.begin(), recent.end()));
  }

}  // namespace switchboard
