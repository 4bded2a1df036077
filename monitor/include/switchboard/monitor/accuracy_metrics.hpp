#pragma once
#include <cstddef>
#include <deque>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  /// Accuracy of one prediction against its observed outcome; every component is in [0, 1]
  struct AccuracySample {
    double cost_accuracy = 0.0;
    double latency_accuracy = 0.0;
    double quality_accuracy = 0.0;
    double overall = 0.0;
    bool selection_match = true;  // served by the predicted provider/model
    bool success = true;
    SystemTime timestamp;
  };

  /// cost:    1 - |p - a| / max(a, 0.001)
  /// latency: 1 - |p - a| / max(a, 1ms)
  /// quality: 1 - |p - a|
  [[nodiscard]] AccuracySample score_sample(const CandidatePrediction& predicted,
                                            const ExecutionOutcome& actual, double actual_quality);

  struct AccuracyMetrics {
    double cost_accuracy = 0.0;
    double latency_accuracy = 0.0;
    double quality_accuracy = 0.0;
    double overall_accuracy = 0.0;
    double overall_stddev = 0.0;
    double match_rate = 0.0;
    double success_rate = 0.0;
    size_t sample_size = 0;
    Interval confidence_interval;  // 95%, normal approximation
    SystemTime last_updated;
  };

  [[nodiscard]] AccuracyMetrics summarize(const std::vector<AccuracySample>& samples);

  /// Bounded rolling window with running sums; push() is O(1)
  class AccuracyWindow {
  public:
    explicit AccuracyWindow(size_t capacity);

    void push(const AccuracySample& sample);
    void clear() noexcept;

    [[nodiscard]] AccuracyMetrics metrics() const;
    [[nodiscard]] AccuracyMetrics recent_metrics(size_t n) const;

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

  private:
    void add(const AccuracySample& s, double sign) noexcept;

    size_t capacity_;
    std::deque<AccuracySample> samples_;
    double sum_cost_ = 0.0;
    double sum_latency_ = 0.0;
    double sum_quality_ = 0.0;
    double sum_overall_ = 0.0;
    double sum_overall_sq_ = 0.0;
    double matches_ = 0.0;
    double successes_ = 0.0;
  };

}  // namespace switchboard
