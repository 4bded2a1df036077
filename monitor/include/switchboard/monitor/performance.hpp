#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <switchboard/common/clock.hpp>
#include <vector>

namespace switchboard {

  struct PerformanceThresholds {
    double max_response_time_ms = 5000.0;
    double max_error_rate = 0.05;
    double min_accuracy = 0.95;
    double max_routing_latency_ms = 200.0;
    double min_throughput_rps = 0.0;  // 0 disables the throughput check
  };

  enum class HealthStatus { Healthy, Warning, Critical };

  [[nodiscard]] std::string_view to_string(HealthStatus s) noexcept;

  struct PerformanceSnapshot {
    size_t requests = 0;
    double avg_latency_ms = 0.0;
    double p50_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double p99_latency_ms = 0.0;
    double error_rate = 0.0;
    double requests_per_second = 0.0;
    double avg_routing_latency_ms = 0.0;
    double avg_accuracy = 1.0;
    int health_score = 100;
    HealthStatus status = HealthStatus::Healthy;
    std::vector<std::string> issues;
  };

  /// Nearest-rank percentile of an unsorted sample; p in [0, 1]
  [[nodiscard]] double percentile(std::vector<double> values, double p);

  /// Request-level latency, error and throughput tracking with a health score.
  /// Deductions: response time 20, error rate 25, throughput 10, accuracy 15,
  /// routing latency 10. Below 70 is critical, below 85 a warning.
  class PerformanceTracker {
  public:
    PerformanceTracker(PerformanceThresholds thresholds, std::shared_ptr<const Clock> clock,
                       size_t max_samples = 1000);

    void record_request(double latency_ms, bool success);
    void record_routing_latency(double latency_ms);
    void record_accuracy(double overall_accuracy);

    [[nodiscard]] PerformanceSnapshot snapshot() const;
    [[nodiscard]] const PerformanceThresholds& thresholds() const noexcept { return thresholds_; }

  private:
    struct RequestSample {
      SystemTime at;
      double latency_ms;
      bool success;
    };

    template <typename T> void push_bounded(std::deque<T>& q, T value) {
      if (q.size() == max_samples_) q.pop_front();
      q.push_back(std::move(value));
    }

    PerformanceThresholds thresholds_;
    std::shared_ptr<const Clock> clock_;
    size_t max_samples_;

    mutable std::mutex mutex_;
    std::deque<RequestSample> requests_;
    std::deque<double> routing_latencies_;
    std::deque<double> accuracies_;
  };

}  // namespace switchboard
