#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>
#include <switchboard/monitor/performance.hpp>

namespace switchboard {

  namespace {

    constexpr auto kThroughputWindow = std::chrono::seconds{60};

    template <typename Range> double mean_of(const Range& values) {
      if (values.empty()) return 0.0;
      return std::accumulate(values.begin(), values.end(), 0.0)
             / static_cast<double>(values.size());
    }

  }  // namespace

  std::string_view to_string(HealthStatus s) noexcept {
    switch (s) {
      case HealthStatus::Healthy:
        return "healthy";
      case HealthStatus::Warning:
        return "warning";
      case HealthStatus::Critical:
        return "critical";
    }
    return "unknown";
  }

  double percentile(std::vector<double> values, double p) {
    if (values.empty()) return 0.0;
    p = std::clamp(p, 0.0, 1.0);
    const auto rank = static_cast<size_t>(std::ceil(p * static_cast<double>(values.size())));
    const auto index = rank == 0 ? 0 : rank - 1;
    std::ranges::nth_element(values, values.begin() + static_cast<std::ptrdiff_t>(index));
    return values[index];
  }

  PerformanceTracker::PerformanceTracker(PerformanceThresholds thresholds,
                                         std::shared_ptr<const Clock> clock, size_t max_samples)
      : thresholds_(thresholds), clock_(std::move(clock)), max_samples_(max_samples) {
    if (!clock_) throw std::invalid_argument("PerformanceTracker requires a clock");
    if (max_samples_ == 0) throw std::invalid_argument("max_samples must be positive");
  }

  void PerformanceTracker::record_request(double latency_ms, bool success) {
    auto now = clock_->now();
    std::lock_guard lock(mutex_);
    push_bounded(requests_, RequestSample{.at = now, .latency_ms = latency_ms, .success = success});
  }

  void PerformanceTracker::record_routing_latency(double latency_ms) {
    std::lock_guard lock(mutex_);
    push_bounded(routing_latencies_, latency_ms);
  }

  void PerformanceTracker::record_accuracy(double overall_accuracy) {
    std::lock_guard lock(mutex_);
    push_bounded(accuracies_, overall_accuracy);
  }

  PerformanceSnapshot PerformanceTracker::snapshot() const {
    const auto now = clock_->now();
    std::lock_guard lock(mutex_);

    PerformanceSnapshot s;
    s.requests = requests_.size();

    std::vector<double> latencies;
    latencies.reserve(requests_.size());
    size_t failures = 0;
    size_t recent = 0;
    for (const auto& r : requests_) {
      latencies.push_back(r.latency_ms);
      if (!r.success) ++failures;
      if (now - r.at <= kThroughputWindow) ++recent;
    }

    s.avg_latency_ms = mean_of(latencies);
    s.p50_latency_ms = percentile(latencies, 0.50);
    s.p95_latency_ms = percentile(latencies, 0.95);
    s.p99_latency_ms = percentile(latencies, 0.99);
    s.error_rate = s.requests == 0 ? 0.0
                                   : static_cast<double>(failures) / static_cast<double>(s.requests);
    s.requests_per_second
        = static_cast<double>(recent) / static_cast<double>(kThroughputWindow.count());
    s.avg_routing_latency_ms = mean_of(routing_latencies_);
    s.avg_accuracy = accuracies_.empty() ? 1.0 : mean_of(accuracies_);

    int score = 100;
    if (s.requests > 0 && s.avg_latency_ms > thresholds_.max_response_time_ms) {
      score -= 20;
      s.issues.push_back(std::format("average response time {:.0f}ms exceeds {:.0f}ms",
                                     s.avg_latency_ms, thresholds_.max_response_time_ms));
    }
    if (s.error_rate > thresholds_.max_error_rate) {
      score -= 25;
      s.issues.push_back(std::format("error rate {:.1f}% exceeds {:.1f}%", s.error_rate * 100.0,
                                     thresholds_.max_error_rate * 100.0));
    }
    if (thresholds_.min_throughput_rps > 0.0
        && s.requests_per_second < thresholds_.min_throughput_rps) {
      score -= 10;
      s.issues.push_back(std::format("throughput {:.2f} rps below {:.2f} rps",
                                     s.requests_per_second, thresholds_.min_throughput_rps));
    }
    if (s.avg_accuracy < thresholds_.min_accuracy) {
      score -= 15;
      s.issues.push_back(std::format("prediction accuracy {:.1f}% below {:.1f}%",
                                     s.avg_accuracy * 100.0, thresholds_.min_accuracy * 100.0));
    }
    if (s.avg_routing_latency_ms > thresholds_.max_routing_latency_ms) {
      score -= 10;
      s.issues.push_back(std::format("routing latency {:.1f}ms exceeds {:.0f}ms",
                                     s.avg_routing_latency_ms,
                                     thresholds_.max_routing_latency_ms));
    }

    s.health_score = std::max(score, 0);
    if (s.health_score < 70) {
      s.status = HealthStatus::Critical;
    } else if (s.health_score < 85) {
      s.status = HealthStatus::Warning;
    } else {
      s.status = HealthStatus::Healthy;
    }
    return s;
  }

}  // namespace switchboard
