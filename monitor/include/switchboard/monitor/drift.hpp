#pragma once
#include <string>
#include <string_view>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_metrics.hpp>
#include <vector>

namespace switchboard {

  enum class DriftAction { Monitor, Investigate, Alert, Fallback };

  [[nodiscard]] std::string_view to_string(DriftAction a) noexcept;

  struct DriftOptions {
    double drift_threshold = 0.05;
    double confidence_level = 0.95;
    size_t min_sample_size = 10;
  };

  struct DriftDetectionResult {
    Provider provider;
    std::string model;
    bool drift_detected = false;
    double magnitude = 0.0;
    double significance = 0.0;
    std::vector<std::string> affected_metrics;
    DriftAction action = DriftAction::Monitor;
    AccuracyMetrics baseline;
    AccuracyMetrics current;
  };

  /// Two-sided two-sample z-test on means; returns 1 - p in [0, 1]
  [[nodiscard]] double two_sample_significance(double mean_a, double stddev_a, size_t n_a,
                                               double mean_b, double stddev_b,
                                               size_t n_b) noexcept;

  /// >0.15 fallback, >0.10 alert, otherwise investigate; monitor when not significant
  [[nodiscard]] DriftAction recommend_action(double magnitude, bool drifted) noexcept;

  [[nodiscard]] DriftDetectionResult evaluate_drift(Provider provider, std::string model,
                                                    const AccuracyMetrics& baseline,
                                                    const AccuracyMetrics& current,
                                                    const DriftOptions& options);

}  // namespace switchboard
