#include <cmath>
#include <numbers>
#include <switchboard/monitor/drift.hpp>

namespace switchboard {

  namespace {
    constexpr double kFallbackMagnitude = 0.15;
    constexpr double kAlertMagnitude = 0.10;
  }  // namespace

  std::string_view to_string(DriftAction a) noexcept {
    switch (a) {
      case DriftAction::Monitor:
        return "monitor";
      case DriftAction::Investigate:
        return "investigate";
      case DriftAction::Alert:
        return "alert";
      case DriftAction::Fallback:
        return "fallback";
    }
    return "unknown";
  }

  double two_sample_significance(double mean_a, double stddev_a, size_t n_a, double mean_b,
                                 double stddev_b, size_t n_b) noexcept {
    if (n_a == 0 || n_b == 0) return 0.0;

    const double diff = std::abs(mean_a - mean_b);
    const double se = std::sqrt(stddev_a * stddev_a / static_cast<double>(n_a)
                                + stddev_b * stddev_b / static_cast<double>(n_b));
    if (se < 1e-12) {
      return diff > 1e-12 ? 1.0 : 0.0;
    }

    const double z = diff / se;
    const double p_value = std::erfc(z / std::numbers::sqrt2);
    return 1.0 - p_value;
  }

  DriftAction recommend_action(double magnitude, bool drifted) noexcept {
    if (!drifted) return DriftAction::Monitor;
    if (magnitude > kFallbackMagnitude) return DriftAction::Fallback;
    if (magnitude > kAlertMagnitude) return DriftAction::Alert;
    return DriftAction::Investigate;
  }

  DriftDetectionResult evaluate_drift(Provider provider, std::string model,
                                      const AccuracyMetrics& baseline,
                                      const AccuracyMetrics& current,
                                      const DriftOptions& options) {
    DriftDetectionResult result{.provider = provider,
                                .model = std::move(model),
                                .drift_detected = false,
                                .magnitude = 0.0,
                                .significance = 0.0,
                                .affected_metrics = {},
                                .action = DriftAction::Monitor,
                                .baseline = baseline,
                                .current = current};

    if (baseline.sample_size < options.min_sample_size
        || current.sample_size < options.min_sample_size) {
      return result;
    }

    result.magnitude = std::abs(baseline.overall_accuracy - current.overall_accuracy);
    result.significance = two_sample_significance(
        baseline.overall_accuracy, baseline.overall_stddev, baseline.sample_size,
        current.overall_accuracy, current.overall_stddev, current.sample_size);

    auto check = [&](const char* name, double before, double after) {
      if (std::abs(before - after) > options.drift_threshold) {
        result.affected_metrics.emplace_back(name);
      }
    };
    check("cost_accuracy", baseline.cost_accuracy, current.cost_accuracy);
    check("latency_accuracy", baseline.latency_accuracy, current.latency_accuracy);
    check("quality_accuracy", baseline.quality_accuracy, current.quality_accuracy);
    check("match_rate", baseline.match_rate, current.match_rate);

    result.drift_detected = result.magnitude > options.drift_threshold
                            && result.significance >= options.confidence_level;
    result.action = recommend_action(result.magnitude, result.drift_detected);
    return result;
  }

}  // namespace switchboard
