#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <switchboard/common/tracy.hpp>
#include <switchboard/routing/scoring.hpp>

namespace switchboard {

  namespace {

    struct MinMax {
      double min;
      double max;

      [[nodiscard]] double normalize(double v) const noexcept {
        const double range = max - min;
        return range > 0.0 ? (v - min) / range : 1.0;
      }
    };

    template <typename Proj>
    MinMax min_max(const std::vector<CandidatePrediction>& candidates, Proj proj) {
      auto [lo, hi] = std::ranges::minmax(candidates | std::views::transform(proj));
      return MinMax{.min = lo, .max = hi};
    }

  }  // namespace

  bool satisfies(const CandidatePrediction& c, const Constraints& k) noexcept {
    if (k.max_cost && c.predicted_cost > *k.max_cost) return false;
    if (k.min_quality && c.predicted_quality < *k.min_quality) return false;
    if (k.max_response_time_ms && c.predicted_latency_ms > *k.max_response_time_ms) return false;
    return true;
  }

  std::string violation(const CandidatePrediction& c, const Constraints& k) {
    if (k.max_cost && c.predicted_cost > *k.max_cost) {
      return std::format("cost {:.6f} > maxCost {:.6f}", c.predicted_cost, *k.max_cost);
    }
    if (k.min_quality && c.predicted_quality < *k.min_quality) {
      return std::format("quality {:.3f} < minQuality {:.3f}", c.predicted_quality,
                         *k.min_quality);
    }
    if (k.max_response_time_ms && c.predicted_latency_ms > *k.max_response_time_ms) {
      return std::format("latency {:.0f}ms > maxResponseTimeMs {:.0f}", c.predicted_latency_ms,
                         *k.max_response_time_ms);
    }
    return {};
  }

  bool ranks_before(const CandidatePrediction& a, const CandidatePrediction& b) noexcept {
    if (a.score != b.score) return a.score > b.score;
    if (a.predicted_cost != b.predicted_cost) return a.predicted_cost < b.predicted_cost;
    if (a.provider != b.provider) return to_string(a.provider) < to_string(b.provider);
    return a.model < b.model;
  }

  // ============================================================================
  // StrategyScorer
  // ============================================================================

  StrategyScorer::StrategyScorer(ScoringOptions options) : options_(options) {
    const auto& w = options_.balanced;
    if (w.cost < 0.0 || w.speed < 0.0 || w.quality < 0.0) {
      throw std::invalid_argument(std::format("strategy weights must be non-negative, got {}/{}/{}",
                                              w.cost, w.speed, w.quality));
    }
    if (w.cost + w.speed + w.quality <= 0.0) {
      throw std::invalid_argument("at least one strategy weight must be positive");
    }
    if (options_.min_cost <= 0.0 || options_.min_latency_ms <= 0.0) {
      throw std::invalid_argument("cost and latency floors must be positive");
    }
  }

  double StrategyScorer::raw_score(const CandidatePrediction& c, Strategy strategy) const {
    switch (strategy) {
      case Strategy::Cost:
        return 1.0 / std::max(c.predicted_cost, options_.min_cost);
      case Strategy::Speed:
        return 1.0 / std::max(c.predicted_latency_ms, options_.min_latency_ms);
      case Strategy::Quality:
        return c.predicted_quality;
      case Strategy::Balanced:
        break;
    }
    throw std::invalid_argument("balanced scores depend on the whole candidate set");
  }

  void StrategyScorer::score_balanced(std::vector<CandidatePrediction>& candidates) const {
    auto inv_cost = [this](const CandidatePrediction& c) {
      return 1.0 / std::max(c.predicted_cost, options_.min_cost);
    };
    auto inv_latency = [this](const CandidatePrediction& c) {
      return 1.0 / std::max(c.predicted_latency_ms, options_.min_latency_ms);
    };
    const auto cost_range = min_max(candidates, inv_cost);
    const auto latency_range = min_max(candidates, inv_latency);
    const auto& w = options_.balanced;

    for (auto& c : candidates) {
      c.score = w.cost * cost_range.normalize(inv_cost(c))
                + w.speed * latency_range.normalize(inv_latency(c)) + w.quality * c.predicted_quality;
    }
  }

  void StrategyScorer::rank(std::vector<CandidatePrediction>& candidates, Strategy strategy) const {
    SWITCHBOARD_ZONE;
    if (candidates.empty()) return;

    if (strategy == Strategy::Balanced) {
      score_balanced(candidates);
    } else {
      for (auto& c : candidates) c.score = raw_score(c, strategy);
    }
    for (auto& c : candidates) c.score *= 1.0 - std::clamp(c.drift_penalty, 0.0, 1.0);

    std::ranges::sort(candidates, ranks_before);
  }

}  // namespace switchboard
