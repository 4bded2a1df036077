#pragma once
#include <string>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  /// Balanced-strategy weights over normalized inverse cost, inverse latency and quality
  struct StrategyWeights {
    double cost = 0.3;
    double speed = 0.3;
    double quality = 0.4;
  };

  struct ScoringOptions {
    StrategyWeights balanced;
    double min_cost = 1e-6;        // floor for 1/cost; free local models would divide by zero
    double min_latency_ms = 1.0;
  };

  /// True when the prediction meets maxCost, minQuality and maxResponseTimeMs
  [[nodiscard]] bool satisfies(const CandidatePrediction& candidate,
                               const Constraints& constraints) noexcept;

  /// Describes the first violated constraint, empty when none is violated
  [[nodiscard]] std::string violation(const CandidatePrediction& candidate,
                                      const Constraints& constraints);

  /// Higher score first; ties by lower predicted cost, then provider name, then model name
  [[nodiscard]] bool ranks_before(const CandidatePrediction& a,
                                  const CandidatePrediction& b) noexcept;

  class StrategyScorer {
  public:
    /// Throws std::invalid_argument on negative weights, all-zero weights or non-positive floors
    explicit StrategyScorer(ScoringOptions options = {});

    /// Assigns CandidatePrediction::score and sorts best first.
    /// Scores are scaled by (1 - drift_penalty).
    void rank(std::vector<CandidatePrediction>& candidates, Strategy strategy) const;

    [[nodiscard]] double raw_score(const CandidatePrediction& candidate, Strategy strategy) const;

    [[nodiscard]] const ScoringOptions& options() const noexcept { return options_; }

  private:
    void score_balanced(std::vector<CandidatePrediction>& candidates) const;

    ScoringOptions options_;
  };

}  // namespace switchboard
