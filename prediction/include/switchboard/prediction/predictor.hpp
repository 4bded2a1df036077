#pragma once
#include <memory>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/calibration.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <switchboard/prediction/features.hpp>
#include <vector>

namespace switchboard {

  struct PredictorOptions {
    FeatureOptions features;
    size_t confidence_samples = 10;      // samples for full history confidence
    double quality_accuracy_weight = 0.2;
    double min_interval_spread = 0.05;   // relative half-width at full confidence
    double max_interval_spread = 0.5;    // added as confidence falls to zero
  };

  /**
   * Cost, latency and quality estimates per candidate.
   *
   *   cost    = (prompt * in + completion * out) / 1e6 * cost_factor
   *   latency = (base + completion * ms_per_token) * latency_factor
   *   quality = learned (or baseline) quality, weighted by the rolling quality accuracy
   *
   * Strategy-agnostic: every candidate handed in comes back with raw predictions.
   */
  class Predictor {
  public:
    Predictor(const CalibrationTable& calibration, PredictorOptions options = {});

    [[nodiscard]] RequestFeatures features(const RoutingRequest& request) const;

    [[nodiscard]] CandidatePrediction predict(const ModelSpec& spec,
                                              const RequestFeatures& features,
                                              const CalibrationSnapshot& calibration) const;

    /// All candidates against one calibration snapshot
    [[nodiscard]] std::vector<CandidatePrediction> predict_all(
        const std::vector<const ModelSpec*>& candidates, const RequestFeatures& features) const;

    [[nodiscard]] const PredictorOptions& options() const noexcept { return options_; }

  private:
    const CalibrationTable& calibration_;
    PredictorOptions options_;
  };

}  // namespace switchboard
