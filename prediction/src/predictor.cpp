#include <algorithm>
#include <format>
#include <stdexcept>
#include <switchboard/common/tracy.hpp>
#include <switchboard/prediction/predictor.hpp>

namespace switchboard {

  Predictor::Predictor(const CalibrationTable& calibration, PredictorOptions options)
      : calibration_(calibration), options_(options) {
    if (options_.confidence_samples == 0) {
      throw std::invalid_argument("confidence_samples must be positive");
    }
    if (options_.quality_accuracy_weight < 0.0 || options_.quality_accuracy_weight > 1.0) {
      throw std::invalid_argument(std::format("quality_accuracy_weight must be within [0, 1], got {}",
                                              options_.quality_accuracy_weight));
    }
    if (options_.features.chars_per_token <= 0 || options_.features.default_completion_tokens <= 0) {
      throw std::invalid_argument("feature token settings must be positive");
    }
  }

  RequestFeatures Predictor::features(const RoutingRequest& request) const {
    return extract_features(request, options_.features);
  }

  CandidatePrediction Predictor::predict(const ModelSpec& spec, const RequestFeatures& features,
                                         const CalibrationSnapshot& calibration) const {
    const CalibrationEntry* entry = calibration.find(spec.provider, spec.model);
    const CalibrationEntry fallback;
    const CalibrationEntry& cal = entry ? *entry : fallback;

    CandidatePrediction p;
    p.provider = spec.provider;
    p.model = spec.model;
    p.prompt_tokens = features.prompt_tokens;
    p.completion_tokens = features.completion_tokens;

    const double raw_cost = (static_cast<double>(features.prompt_tokens) * spec.cost_per_1m_input_tokens
                             + static_cast<double>(features.completion_tokens)
                                   * spec.cost_per_1m_output_tokens)
                            / 1e6;
    p.predicted_cost = raw_cost * cal.cost_factor;

    const double raw_latency
        = spec.base_latency_ms + static_cast<double>(features.completion_tokens) * spec.ms_per_output_token;
    p.predicted_latency_ms = raw_latency * cal.latency_factor;

    const double w = options_.quality_accuracy_weight;
    const double quality = cal.learned_quality.value_or(spec.baseline_quality);
    p.predicted_quality = std::clamp(quality * ((1.0 - w) + w * cal.quality_accuracy), 0.0, 1.0);

    const double history = std::min(
        1.0, static_cast<double>(cal.samples) / static_cast<double>(options_.confidence_samples));
    p.drift_penalty = cal.drift_penalty;
    p.confidence = std::clamp((0.5 + 0.5 * history) * (1.0 - cal.drift_penalty), 0.0, 1.0);

    const double spread
        = options_.min_interval_spread + options_.max_interval_spread * (1.0 - p.confidence);
    p.cost_interval = Interval{.low = std::max(0.0, p.predicted_cost * (1.0 - spread)),
                               .high = p.predicted_cost * (1.0 + spread)};
    p.latency_interval = Interval{.low = std::max(0.0, p.predicted_latency_ms * (1.0 - spread)),
                                  .high = p.predicted_latency_ms * (1.0 + spread)};
    return p;
  }

  std::vector<CandidatePrediction> Predictor::predict_all(
      const std::vector<const ModelSpec*>& candidates, const RequestFeatures& features) const {
    SWITCHBOARD_ZONE;
    auto snapshot = calibration_.snapshot();
    std::vector<CandidatePrediction> out;
    out.reserve(candidates.size());
    for (const auto* spec : candidates) {
      out.push_back(predict(*spec, features, *snapshot));
    }
    return out;
  }

}  // namespace switchboard
