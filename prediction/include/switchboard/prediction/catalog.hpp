#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  /// Static description of one routable (provider, model) pair
  struct ModelSpec {
    Provider provider;
    std::string model;
    double cost_per_1m_input_tokens = 0.0;
    double cost_per_1m_output_tokens = 0.0;
    double base_latency_ms = 0.0;
    double ms_per_output_token = 0.0;
    double baseline_quality = 0.0;  // [0, 1]
    std::vector<CapabilityClass> capabilities;
    bool supports_tools = true;

    [[nodiscard]] std::string model_id() const;  // "provider/model"
    [[nodiscard]] bool supports(CapabilityClass c) const noexcept;
  };

  void to_json(nlohmann::json& j, const ModelSpec& m);
  void from_json(const nlohmann::json& j, ModelSpec& m);

  class ModelCatalog {
  public:
    /// Throws std::invalid_argument on duplicate ids, negative prices or quality outside [0, 1]
    explicit ModelCatalog(std::vector<ModelSpec> models);

    [[nodiscard]] static ModelCatalog defaults();

    [[nodiscard]] const std::vector<ModelSpec>& models() const noexcept { return models_; }
    [[nodiscard]] size_t size() const noexcept { return models_.size(); }

    [[nodiscard]] const ModelSpec* find(Provider provider, std::string_view model) const;

    /// Exact model name, "provider/model" id, or a provider name; empty when nothing matches
    [[nodiscard]] std::vector<const ModelSpec*> match_hint(std::string_view hint) const;

    [[nodiscard]] std::vector<const ModelSpec*> for_capability(CapabilityClass c) const;

  private:
    std::vector<ModelSpec> models_;
  };

}  // namespace switchboard
