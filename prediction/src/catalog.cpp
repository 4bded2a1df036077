#include <algorithm>
#include <format>
#include <stdexcept>
#include <switchboard/common/json.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <unordered_set>

namespace switchboard {

  std::string ModelSpec::model_id() const {
    return std::format("{}/{}", to_string(provider), model);
  }

  bool ModelSpec::supports(CapabilityClass c) const noexcept {
    return std::ranges::find(capabilities, c) != capabilities.end();
  }

  void to_json(nlohmann::json& j, const ModelSpec& m) {
    json caps = json::array();
    for (auto c : m.capabilities) caps.push_back(std::string(to_string(c)));
    j = {{"provider", m.provider},
         {"model", m.model},
         {"cost_per_1m_input_tokens", m.cost_per_1m_input_tokens},
         {"cost_per_1m_output_tokens", m.cost_per_1m_output_tokens},
         {"base_latency_ms", m.base_latency_ms},
         {"ms_per_output_token", m.ms_per_output_token},
         {"baseline_quality", m.baseline_quality},
         {"capabilities", caps},
         {"supports_tools", m.supports_tools}};
  }

  void from_json(const nlohmann::json& j, ModelSpec& m) {
    j.at("provider").get_to(m.provider);
    j.at("model").get_to(m.model);
    j.at("cost_per_1m_input_tokens").get_to(m.cost_per_1m_input_tokens);
    j.at("cost_per_1m_output_tokens").get_to(m.cost_per_1m_output_tokens);
    j.at("base_latency_ms").get_to(m.base_latency_ms);
    m.ms_per_output_token = j.value("ms_per_output_token", 0.0);
    j.at("baseline_quality").get_to(m.baseline_quality);
    m.supports_tools = j.value("supports_tools", true);

    m.capabilities.clear();
    if (j.contains("capabilities")) {
      for (const auto& c : j.at("capabilities")) {
        auto name = c.get<std::string>();
        auto parsed = parse_capability(name);
        if (!parsed) {
          throw std::invalid_argument(
              std::format("model '{}' lists unknown capability '{}'", m.model, name));
        }
        m.capabilities.push_back(*parsed);
      }
    } else {
      m.capabilities = {CapabilityClass::Chat};
    }
  }

  // ============================================================================
  // ModelCatalog
  // ============================================================================

  ModelCatalog::ModelCatalog(std::vector<ModelSpec> models) : models_(std::move(models)) {
    std::unordered_set<std::string> seen;
    for (const auto& m : models_) {
      if (m.model.empty()) throw std::invalid_argument("model name must not be empty");
      if (!seen.insert(m.model_id()).second) {
        throw std::invalid_argument(std::format("duplicate model '{}'", m.model_id()));
      }
      if (m.cost_per_1m_input_tokens < 0.0 || m.cost_per_1m_output_tokens < 0.0) {
        throw std::invalid_argument(std::format("model '{}' has a negative price", m.model_id()));
      }
      if (m.base_latency_ms < 0.0 || m.ms_per_output_token < 0.0) {
        throw std::invalid_argument(
            std::format("model '{}' has a negative latency", m.model_id()));
      }
      if (m.baseline_quality < 0.0 || m.baseline_quality > 1.0) {
        throw std::invalid_argument(
            std::format("model '{}' baseline_quality must be within [0, 1], got {}", m.model_id(),
                        m.baseline_quality));
      }
    }
  }

  ModelCatalog ModelCatalog::defaults() {
    using enum CapabilityClass;
    const std::vector<CapabilityClass> all = {Chat, Code, Analysis, Creative, Support, Complex};
    return ModelCatalog({
        {.provider = Provider::OpenAI, .model = "gpt-4o", .cost_per_1m_input_tokens = 2.50,
         .cost_per_1m_output_tokens = 10.00, .base_latency_ms = 2000, .ms_per_output_token = 12,
         .baseline_quality = 0.90, .capabilities = all},
        {.provider = Provider::OpenAI, .model = "gpt-4o-mini", .cost_per_1m_input_tokens = 0.15,
         .cost_per_1m_output_tokens = 0.60, .base_latency_ms = 2000, .ms_per_output_token = 8,
         .baseline_quality = 0.80, .capabilities = {Chat, Code, Analysis, Creative, Support}},
        {.provider = Provider::Anthropic, .model = "claude-3-5-sonnet",
         .cost_per_1m_input_tokens = 3.00, .cost_per_1m_output_tokens = 15.00,
         .base_latency_ms = 2500, .ms_per_output_token = 14, .baseline_quality = 0.95,
         .capabilities = all},
        {.provider = Provider::Anthropic, .model = "claude-3-5-haiku",
         .cost_per_1m_input_tokens = 0.80, .cost_per_1m_output_tokens = 4.00,
         .base_latency_ms = 2500, .ms_per_output_token = 9, .baseline_quality = 0.85,
         .capabilities = {Chat, Code, Creative, Support}},
        {.provider = Provider::Google, .model = "gemini-1.5-pro", .cost_per_1m_input_tokens = 1.25,
         .cost_per_1m_output_tokens = 5.00, .base_latency_ms = 1800, .ms_per_output_token = 12,
         .baseline_quality = 0.85, .capabilities = all},
        {.provider = Provider::Google, .model = "gemini-1.5-flash",
         .cost_per_1m_input_tokens = 0.075, .cost_per_1m_output_tokens = 0.30,
         .base_latency_ms = 1800, .ms_per_output_token = 6, .baseline_quality = 0.80,
         .capabilities = {Chat, Analysis, Creative, Support}},
        {.provider = Provider::Ollama, .model = "llama3.1", .cost_per_1m_input_tokens = 0.0,
         .cost_per_1m_output_tokens = 0.0, .base_latency_ms = 3000, .ms_per_output_token = 25,
         .baseline_quality = 0.70, .capabilities = {Chat, Creative, Support},
         .supports_tools = false},
    });
  }

  const ModelSpec* ModelCatalog::find(Provider provider, std::string_view model) const {
    auto it = std::ranges::find_if(
        models_, [&](const ModelSpec& m) { return m.provider == provider && m.model == model; });
    return it == models_.end() ? nullptr : &*it;
  }

  std::vector<const ModelSpec*> ModelCatalog::match_hint(std::string_view hint) const {
    std::vector<const ModelSpec*> out;
    if (hint.empty()) return out;

    auto slash = hint.find('/');
    if (slash != std::string_view::npos) {
      if (auto provider = parse_provider(hint.substr(0, slash))) {
        if (const auto* m = find(*provider, hint.substr(slash + 1))) out.push_back(m);
      }
      return out;
    }

    for (const auto& m : models_) {
      if (m.model == hint) out.push_back(&m);
    }
    if (!out.empty()) return out;

    if (auto provider = parse_provider(hint)) {
      for (const auto& m : models_) {
        if (m.provider == *provider) out.push_back(&m);
      }
    }
    return out;
  }

  std::vector<const ModelSpec*> ModelCatalog::for_capability(CapabilityClass c) const {
    std::vector<const ModelSpec*> out;
    for (const auto& m : models_) {
      if (m.supports(c)) out.push_back(&m);
    }
    return out;
  }

}  // namespace switchboard
