#pragma once

#include <array>
#include <filesystem>
#include <format>
#include <memory>
#include <random>
#include <string>
#include <switchboard/common/types.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <switchboard/providers/provider_client.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <vector>

namespace bench_utils {

  inline std::string GetFixturePath(const std::string& filename) {
    std::vector<std::filesystem::path> search_paths
        = {std::filesystem::path(SWITCHBOARD_FIXTURES_DIR),
           std::filesystem::current_path() / "fixtures",
           std::filesystem::current_path() / "test" / "fixtures"};

    for (const auto& base_path : search_paths) {
      auto full_path = base_path / filename;
      if (std::filesystem::exists(full_path)) {
        return full_path.string();
      }
    }
    return (search_paths[0] / filename).string();
  }

  /// Synthetic catalog of `n` models spread over the four providers
  inline std::vector<switchboard::ModelSpec> GenerateModels(size_t n, uint32_t seed = 42) {
    using namespace switchboard;
    static const std::array<Provider, 4> kProviders
        = {Provider::OpenAI, Provider::Anthropic, Provider::Google, Provider::Ollama};

    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> price(0.05, 20.0);
    std::uniform_real_distribution<double> latency(150.0, 3000.0);
    std::uniform_real_distribution<double> per_token(1.0, 25.0);
    std::uniform_real_distribution<double> quality(0.5, 0.98);

    std::vector<ModelSpec> models;
    models.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      models.push_back(ModelSpec{
          .provider = kProviders[i % kProviders.size()],
          .model = std::format("model-{}", i),
          .cost_per_1m_input_tokens = price(gen),
          .cost_per_1m_output_tokens = price(gen),
          .base_latency_ms = latency(gen),
          .ms_per_output_token = per_token(gen),
          .baseline_quality = quality(gen),
          .capabilities = {CapabilityClass::Chat, CapabilityClass::Code, CapabilityClass::Analysis,
                           CapabilityClass::Creative, CapabilityClass::Support,
                           CapabilityClass::Complex},
          .supports_tools = true});
    }
    return models;
  }

  /// One large pool per provider
  inline std::vector<switchboard::PoolConfig> GeneratePools(int daily_limit) {
    using namespace switchboard;
    std::vector<PoolConfig> pools;
    for (auto provider : {Provider::OpenAI, Provider::Anthropic, Provider::Google, Provider::Ollama}) {
      pools.push_back(PoolConfig{.pool_id = std::format("{}-bench", to_string(provider)),
                                 .provider = provider,
                                 .api_key = "bench",
                                 .daily_limit = daily_limit});
    }
    return pools;
  }

  /// Answers every call with the same completion and records nothing
  class StaticProviderClient final : public switchboard::IProviderClient {
  public:
    switchboard::Result<switchboard::ProviderResponse, switchboard::ProviderError> complete(
        const switchboard::DispatchRequest&) override {
      return switchboard::ProviderResponse{
          .content = "ok",
          .finish_reason = switchboard::FinishReason::Stop,
          .usage = switchboard::Usage{.prompt_tokens = 40, .completion_tokens = 120},
          .tool_calls = {}};
    }

    switchboard::Result<std::unique_ptr<switchboard::IByteSource>, switchboard::ProviderError>
    open_stream(const switchboard::DispatchRequest&) override {
      return switchboard::Unexpected(switchboard::ProviderError{
          .kind = "transport", .message = "streaming not benchmarked here", .status = {}});
    }
  };

}  // namespace bench_utils
