#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/providers/provider_client.hpp>
#include <utility>
#include <vector>

// Provider-native request bodies and non-streaming response parsing:
// OpenAI chat completions, Anthropic messages, Google generateContent, Ollama chat.

namespace switchboard {

  inline constexpr int kAnthropicDefaultMaxTokens = 1000;
  inline constexpr const char* kAnthropicVersion = "2023-06-01";

  struct WireRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
  };

  [[nodiscard]] std::string default_base_url(Provider provider);

  [[nodiscard]] nlohmann::json build_request_body(Provider provider, const std::string& model,
                                                  const RoutingRequest& request, bool stream);

  [[nodiscard]] WireRequest build_wire_request(const DispatchRequest& dispatch,
                                               const std::string& base_url);

  /// Provider stop signal mapped onto the canonical finish reasons
  [[nodiscard]] FinishReason map_finish_reason(Provider provider, std::string_view native);

  [[nodiscard]] Result<ProviderResponse, ProviderError> parse_completion(Provider provider,
                                                                         std::string_view body);

}  // namespace switchboard
