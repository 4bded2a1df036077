#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <switchboard/common/clock.hpp>
#include <vector>

namespace switchboard {

  // =============================================================================
  // Enumerations
  // =============================================================================

  enum class Provider { OpenAI, Anthropic, Google, Ollama };

  inline constexpr std::array<Provider, 4> kAllProviders
      = {Provider::OpenAI, Provider::Anthropic, Provider::Google, Provider::Ollama};

  enum class Strategy { Cost, Speed, Quality, Balanced };

  enum class Tier { Instant, Connected, Paid };

  enum class FinishReason { Stop, Length, ToolCalls, ContentFilter, Error };

  enum class CapabilityClass { Chat, Code, Analysis, Creative, Support, Complex };

  [[nodiscard]] std::string_view to_string(Provider p) noexcept;
  [[nodiscard]] std::string_view to_string(Strategy s) noexcept;
  [[nodiscard]] std::string_view to_string(Tier t) noexcept;
  [[nodiscard]] std::string_view to_string(FinishReason r) noexcept;
  [[nodiscard]] std::string_view to_string(CapabilityClass c) noexcept;

  // Parsers are lenient about case; unknown names yield nullopt
  [[nodiscard]] std::optional<Provider> parse_provider(std::string_view name) noexcept;
  [[nodiscard]] std::optional<Strategy> parse_strategy(std::string_view name) noexcept;
  [[nodiscard]] std::optional<Tier> parse_tier(std::string_view name) noexcept;
  [[nodiscard]] std::optional<FinishReason> parse_finish_reason(std::string_view name) noexcept;
  [[nodiscard]] std::optional<CapabilityClass> parse_capability(std::string_view name) noexcept;

  // =============================================================================
  // Requests
  // =============================================================================

  struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments;  // raw JSON text
  };

  struct Message {
    std::string role;  // system, user, assistant, tool
    std::string content;
    std::vector<ToolCall> tool_calls;
  };

  struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters;  // raw JSON schema text
  };

  struct Constraints {
    std::optional<double> max_cost;
    std::optional<double> min_quality;
    std::optional<double> max_response_time_ms;
    std::vector<Provider> preferred_providers;
    std::vector<Provider> exclude_providers;
  };

  /// Normalized chat request; treated as immutable once handed to the engine
  struct RoutingRequest {
    std::string request_id;  // assigned by the engine when empty
    std::string user_id;
    std::vector<Message> messages;
    std::optional<std::string> model;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::vector<ToolDefinition> tools;
    Strategy optimize_for = Strategy::Balanced;
    Constraints constraints;
  };

  // =============================================================================
  // Predictions and Decisions
  // =============================================================================

  struct Interval {
    double low = 0.0;
    double high = 0.0;
  };

  struct CandidatePrediction {
    Provider provider;
    std::string model;
    double predicted_cost = 0.0;
    double predicted_latency_ms = 0.0;
    double predicted_quality = 0.0;
    double confidence = 0.0;
    Interval cost_interval;
    Interval latency_interval;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    double drift_penalty = 0.0;
    double score = 0.0;  // assigned by the routing strategy

    [[nodiscard]] std::string model_id() const;
  };

  enum class DecisionState {
    Init,
    CandidatesGathered,
    QuotaFiltered,
    Scored,
    Decided,
    Dispatched,
    FallbackDispatched,
    Failed
  };

  [[nodiscard]] std::string_view to_string(DecisionState s) noexcept;

  struct RoutingDecision {
    std::string request_id;
    Provider provider;
    std::string model;
    Strategy strategy = Strategy::Balanced;
    std::string reasoning;
    std::vector<CandidatePrediction> ranked;  // ranked[0] is the initial winner
    std::vector<Provider> attempted_providers;
    std::optional<std::string> pool_id;
    DecisionState state = DecisionState::Init;
    SystemTime timestamp;

    [[nodiscard]] const CandidatePrediction* chosen() const noexcept;
  };

  // =============================================================================
  // Outcomes
  // =============================================================================

  struct Usage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    double cost = 0.0;
  };

  struct ExecutionOutcome {
    std::string request_id;
    Provider provider;
    std::string model;
    double cost = 0.0;
    double latency_ms = 0.0;
    bool success = true;
    std::optional<std::string> error_kind;
    std::optional<double> quality_score;
    SystemTime timestamp;
  };

  /// Buffered completion returned to the caller of execute()
  struct CompletionResponse {
    std::string request_id;
    Provider provider;
    std::string model;
    std::string content;
    FinishReason finish_reason = FinishReason::Stop;
    Usage usage;
    RoutingDecision decision;
  };

  [[nodiscard]] std::string make_request_id();

}  // namespace switchboard
