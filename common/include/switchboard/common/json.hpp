#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <switchboard/common/error.hpp>
#include <switchboard/common/types.hpp>

// nlohmann::json adapters for the request/response contract. Field names follow the public
// JSON surface (camelCase for routing fields, snake_case for the OpenAI-style fields).

namespace switchboard {

  using json = nlohmann::json;

  void to_json(json& j, Provider p);
  void from_json(const json& j, Provider& p);
  void to_json(json& j, Strategy s);
  void from_json(const json& j, Strategy& s);
  void to_json(json& j, Tier t);
  void from_json(const json& j, Tier& t);
  void to_json(json& j, FinishReason r);

  void to_json(json& j, const ToolCall& c);
  void from_json(const json& j, ToolCall& c);
  void to_json(json& j, const Message& m);
  void from_json(const json& j, Message& m);
  void to_json(json& j, const ToolDefinition& t);
  void from_json(const json& j, ToolDefinition& t);
  void to_json(json& j, const Constraints& c);
  void from_json(const json& j, Constraints& c);
  void to_json(json& j, const RoutingRequest& r);
  void from_json(const json& j, RoutingRequest& r);

  void to_json(json& j, const CandidatePrediction& c);
  void to_json(json& j, const RoutingDecision& d);
  void to_json(json& j, const Usage& u);
  void to_json(json& j, const CompletionResponse& r);
  void to_json(json& j, const ExecutionOutcome& o);
  void from_json(const json& j, ExecutionOutcome& o);

  void to_json(json& j, const UpgradePrompt& p);
  void to_json(json& j, const RoutingError& e);

  /// Parses an inbound request body; throws std::invalid_argument on malformed input
  [[nodiscard]] RoutingRequest parse_routing_request(const std::string& body);

  /// Parses an outcome submission body; throws std::invalid_argument on malformed input
  [[nodiscard]] ExecutionOutcome parse_outcome(const std::string& body);

}  // namespace switchboard
