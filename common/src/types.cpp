#include <algorithm>
#include <cctype>
#include <format>
#include <random>
#include <ranges>
#include <stdexcept>
#include <switchboard/common/json.hpp>
#include <switchboard/common/types.hpp>

namespace switchboard {

  namespace {

    bool iequals(std::string_view a, std::string_view b) noexcept {
      return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
               == std::tolower(static_cast<unsigned char>(y));
      });
    }

    template <typename Enum, size_t N>
    std::optional<Enum> lookup(std::string_view name,
                               const std::array<std::pair<std::string_view, Enum>, N>& table) {
      auto it = std::ranges::find_if(table, [&](const auto& e) { return iequals(e.first, name); });
      if (it == table.end()) return std::nullopt;
      return it->second;
    }

    template <typename T> std::optional<T> optional_field(const json& j, const char* key) {
      if (!j.contains(key) || j[key].is_null()) return std::nullopt;
      return j[key].get<T>();
    }

    template <typename T>
    std::optional<T> optional_field(const json& j, const char* key, const char* alias) {
      auto v = optional_field<T>(j, key);
      return v ? v : optional_field<T>(j, alias);
    }

    json interval_json(const Interval& i) { return json::array({i.low, i.high}); }

  }  // namespace

  // ============================================================================
  // Enum names
  // ============================================================================

  std::string_view to_string(Provider p) noexcept {
    switch (p) {
      case Provider::OpenAI:
        return "openai";
      case Provider::Anthropic:
        return "anthropic";
      case Provider::Google:
        return "google";
      case Provider::Ollama:
        return "ollama";
    }
    return "unknown";
  }

  std::string_view to_string(Strategy s) noexcept {
    switch (s) {
      case Strategy::Cost:
        return "cost";
      case Strategy::Speed:
        return "speed";
      case Strategy::Quality:
        return "quality";
      case Strategy::Balanced:
        return "balanced";
    }
    return "unknown";
  }

  std::string_view to_string(Tier t) noexcept {
    switch (t) {
      case Tier::Instant:
        return "instant";
      case Tier::Connected:
        return "connected";
      case Tier::Paid:
        return "paid";
    }
    return "unknown";
  }

  std::string_view to_string(FinishReason r) noexcept {
    switch (r) {
      case FinishReason::Stop:
        return "stop";
      case FinishReason::Length:
        return "length";
      case FinishReason::ToolCalls:
        return "tool_calls";
      case FinishReason::ContentFilter:
        return "content_filter";
      case FinishReason::Error:
        return "error";
    }
    return "unknown";
  }

  std::string_view to_string(CapabilityClass c) noexcept {
    switch (c) {
      case CapabilityClass::Chat:
        return "chat";
      case CapabilityClass::Code:
        return "code";
      case CapabilityClass::Analysis:
        return "analysis";
      case CapabilityClass::Creative:
        return "creative";
      case CapabilityClass::Support:
        return "support";
      case CapabilityClass::Complex:
        return "complex";
    }
    return "unknown";
  }

  std::string_view to_string(DecisionState s) noexcept {
    switch (s) {
      case DecisionState::Init:
        return "init";
      case DecisionState::CandidatesGathered:
        return "candidates_gathered";
      case DecisionState::QuotaFiltered:
        return "quota_filtered";
      case DecisionState::Scored:
        return "scored";
      case DecisionState::Decided:
        return "decided";
      case DecisionState::Dispatched:
        return "dispatched";
      case DecisionState::FallbackDispatched:
        return "fallback_dispatched";
      case DecisionState::Failed:
        return "failed";
    }
    return "unknown";
  }

  std::optional<Provider> parse_provider(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, Provider>, 6> kTable{{
        {"openai", Provider::OpenAI},
        {"anthropic", Provider::Anthropic},
        {"claude", Provider::Anthropic},
        {"google", Provider::Google},
        {"gemini", Provider::Google},
        {"ollama", Provider::Ollama},
    }};
    return lookup(name, kTable);
  }

  std::optional<Strategy> parse_strategy(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, Strategy>, 4> kTable{{
        {"cost", Strategy::Cost},
        {"speed", Strategy::Speed},
        {"quality", Strategy::Quality},
        {"balanced", Strategy::Balanced},
    }};
    return lookup(name, kTable);
  }

  std::optional<Tier> parse_tier(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, Tier>, 3> kTable{{
        {"instant", Tier::Instant},
        {"connected", Tier::Connected},
        {"paid", Tier::Paid},
    }};
    return lookup(name, kTable);
  }

  std::optional<FinishReason> parse_finish_reason(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, FinishReason>, 5> kTable{{
        {"stop", FinishReason::Stop},
        {"length", FinishReason::Length},
        {"tool_calls", FinishReason::ToolCalls},
        {"content_filter", FinishReason::ContentFilter},
        {"error", FinishReason::Error},
    }};
    return lookup(name, kTable);
  }

  std::optional<CapabilityClass> parse_capability(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, CapabilityClass>, 6> kTable{{
        {"chat", CapabilityClass::Chat},
        {"code", CapabilityClass::Code},
        {"analysis", CapabilityClass::Analysis},
        {"creative", CapabilityClass::Creative},
        {"support", CapabilityClass::Support},
        {"complex", CapabilityClass::Complex},
    }};
    return lookup(name, kTable);
  }

  std::string CandidatePrediction::model_id() const {
    return std::format("{}/{}", to_string(provider), model);
  }

  const CandidatePrediction* RoutingDecision::chosen() const noexcept {
    auto it = std::ranges::find_if(ranked, [&](const CandidatePrediction& c) {
      return c.provider == provider && c.model == model;
    });
    return it == ranked.end() ? nullptr : &*it;
  }

  std::string make_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::format("req_{:016x}", rng());
  }

  // ============================================================================
  // JSON Serialization - Enums
  // ============================================================================

  void to_json(json& j, Provider p) { j = std::string(to_string(p)); }

  void from_json(const json& j, Provider& p) {
    auto name = j.get<std::string>();
    auto parsed = parse_provider(name);
    if (!parsed) throw std::invalid_argument(std::format("unknown provider '{}'", name));
    p = *parsed;
  }

  void to_json(json& j, Strategy s) { j = std::string(to_string(s)); }

  void from_json(const json& j, Strategy& s) {
    auto name = j.get<std::string>();
    auto parsed = parse_strategy(name);
    if (!parsed) throw std::invalid_argument(std::format("unknown strategy '{}'", name));
    s = *parsed;
  }

  void to_json(json& j, Tier t) { j = std::string(to_string(t)); }

  void from_json(const json& j, Tier& t) {
    auto name = j.get<std::string>();
    auto parsed = parse_tier(name);
    if (!parsed) throw std::invalid_argument(std::format("unknown tier '{}'", name));
    t = *parsed;
  }

  void to_json(json& j, FinishReason r) { j = std::string(to_string(r)); }

  // ============================================================================
  // JSON Serialization - Requests
  // ============================================================================

  void to_json(json& j, const ToolCall& c) {
    j = {{"id", c.id},
         {"type", "function"},
         {"function", {{"name", c.name}, {"arguments", c.arguments}}}};
  }

  void from_json(const json& j, ToolCall& c) {
    c.id = j.value("id", "");
    const auto& fn = j.contains("function") ? j.at("function") : j;
    fn.at("name").get_to(c.name);
    if (fn.contains("arguments")) {
      const auto& args = fn.at("arguments");
      c.arguments = args.is_string() ? args.get<std::string>() : args.dump();
    }
  }

  void to_json(json& j, const Message& m) {
    j = {{"role", m.role}, {"content", m.content}};
    if (!m.tool_calls.empty()) j["tool_calls"] = m.tool_calls;
  }

  void from_json(const json& j, Message& m) {
    j.at("role").get_to(m.role);
    if (j.contains("content") && !j["content"].is_null()) {
      const auto& content = j["content"];
      if (content.is_string()) {
        m.content = content.get<std::string>();
      } else if (content.is_array()) {
        // OpenAI multi-part content: concatenate the text parts
        m.content.clear();
        for (const auto& part : content) {
          if (part.value("type", "") == "text") m.content += part.value("text", "");
        }
      } else {
        throw std::invalid_argument("message content must be a string or an array of parts");
      }
    }
    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
      m.tool_calls = j["tool_calls"].get<std::vector<ToolCall>>();
    }
  }

  void to_json(json& j, const ToolDefinition& t) {
    json params = t.parameters.empty() ? json::object() : json::parse(t.parameters);
    j = {{"type", "function"},
         {"function",
          {{"name", t.name}, {"description", t.description}, {"parameters", params}}}};
  }

  void from_json(const json& j, ToolDefinition& t) {
    const auto& fn = j.contains("function") ? j.at("function") : j;
    fn.at("name").get_to(t.name);
    t.description = fn.value("description", "");
    t.parameters = fn.contains("parameters") ? fn.at("parameters").dump() : "";
  }

  void to_json(json& j, const Constraints& c) {
    j = json::object();
    if (c.max_cost) j["maxCost"] = *c.max_cost;
    if (c.min_quality) j["minQuality"] = *c.min_quality;
    if (c.max_response_time_ms) j["maxResponseTimeMs"] = *c.max_response_time_ms;
    if (!c.preferred_providers.empty()) j["preferredProviders"] = c.preferred_providers;
    if (!c.exclude_providers.empty()) j["excludeProviders"] = c.exclude_providers;
  }

  void from_json(const json& j, Constraints& c) {
    c.max_cost = optional_field<double>(j, "maxCost");
    c.min_quality = optional_field<double>(j, "minQuality");
    c.max_response_time_ms = optional_field<double>(j, "maxResponseTimeMs");
    if (j.contains("preferredProviders"))
      c.preferred_providers = j["preferredProviders"].get<std::vector<Provider>>();
    if (j.contains("excludeProviders"))
      c.exclude_providers = j["excludeProviders"].get<std::vector<Provider>>();
  }

  void to_json(json& j, const RoutingRequest& r) {
    j = {{"messages", r.messages}, {"optimizeFor", r.optimize_for}};
    if (!r.request_id.empty()) j["requestId"] = r.request_id;
    if (!r.user_id.empty()) j["userId"] = r.user_id;
    if (r.model) j["model"] = *r.model;
    if (r.max_tokens) j["max_tokens"] = *r.max_tokens;
    if (r.temperature) j["temperature"] = *r.temperature;
    if (!r.tools.empty()) j["tools"] = r.tools;
    j["constraints"] = r.constraints;
  }

  void from_json(const json& j, RoutingRequest& r) {
    r.request_id = optional_field<std::string>(j, "requestId").value_or("");
    r.user_id = optional_field<std::string>(j, "userId", "user").value_or("");
    r.messages = j.at("messages").get<std::vector<Message>>();
    r.model = optional_field<std::string>(j, "model");
    r.max_tokens = optional_field<int>(j, "max_tokens", "maxTokens");
    r.temperature = optional_field<double>(j, "temperature");
    if (j.contains("tools") && j["tools"].is_array()) {
      r.tools = j["tools"].get<std::vector<ToolDefinition>>();
    }
    if (auto s = optional_field<Strategy>(j, "optimizeFor", "optimize_for")) r.optimize_for = *s;
    if (j.contains("constraints") && j["constraints"].is_object()) {
      r.constraints = j["constraints"].get<Constraints>();
    }
  }

  // ============================================================================
  // JSON Serialization - Decisions and Responses
  // ============================================================================

  void to_json(json& j, const CandidatePrediction& c) {
    j = {{"provider", c.provider},
         {"model", c.model},
         {"predictedCost", c.predicted_cost},
         {"predictedLatencyMs", c.predicted_latency_ms},
         {"predictedQuality", c.predicted_quality},
         {"confidence", c.confidence},
         {"costInterval", interval_json(c.cost_interval)},
         {"latencyInterval", interval_json(c.latency_interval)},
         {"score", c.score}};
  }

  void to_json(json& j, const RoutingDecision& d) {
    j = {{"requestId", d.request_id},
         {"provider", d.provider},
         {"model", d.model},
         {"strategy", d.strategy},
         {"reasoning", d.reasoning},
         {"state", std::string(to_string(d.state))},
         {"attemptedProviders", d.attempted_providers},
         {"alternatives", d.ranked},
         {"timestamp", to_unix_millis(d.timestamp)}};
    if (d.pool_id) j["poolId"] = *d.pool_id;
  }

  void to_json(json& j, const Usage& u) {
    j = {{"promptTokens", u.prompt_tokens},
         {"completionTokens", u.completion_tokens},
         {"cost", u.cost}};
  }

  void to_json(json& j, const CompletionResponse& r) {
    json alternatives = json::array();
    for (const auto& c : r.decision.ranked) {
      if (c.provider == r.provider && c.model == r.model) continue;
      alternatives.push_back(c);
    }
    j = {{"requestId", r.request_id},
         {"provider", r.provider},
         {"model", r.model},
         {"content", r.content},
         {"finishReason", r.finish_reason},
         {"usage", r.usage},
         {"routingDecision",
          {{"reasoning", r.decision.reasoning},
           {"strategy", r.decision.strategy},
           {"alternatives", alternatives}}}};
  }

  void to_json(json& j, const ExecutionOutcome& o) {
    j = {{"requestId", o.request_id},
         {"provider", o.provider},
         {"model", o.model},
         {"cost", o.cost},
         {"latencyMs", o.latency_ms},
         {"success", o.success},
         {"timestamp", to_unix_millis(o.timestamp)}};
    if (o.error_kind) j["errorKind"] = *o.error_kind;
    if (o.quality_score) j["qualityScore"] = *o.quality_score;
  }

  void from_json(const json& j, ExecutionOutcome& o) {
    j.at("requestId").get_to(o.request_id);
    j.at("provider").get_to(o.provider);
    j.at("model").get_to(o.model);
    o.cost = j.value("cost", 0.0);
    o.latency_ms = j.value("latencyMs", 0.0);
    o.success = j.value("success", true);
    o.error_kind = optional_field<std::string>(j, "errorKind");
    o.quality_score = optional_field<double>(j, "qualityScore");
    if (auto ts = optional_field<std::int64_t>(j, "timestamp")) {
      o.timestamp = from_unix_millis(*ts);
    }
  }

  void to_json(json& j, const UpgradePrompt& p) {
    j = {{"title", p.title},
         {"message", p.message},
         {"urgency", std::string(to_string(p.urgency))},
         {"benefits", p.benefits}};
  }

  void to_json(json& j, const RoutingError& e) {
    j = {{"error", std::string(to_string(e.code))}, {"message", e.message}, {"status", http_status(e.code)}};
    if (e.upgrade_prompt) j["upgradePrompt"] = *e.upgrade_prompt;
    if (!e.attempted_providers.empty()) j["attemptedProviders"] = e.attempted_providers;
  }

  // ============================================================================
  // Body Parsing
  // ============================================================================

  RoutingRequest parse_routing_request(const std::string& body) {
    RoutingRequest request;
    try {
      request = json::parse(body).get<RoutingRequest>();
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::format("malformed routing request: {}", e.what()));
    }

    if (request.messages.empty()) {
      throw std::invalid_argument("routing request must contain at least one message");
    }
    if (request.max_tokens && *request.max_tokens <= 0) {
      throw std::invalid_argument(
          std::format("max_tokens must be positive, got {}", *request.max_tokens));
    }
    const auto& c = request.constraints;
    if (c.min_quality && (*c.min_quality < 0.0 || *c.min_quality > 1.0)) {
      throw std::invalid_argument(
          std::format("minQuality must be within [0, 1], got {}", *c.min_quality));
    }
    if (c.max_cost && *c.max_cost < 0.0) {
      throw std::invalid_argument(std::format("maxCost must be non-negative, got {}", *c.max_cost));
    }
    if (c.max_response_time_ms && *c.max_response_time_ms <= 0.0) {
      throw std::invalid_argument(std::format("maxResponseTimeMs must be positive, got {}",
                                              *c.max_response_time_ms));
    }
    return request;
  }

  ExecutionOutcome parse_outcome(const std::string& body) {
    ExecutionOutcome outcome;
    try {
      outcome = json::parse(body).get<ExecutionOutcome>();
    } catch (const json::exception& e) {
      throw std::invalid_argument(std::format("malformed outcome: {}", e.what()));
    }

    if (outcome.request_id.empty()) {
      throw std::invalid_argument("outcome requestId must not be empty");
    }
    if (outcome.cost < 0.0 || outcome.latency_ms < 0.0) {
      throw std::invalid_argument("outcome cost and latencyMs must be non-negative");
    }
    if (outcome.quality_score && (*outcome.quality_score < 0.0 || *outcome.quality_score > 1.0)) {
      throw std::invalid_argument(
          std::format("qualityScore must be within [0, 1], got {}", *outcome.quality_score));
    }
    return outcome;
  }

}  // namespace switchboard
