#include <algorithm>
#include <format>
#include <stdexcept>
#include <switchboard/common/json.hpp>
#include <switchboard/providers/wire.hpp>

namespace switchboard {

  namespace {

    json parse_arguments(const std::string& raw) {
      if (raw.empty()) return json::object();
      auto parsed = json::parse(raw, nullptr, false);
      return parsed.is_discarded() ? json(raw) : parsed;
    }

    json parse_schema(const std::string& raw) {
      if (raw.empty()) return json{{"type", "object"}, {"properties", json::object()}};
      return json::parse(raw);
    }

    std::string joined_system_prompt(const RoutingRequest& request) {
      std::string out;
      for (const auto& m : request.messages) {
        if (m.role != "system") continue;
        if (!out.empty()) out += "\n\n";
        out += m.content;
      }
      return out;
    }

    // ============================================================================
    // Request Bodies
    // ============================================================================

    json openai_body(const std::string& model, const RoutingRequest& r, bool stream) {
      json messages = json::array();
      for (const auto& m : r.messages) messages.push_back(m);

      json body = {{"model", model}, {"messages", messages}, {"stream", stream}};
      if (r.max_tokens) body["max_tokens"] = *r.max_tokens;
      if (r.temperature) body["temperature"] = *r.temperature;
      if (!r.tools.empty()) body["tools"] = r.tools;
      if (stream) body["stream_options"] = {{"include_usage", true}};
      return body;
    }

    json anthropic_body(const std::string& model, const RoutingRequest& r, bool stream) {
      json messages = json::array();
      for (const auto& m : r.messages) {
        if (m.role == "system") continue;
        const std::string role = m.role == "assistant" ? "assistant" : "user";

        if (m.tool_calls.empty()) {
          messages.push_back({{"role", role}, {"content", m.content}});
          continue;
        }
        json blocks = json::array();
        if (!m.content.empty()) blocks.push_back({{"type", "text"}, {"text", m.content}});
        for (const auto& call : m.tool_calls) {
          blocks.push_back({{"type", "tool_use"},
                            {"id", call.id},
                            {"name", call.name},
                            {"input", parse_arguments(call.arguments)}});
        }
        messages.push_back({{"role", role}, {"content", blocks}});
      }

      json body = {{"model", model},
                   {"messages", messages},
                   {"max_tokens", r.max_tokens.value_or(kAnthropicDefaultMaxTokens)},
                   {"stream", stream}};
      if (auto system = joined_system_prompt(r); !system.empty()) body["system"] = system;
      if (r.temperature) body["temperature"] = *r.temperature;
      if (!r.tools.empty()) {
        json tools = json::array();
        for (const auto& t : r.tools) {
          tools.push_back({{"name", t.name},
                           {"description", t.description},
                           {"input_schema", parse_schema(t.parameters)}});
        }
        body["tools"] = tools;
      }
      return body;
    }

    json google_body(const RoutingRequest& r) {
      json contents = json::array();
      for (const auto& m : r.messages) {
        if (m.role == "system") continue;
        json parts = json::array();
        if (!m.content.empty()) parts.push_back({{"text", m.content}});
        for (const auto& call : m.tool_calls) {
          parts.push_back(
              {{"functionCall", {{"name", call.name}, {"args", parse_arguments(call.arguments)}}}});
        }
        if (parts.empty()) parts.push_back({{"text", ""}});
        contents.push_back({{"role", m.role == "assistant" ? "model" : "user"}, {"parts", parts}});
      }

      json body = {{"contents", contents}};
      if (auto system = joined_system_prompt(r); !system.empty()) {
        body["systemInstruction"] = {{"parts", json::array({{{"text", system}}})}};
      }
      json config = json::object();
      if (r.max_tokens) config["maxOutputTokens"] = *r.max_tokens;
      if (r.temperature) config["temperature"] = *r.temperature;
      if (!config.empty()) body["generationConfig"] = config;
      if (!r.tools.empty()) {
        json declarations = json::array();
        for (const auto& t : r.tools) {
          declarations.push_back({{"name", t.name},
                                  {"description", t.description},
                                  {"parameters", parse_schema(t.parameters)}});
        }
        body["tools"] = json::array({{{"functionDeclarations", declarations}}});
      }
      return body;
    }

    json ollama_body(const std::string& model, const RoutingRequest& r, bool stream) {
      json messages = json::array();
      for (const auto& m : r.messages) {
        messages.push_back({{"role", m.role}, {"content", m.content}});
      }
      json body = {{"model", model}, {"messages", messages}, {"stream", stream}};
      json options = json::object();
      if (r.max_tokens) options["num_predict"] = *r.max_tokens;
      if (r.temperature) options["temperature"] = *r.temperature;
      if (!options.empty()) body["options"] = options;
      return body;
    }

    // ============================================================================
    // Response Parsing
    // ============================================================================

    ProviderResponse parse_openai(const json& j) {
      ProviderResponse out;
      const auto& choice = j.at("choices").at(0);
      const auto& message = choice.at("message");
      if (message.contains("content") && message["content"].is_string()) {
        out.content = message["content"].get<std::string>();
      }
      if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        out.tool_calls = message["tool_calls"].get<std::vector<ToolCall>>();
      }
      if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        out.finish_reason
            = map_finish_reason(Provider::OpenAI, choice["finish_reason"].get<std::string>());
      }
      if (j.contains("usage") && j["usage"].is_object()) {
        out.usage.prompt_tokens = j["usage"].value("prompt_tokens", 0);
        out.usage.completion_tokens = j["usage"].value("completion_tokens", 0);
      }
      return out;
    }

    ProviderResponse parse_anthropic(const json& j) {
      ProviderResponse out;
      for (const auto& block : j.at("content")) {
        const auto type = block.value("type", "");
        if (type == "text") {
          out.content += block.value("text", "");
        } else if (type == "tool_use") {
          out.tool_calls.push_back(ToolCall{.id = block.value("id", ""),
                                            .name = block.value("name", ""),
                                            .arguments = block.value("input", json::object()).dump()});
        }
      }
      if (j.contains("stop_reason") && j["stop_reason"].is_string()) {
        out.finish_reason
            = map_finish_reason(Provider::Anthropic, j["stop_reason"].get<std::string>());
      }
      if (j.contains("usage") && j["usage"].is_object()) {
        out.usage.prompt_tokens = j["usage"].value("input_tokens", 0);
        out.usage.completion_tokens = j["usage"].value("output_tokens", 0);
      }
      return out;
    }

    ProviderResponse parse_google(const json& j) {
      ProviderResponse out;
      const auto& candidate = j.at("candidates").at(0);
      if (candidate.contains("content") && candidate["content"].contains("parts")) {
        for (const auto& part : candidate["content"]["parts"]) {
          if (part.contains("text")) out.content += part["text"].get<std::string>();
          if (part.contains("functionCall")) {
            const auto& call = part["functionCall"];
            out.tool_calls.push_back(
                ToolCall{.id = std::format("call_{}", out.tool_calls.size()),
                         .name = call.value("name", ""),
                         .arguments = call.value("args", json::object()).dump()});
          }
        }
      }
      if (candidate.contains("finishReason") && candidate["finishReason"].is_string()) {
        out.finish_reason
            = map_finish_reason(Provider::Google, candidate["finishReason"].get<std::string>());
      }
      if (!out.tool_calls.empty()) out.finish_reason = FinishReason::ToolCalls;
      if (j.contains("usageMetadata") && j["usageMetadata"].is_object()) {
        out.usage.prompt_tokens = j["usageMetadata"].value("promptTokenCount", 0);
        out.usage.completion_tokens = j["usageMetadata"].value("candidatesTokenCount", 0);
      }
      return out;
    }

    ProviderResponse parse_ollama(const json& j) {
      ProviderResponse out;
      out.content = j.at("message").value("content", "");
      if (j.contains("done_reason") && j["done_reason"].is_string()) {
        out.finish_reason = map_finish_reason(Provider::Ollama, j["done_reason"].get<std::string>());
      }
      out.usage.prompt_tokens = j.value("prompt_eval_count", 0);
      out.usage.completion_tokens = j.value("eval_count", 0);
      return out;
    }

    std::optional<std::string> provider_error_message(const json& j) {
      if (!j.contains("error")) return std::nullopt;
      const auto& err = j["error"];
      if (err.is_string()) return err.get<std::string>();
      if (err.is_object()) return err.value("message", err.dump());
      return err.dump();
    }

  }  // namespace

  std::string default_base_url(Provider provider) {
    switch (provider) {
      case Provider::OpenAI:
        return "https://api.openai.com";
      case Provider::Anthropic:
        return "https://api.anthropic.com";
      case Provider::Google:
        return "https://generativelanguage.googleapis.com";
      case Provider::Ollama:
        return "http://localhost:11434";
    }
    throw std::invalid_argument("unknown provider");
  }

  json build_request_body(Provider provider, const std::string& model,
                          const RoutingRequest& request, bool stream) {
    switch (provider) {
      case Provider::OpenAI:
        return openai_body(model, request, stream);
      case Provider::Anthropic:
        return anthropic_body(model, request, stream);
      case Provider::Google:
        return google_body(request);
      case Provider::Ollama:
        return ollama_body(model, request, stream);
    }
    throw std::invalid_argument("unknown provider");
  }

  WireRequest build_wire_request(const DispatchRequest& dispatch, const std::string& base_url) {
    if (dispatch.request == nullptr) {
      throw std::invalid_argument("dispatch request carries no routing request");
    }
    WireRequest wire;
    wire.body = build_request_body(dispatch.provider, dispatch.model, *dispatch.request,
                                   dispatch.stream)
                    .dump();
    wire.headers.emplace_back("Content-Type", "application/json");

    switch (dispatch.provider) {
      case Provider::OpenAI:
        wire.url = base_url + "/v1/chat/completions";
        wire.headers.emplace_back("Authorization", "Bearer " + dispatch.api_key);
        break;
      case Provider::Anthropic:
        wire.url = base_url + "/v1/messages";
        wire.headers.emplace_back("x-api-key", dispatch.api_key);
        wire.headers.emplace_back("anthropic-version", kAnthropicVersion);
        break;
      case Provider::Google:
        wire.url = dispatch.stream
                       ? std::format("{}/v1beta/models/{}:streamGenerateContent?alt=sse", base_url,
                                     dispatch.model)
                       : std::format("{}/v1beta/models/{}:generateContent", base_url,
                                     dispatch.model);
        wire.headers.emplace_back("x-goog-api-key", dispatch.api_key);
        break;
      case Provider::Ollama:
        wire.url = base_url + "/api/chat";
        break;
    }
    if (dispatch.stream && dispatch.provider != Provider::Ollama) {
      wire.headers.emplace_back("Accept", "text/event-stream");
    }
    return wire;
  }

  FinishReason map_finish_reason(Provider provider, std::string_view native) {
    switch (provider) {
      case Provider::Anthropic:
        if (native == "max_tokens") return FinishReason::Length;
        if (native == "tool_use") return FinishReason::ToolCalls;
        return FinishReason::Stop;
      case Provider::Google:
        if (native == "MAX_TOKENS") return FinishReason::Length;
        if (native == "SAFETY" || native == "RECITATION") return FinishReason::ContentFilter;
        return FinishReason::Stop;
      case Provider::OpenAI:
      case Provider::Ollama:
        break;
    }
    return parse_finish_reason(native).value_or(FinishReason::Stop);
  }

  Result<ProviderResponse, ProviderError> parse_completion(Provider provider,
                                                           std::string_view body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return Unexpected(ProviderError{.kind = "malformed",
                                      .message = std::format("{} returned a non-JSON body",
                                                             to_string(provider)),
                                      .status = std::nullopt});
    }
    if (auto message = provider_error_message(j)) {
      return Unexpected(ProviderError{.kind = "provider", .message = *message, .status = std::nullopt});
    }

    try {
      switch (provider) {
        case Provider::OpenAI:
          return parse_openai(j);
        case Provider::Anthropic:
          return parse_anthropic(j);
        case Provider::Google:
          return parse_google(j);
        case Provider::Ollama:
          return parse_ollama(j);
      }
    } catch (const json::exception& e) {
      return Unexpected(ProviderError{
          .kind = "malformed",
          .message = std::format("unexpected {} response shape: {}", to_string(provider), e.what()),
          .status = std::nullopt});
    }
    return Unexpected(ProviderError{.kind = "malformed", .message = "unknown provider", .status = std::nullopt});
  }

}  // namespace switchboard
