#include <format>
#include <stdexcept>
#include <switchboard/common/json.hpp>
#include <switchboard/providers/wire.hpp>
#include <switchboard/streaming/translator.hpp>

namespace switchboard {

  namespace {

    Unexpected<RoutingError> malformed(Provider provider, std::string_view why) {
      return Unexpected(make_error(ErrorCode::MalformedStreamFrame,
                                   std::format("{} stream: {}", to_string(provider), why)));
    }

    std::optional<json> parse_object(const Frame& frame) {
      auto j = json::parse(frame.data, nullptr, false);
      if (j.is_discarded() || !j.is_object()) return std::nullopt;
      return j;
    }

    std::string error_text(const json& err) {
      if (err.is_string()) return err.get<std::string>();
      if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
      }
      return err.dump();
    }

    bool has_string(const json& j, const char* key) {
      return j.contains(key) && j[key].is_string();
    }

  }  // namespace

  // ============================================================================
  // OpenAI
  // ============================================================================

  Result<StreamEvent, RoutingError> OpenAITranslator::translate(const Frame& frame) {
    StreamEvent ev;
    if (frame.data == "[DONE]") {
      ev.end_of_stream = true;
      return ev;
    }
    auto j = parse_object(frame);
    if (!j) return malformed(provider(), "chunk is not a JSON object");
    if (j->contains("error")) {
      ev.error = error_text((*j)["error"]);
      return ev;
    }

    try {
      if (j->contains("choices") && !(*j)["choices"].empty()) {
        const auto& choice = (*j)["choices"].at(0);
        if (choice.contains("delta") && choice["delta"].is_object()) {
          const auto& delta = choice["delta"];
          if (has_string(delta, "role")) ev.role = delta["role"].get<std::string>();
          if (has_string(delta, "content")) ev.content = delta["content"].get<std::string>();
        }
        if (has_string(choice, "finish_reason")) {
          ev.finish_reason
              = map_finish_reason(provider(), choice["finish_reason"].get<std::string>());
        }
      }
      if (j->contains("usage") && (*j)["usage"].is_object()) {
        const auto& usage = (*j)["usage"];
        ev.usage = Usage{.prompt_tokens = usage.value("prompt_tokens", 0),
                         .completion_tokens = usage.value("completion_tokens", 0)};
      }
    } catch (const json::exception& e) {
      return malformed(provider(), e.what());
    }
    return ev;
  }

  // ============================================================================
  // Anthropic
  // ============================================================================

  Result<StreamEvent, RoutingError> AnthropicTranslator::translate(const Frame& frame) {
    auto j = parse_object(frame);
    if (!j) return malformed(provider(), "event data is not a JSON object");

    StreamEvent ev;
    try {
      const auto type = j->value("type", frame.event);
      if (type == "message_start") {
        ev.role = "assistant";
        const auto& message = j->at("message");
        if (message.contains("usage")) {
          ev.usage = Usage{.prompt_tokens = message["usage"].value("input_tokens", 0),
                           .completion_tokens = message["usage"].value("output_tokens", 0)};
        }
      } else if (type == "content_block_delta") {
        const auto& delta = j->at("delta");
        if (delta.value("type", "") == "text_delta") ev.content = delta.value("text", "");
      } else if (type == "message_delta") {
        if (j->contains("delta") && has_string((*j)["delta"], "stop_reason")) {
          ev.finish_reason
              = map_finish_reason(provider(), (*j)["delta"]["stop_reason"].get<std::string>());
        }
        if (j->contains("usage") && (*j)["usage"].is_object()) {
          ev.usage = Usage{.prompt_tokens = (*j)["usage"].value("input_tokens", 0),
                           .completion_tokens = (*j)["usage"].value("output_tokens", 0)};
        }
      } else if (type == "message_stop") {
        ev.end_of_stream = true;
      } else if (type == "error") {
        ev.error = error_text(j->value("error", json("unknown error")));
      }
      // ping, content_block_start and content_block_stop carry nothing
    } catch (const json::exception& e) {
      return malformed(provider(), e.what());
    }
    return ev;
  }

  // ============================================================================
  // Google
  // ============================================================================

  Result<StreamEvent, RoutingError> GoogleTranslator::translate(const Frame& frame) {
    auto j = parse_object(frame);
    if (!j) return malformed(provider(), "chunk is not a JSON object");

    StreamEvent ev;
    if (j->contains("error")) {
      ev.error = error_text((*j)["error"]);
      return ev;
    }
    try {
      if (j->contains("candidates") && !(*j)["candidates"].empty()) {
        const auto& candidate = (*j)["candidates"].at(0);
        if (candidate.contains("content") && candidate["content"].contains("parts")) {
          std::string text;
          for (const auto& part : candidate["content"]["parts"]) {
            if (has_string(part, "text")) text += part["text"].get<std::string>();
          }
          if (!text.empty()) ev.content = std::move(text);
        }
        if (has_string(candidate, "finishReason")) {
          ev.finish_reason
              = map_finish_reason(provider(), candidate["finishReason"].get<std::string>());
          ev.end_of_stream = true;
        }
      }
      if (j->contains("usageMetadata") && (*j)["usageMetadata"].is_object()) {
        const auto& usage = (*j)["usageMetadata"];
        ev.usage = Usage{.prompt_tokens = usage.value("promptTokenCount", 0),
                         .completion_tokens = usage.value("candidatesTokenCount", 0)};
      }
    } catch (const json::exception& e) {
      return malformed(provider(), e.what());
    }
    return ev;
  }

  // ============================================================================
  // Ollama
  // ============================================================================

  Result<StreamEvent, RoutingError> OllamaTranslator::translate(const Frame& frame) {
    auto j = parse_object(frame);
    if (!j) return malformed(provider(), "line is not a JSON object");

    StreamEvent ev;
    if (j->contains("error")) {
      ev.error = error_text((*j)["error"]);
      return ev;
    }
    try {
      if (j->contains("message") && (*j)["message"].is_object()) {
        const auto& message = (*j)["message"];
        if (has_string(message, "content") && !message["content"].get<std::string>().empty()) {
          ev.content = message["content"].get<std::string>();
        }
      }
      if (j->value("done", false)) {
        ev.finish_reason = map_finish_reason(provider(), j->value("done_reason", "stop"));
        ev.usage = Usage{.prompt_tokens = j->value("prompt_eval_count", 0),
                         .completion_tokens = j->value("eval_count", 0)};
        ev.end_of_stream = true;
      }
    } catch (const json::exception& e) {
      return malformed(provider(), e.what());
    }
    return ev;
  }

  std::unique_ptr<IStreamTranslator> make_translator(Provider provider) {
    switch (provider) {
      case Provider::OpenAI:
        return std::make_unique<OpenAITranslator>();
      case Provider::Anthropic:
        return std::make_unique<AnthropicTranslator>();
      case Provider::Google:
        return std::make_unique<GoogleTranslator>();
      case Provider::Ollama:
        return std::make_unique<OllamaTranslator>();
    }
    throw std::invalid_argument("unknown provider");
  }

}  // namespace switchboard
