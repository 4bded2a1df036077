#pragma once
#include <memory>
#include <optional>
#include <string>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/streaming/framing.hpp>

namespace switchboard {

  /// Provider-neutral meaning of one framing unit. Every field is optional; keep-alive
  /// units translate to an empty event.
  struct StreamEvent {
    std::optional<std::string> role;
    std::optional<std::string> content;
    std::optional<FinishReason> finish_reason;
    std::optional<Usage> usage;
    bool end_of_stream = false;        // no further content follows this unit
    std::optional<std::string> error;  // provider reported an error in-band

    [[nodiscard]] bool empty() const noexcept {
      return !role && !content && !finish_reason && !usage && !end_of_stream && !error;
    }
  };

  /// Translates one provider's framing units. Malformed units yield MalformedStreamFrame.
  class IStreamTranslator {
  public:
    virtual ~IStreamTranslator() = default;

    IStreamTranslator(const IStreamTranslator&) = delete;
    IStreamTranslator& operator=(const IStreamTranslator&) = delete;
    IStreamTranslator(IStreamTranslator&&) = delete;
    IStreamTranslator& operator=(IStreamTranslator&&) = delete;

    [[nodiscard]] virtual Result<StreamEvent, RoutingError> translate(const Frame& frame) = 0;
    [[nodiscard]] virtual Provider provider() const noexcept = 0;

  protected:
    IStreamTranslator() = default;
  };

  /// chat.completion.chunk events; "[DONE]" ends the stream
  class OpenAITranslator final : public IStreamTranslator {
  public:
    [[nodiscard]] Result<StreamEvent, RoutingError> translate(const Frame& frame) override;
    [[nodiscard]] Provider provider() const noexcept override { return Provider::OpenAI; }
  };

  /// Messages API events: message_start, content_block_delta, message_delta, message_stop
  class AnthropicTranslator final : public IStreamTranslator {
  public:
    [[nodiscard]] Result<StreamEvent, RoutingError> translate(const Frame& frame) override;
    [[nodiscard]] Provider provider() const noexcept override { return Provider::Anthropic; }
  };

  /// streamGenerateContent?alt=sse; the unit carrying finishReason is the last
  class GoogleTranslator final : public IStreamTranslator {
  public:
    [[nodiscard]] Result<StreamEvent, RoutingError> translate(const Frame& frame) override;
    [[nodiscard]] Provider provider() const noexcept override { return Provider::Google; }
  };

  /// /api/chat NDJSON; "done": true ends the stream
  class OllamaTranslator final : public IStreamTranslator {
  public:
    [[nodiscard]] Result<StreamEvent, RoutingError> translate(const Frame& frame) override;
    [[nodiscard]] Provider provider() const noexcept override { return Provider::Ollama; }
  };

  [[nodiscard]] std::unique_ptr<IStreamTranslator> make_translator(Provider provider);

}  // namespace switchboard
