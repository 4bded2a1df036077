#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  /// One complete framing unit: an SSE event or one NDJSON line
  struct Frame {
    std::string event;  // SSE "event:" field, empty otherwise
    std::string data;
  };

  /**
   * Reassembles framing units from arbitrary byte slices.
   *
   * feed() returns every unit completed by the new bytes; a partial unit stays buffered
   * until a later feed() completes it or finish() flushes it at end of stream.
   */
  class IFramer {
  public:
    virtual ~IFramer() = default;

    IFramer(const IFramer&) = delete;
    IFramer& operator=(const IFramer&) = delete;
    IFramer(IFramer&&) = delete;
    IFramer& operator=(IFramer&&) = delete;

    [[nodiscard]] virtual std::vector<Frame> feed(std::string_view bytes) = 0;
    [[nodiscard]] virtual std::vector<Frame> finish() = 0;
    [[nodiscard]] virtual size_t buffered() const noexcept = 0;

  protected:
    IFramer() = default;
  };

  /// text/event-stream: events separated by a blank line, multi-line data joined with '\n'
  class SseFramer final : public IFramer {
  public:
    SseFramer() = default;

    [[nodiscard]] std::vector<Frame> feed(std::string_view bytes) override;
    [[nodiscard]] std::vector<Frame> finish() override;
    [[nodiscard]] size_t buffered() const noexcept override { return buffer_.size(); }

  private:
    void take_line(std::string_view line, std::vector<Frame>& out);
    void emit(std::vector<Frame>& out);

    std::string buffer_;
    Frame current_;
    bool has_data_ = false;
  };

  /// Newline-delimited JSON; blank lines are ignored
  class NdjsonFramer final : public IFramer {
  public:
    NdjsonFramer() = default;

    [[nodiscard]] std::vector<Frame> feed(std::string_view bytes) override;
    [[nodiscard]] std::vector<Frame> finish() override;
    [[nodiscard]] size_t buffered() const noexcept override { return buffer_.size(); }

  private:
    std::string buffer_;
  };

  /// Ollama streams NDJSON, every other provider SSE
  [[nodiscard]] std::unique_ptr<IFramer> make_framer(Provider provider);

}  // namespace switchboard
