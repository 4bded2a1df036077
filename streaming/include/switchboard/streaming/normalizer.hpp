#pragma once
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/providers/provider_client.hpp>
#include <switchboard/streaming/chunk.hpp>
#include <switchboard/streaming/framing.hpp>
#include <switchboard/streaming/translator.hpp>

namespace switchboard {

  /// Fields stamped on every canonical chunk of one stream
  struct StreamIdentity {
    std::string id;
    Provider provider;
    std::string model;
    std::int64_t created = 0;  // unix seconds
  };

  struct StreamSummary {
    std::string id;
    Provider provider;
    std::string model;
    FinishReason finish_reason = FinishReason::Stop;
    Usage usage;
    size_t chunks = 0;
    size_t content_chars = 0;
    size_t malformed_frames = 0;
    bool cancelled = false;
    std::optional<std::string> error;
  };

  /**
   * Pull iterator from a provider byte stream to canonical chunks.
   *
   * next() yields chunks in provider order and exactly one terminal chunk (non-null
   * finish_reason), then nullopt forever. Transport end without a terminal signal yields
   * `stop`; a transport failure, in-band provider error or cancellation yields `error`.
   * The completion hook fires once with the summary, including when the normalizer is
   * destroyed before the stream ends.
   */
  class StreamNormalizer {
  public:
    using CompletionHook = std::function<void(const StreamSummary&)>;

    StreamNormalizer(std::unique_ptr<IByteSource> source,
                     std::unique_ptr<IStreamTranslator> translator,
                     std::unique_ptr<IFramer> framer, StreamIdentity identity,
                     std::stop_token stop = {});

    /// Framer and translator chosen from identity.provider
    StreamNormalizer(std::unique_ptr<IByteSource> source, StreamIdentity identity,
                     std::stop_token stop = {});

    ~StreamNormalizer();

    StreamNormalizer(const StreamNormalizer&) = delete;
    StreamNormalizer& operator=(const StreamNormalizer&) = delete;
    StreamNormalizer(StreamNormalizer&&) = delete;
    StreamNormalizer& operator=(StreamNormalizer&&) = delete;

    [[nodiscard]] std::optional<CanonicalChunk> next();

    /// Safe from any thread; closes the transport so a blocked next() returns promptly
    void cancel() noexcept;

    void on_complete(CompletionHook hook);

    [[nodiscard]] bool finished() const noexcept { return done_; }
    [[nodiscard]] const StreamSummary& summary() const noexcept { return summary_; }
    [[nodiscard]] const StreamIdentity& identity() const noexcept { return identity_; }

  private:
    void handle(const Frame& frame);
    void finish(FinishReason reason, bool emit_chunk = true) noexcept;
    [[nodiscard]] CanonicalChunk make_chunk() const;
    [[nodiscard]] bool interrupted() const noexcept;

    std::unique_ptr<IByteSource> source_;
    std::unique_ptr<IStreamTranslator> translator_;
    std::unique_ptr<IFramer> framer_;
    StreamIdentity identity_;
    std::stop_token stop_;

    std::deque<CanonicalChunk> ready_;
    std::optional<FinishReason> pending_finish_;
    StreamSummary summary_;
    CompletionHook hook_;
    bool done_ = false;
    std::atomic<bool> cancelled_{false};

    // Declared last: unregisters before the source it closes is destroyed
    std::optional<std::stop_callback<std::function<void()>>> stop_callback_;
  };

}  // namespace switchboard
