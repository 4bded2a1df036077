#include <stdexcept>
#include <switchboard/common/logging.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/streaming/normalizer.hpp>

namespace switchboard {

  namespace {

    void merge_usage(Usage& into, const Usage& from) noexcept {
      if (from.prompt_tokens > 0) into.prompt_tokens = from.prompt_tokens;
      if (from.completion_tokens > 0) into.completion_tokens = from.completion_tokens;
    }

  }  // namespace

  StreamNormalizer::StreamNormalizer(std::unique_ptr<IByteSource> source,
                                     std::unique_ptr<IStreamTranslator> translator,
                                     std::unique_ptr<IFramer> framer, StreamIdentity identity,
                                     std::stop_token stop)
      : source_(std::move(source)),
        translator_(std::move(translator)),
        framer_(std::move(framer)),
        identity_(std::move(identity)),
        stop_(std::move(stop)) {
    if (!source_ || !translator_ || !framer_) {
      throw std::invalid_argument("StreamNormalizer requires a source, translator and framer");
    }
    summary_.id = identity_.id;
    summary_.provider = identity_.provider;
    summary_.model = identity_.model;

    if (stop_.stop_possible()) {
      stop_callback_.emplace(stop_, [this] { source_->close(); });
    }
  }

  StreamNormalizer::StreamNormalizer(std::unique_ptr<IByteSource> source,
                                     StreamIdentity identity, std::stop_token stop)
      : StreamNormalizer(std::move(source), make_translator(identity.provider),
                         make_framer(identity.provider), identity, std::move(stop)) {}

  StreamNormalizer::~StreamNormalizer() {
    stop_callback_.reset();
    if (!done_) {
      cancelled_ = true;
      finish(FinishReason::Error, false);
    }
  }

  void StreamNormalizer::cancel() noexcept {
    cancelled_ = true;
    source_->close();
  }

  void StreamNormalizer::on_complete(CompletionHook hook) { hook_ = std::move(hook); }

  bool StreamNormalizer::interrupted() const noexcept {
    return cancelled_ || stop_.stop_requested();
  }

  std::optional<CanonicalChunk> StreamNormalizer::next() {
    SWITCHBOARD_ZONE;
    while (ready_.empty() && !done_) {
      if (interrupted()) {
        summary_.cancelled = true;
        finish(FinishReason::Error);
        break;
      }

      auto bytes = source_->read(stop_);
      if (!bytes) {
        if (interrupted()) {
          summary_.cancelled = true;
        } else {
          summary_.error = bytes.error().message;
          logger()->warn("{} stream {} failed mid-stream: {}", to_string(identity_.provider),
                         identity_.id, bytes.error().message);
        }
        finish(FinishReason::Error);
        break;
      }

      if (!bytes.value()) {
        for (const auto& frame : framer_->finish()) {
          handle(frame);
          if (done_) break;
        }
        if (!done_) finish(pending_finish_.value_or(FinishReason::Stop));
        break;
      }

      for (const auto& frame : framer_->feed(*bytes.value())) {
        handle(frame);
        if (done_) break;
      }
    }

    if (ready_.empty()) return std::nullopt;
    auto chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
  }

  void StreamNormalizer::handle(const Frame& frame) {
    auto translated = translator_->translate(frame);
    if (!translated) {
      ++summary_.malformed_frames;
      logger()->debug("skipping frame on {}: {}", identity_.id, translated.error().message);
      return;
    }
    const auto& ev = translated.value();
    if (ev.empty()) return;

    if (ev.usage) merge_usage(summary_.usage, *ev.usage);
    if (ev.error) {
      summary_.error = ev.error;
      logger()->warn("{} reported an error on stream {}: {}", to_string(identity_.provider),
                     identity_.id, *ev.error);
      finish(FinishReason::Error);
      return;
    }

    if (ev.content || ev.role) {
      auto chunk = make_chunk();
      chunk.delta.role = ev.role;
      chunk.delta.content = ev.content;
      if (ev.content) summary_.content_chars += ev.content->size();
      ++summary_.chunks;
      ready_.push_back(std::move(chunk));
    }
    if (ev.finish_reason) pending_finish_ = ev.finish_reason;
    if (ev.end_of_stream) finish(pending_finish_.value_or(FinishReason::Stop));
  }

  CanonicalChunk StreamNormalizer::make_chunk() const {
    return CanonicalChunk{.id = identity_.id,
                          .model = identity_.model,
                          .created = identity_.created,
                          .delta = {},
                          .finish_reason = std::nullopt,
                          .usage = std::nullopt};
  }

  void StreamNormalizer::finish(FinishReason reason, bool emit_chunk) noexcept {
    if (done_) return;
    done_ = true;
    summary_.finish_reason = reason;
    if (cancelled_) summary_.cancelled = true;

    try {
      if (emit_chunk) {
        auto chunk = make_chunk();
        chunk.finish_reason = reason;
        chunk.usage = summary_.usage;
        ++summary_.chunks;
        ready_.push_back(std::move(chunk));
      }
    } catch (const std::exception& e) {
      logger()->error("failed to queue terminal chunk for {}: {}", identity_.id, e.what());
    }

    source_->close();

    if (hook_) {
      try {
        hook_(summary_);
      } catch (const std::exception& e) {
        logger()->error("stream completion hook threw for {}: {}", identity_.id, e.what());
      }
    }
  }

}  // namespace switchboard
