#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/providers/provider_client.hpp>
#include <utility>
#include <vector>

namespace switchboard::testing {

  /// Observes a byte source after ownership moved into a normalizer
  struct SourceProbe {
    std::atomic<int> reads{0};
    std::atomic<int> close_calls{0};
    std::atomic<bool> closed{false};
  };

  /// Replays fixed byte slices, then EOF or a transport error
  class ChunkedByteSource final : public IByteSource {
  public:
    explicit ChunkedByteSource(std::vector<std::string> chunks,
                               std::shared_ptr<SourceProbe> probe = std::make_shared<SourceProbe>(),
                               std::optional<ProviderError> fail_at_end = std::nullopt)
        : chunks_(std::move(chunks)), probe_(std::move(probe)), fail_(std::move(fail_at_end)) {}

    Result<std::optional<std::string>, ProviderError> read(std::stop_token) override {
      ++probe_->reads;
      if (probe_->closed) {
        return Unexpected(ProviderError{.kind = "cancelled", .message = "closed", .status = {}});
      }
      if (next_ < chunks_.size()) return std::optional<std::string>{chunks_[next_++]};
      if (fail_) return Unexpected(*fail_);
      return std::optional<std::string>{};
    }

    void close() noexcept override {
      ++probe_->close_calls;
      probe_->closed = true;
    }

  private:
    std::vector<std::string> chunks_;
    std::shared_ptr<SourceProbe> probe_;
    std::optional<ProviderError> fail_;
    size_t next_ = 0;
  };

  /// Yields its slices, then blocks until closed or stopped
  class BlockingByteSource final : public IByteSource {
  public:
    explicit BlockingByteSource(std::vector<std::string> chunks,
                                std::shared_ptr<SourceProbe> probe = std::make_shared<SourceProbe>())
        : chunks_(std::move(chunks)), probe_(std::move(probe)) {}

    Result<std::optional<std::string>, ProviderError> read(std::stop_token stop) override {
      ++probe_->reads;
      std::unique_lock lock(mutex_);
      if (next_ < chunks_.size()) return std::optional<std::string>{chunks_[next_++]};
      cv_.wait(lock, stop, [this] { return probe_->closed.load(); });
      return Unexpected(ProviderError{.kind = "cancelled", .message = "closed", .status = {}});
    }

    void close() noexcept override {
      {
        std::lock_guard lock(mutex_);
        ++probe_->close_calls;
        probe_->closed = true;
      }
      cv_.notify_all();
    }

  private:
    std::vector<std::string> chunks_;
    std::shared_ptr<SourceProbe> probe_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    size_t next_ = 0;
  };

  struct RecordedCall {
    Provider provider;
    std::string model;
    std::string pool_id;
    std::string api_key;
    bool stream = false;
    std::optional<SystemTime> deadline;
  };

  /// Provider transport double with per-provider scripted results
  class ScriptedProviderClient final : public IProviderClient {
  public:
    ScriptedProviderClient() = default;

    void succeed(Provider provider, ProviderResponse response) {
      std::lock_guard lock(mutex_);
      failures_.erase(provider);
      responses_[provider] = std::move(response);
    }

    void fail(Provider provider, ProviderError error) {
      std::lock_guard lock(mutex_);
      failures_[provider] = std::move(error);
    }

    void stream(Provider provider, std::vector<std::string> chunks,
                std::shared_ptr<SourceProbe> probe = std::make_shared<SourceProbe>()) {
      std::lock_guard lock(mutex_);
      failures_.erase(provider);
      streams_[provider] = {std::move(chunks), std::move(probe)};
    }

    Result<ProviderResponse, ProviderError> complete(const DispatchRequest& request) override {
      std::lock_guard lock(mutex_);
      record(request);
      if (auto it = failures_.find(request.provider); it != failures_.end()) {
        return Unexpected(it->second);
      }
      if (auto it = responses_.find(request.provider); it != responses_.end()) return it->second;
      return ProviderResponse{.content = "ok",
                              .finish_reason = FinishReason::Stop,
                              .usage = Usage{.prompt_tokens = 10, .completion_tokens = 5},
                              .tool_calls = {}};
    }

    Result<std::unique_ptr<IByteSource>, ProviderError> open_stream(
        const DispatchRequest& request) override {
      std::lock_guard lock(mutex_);
      record(request);
      if (auto it = failures_.find(request.provider); it != failures_.end()) {
        return Unexpected(it->second);
      }
      auto it = streams_.find(request.provider);
      if (it == streams_.end()) {
        return Unexpected(ProviderError{.kind = "transport", .message = "no stream scripted", .status = {}});
      }
      return std::unique_ptr<IByteSource>(
          std::make_unique<ChunkedByteSource>(it->second.first, it->second.second));
    }

    [[nodiscard]] std::vector<RecordedCall> calls() const {
      std::lock_guard lock(mutex_);
      return calls_;
    }

  private:
    void record(const DispatchRequest& request) {
      calls_.push_back(RecordedCall{.provider = request.provider,
                                    .model = request.model,
                                    .pool_id = request.pool_id,
                                    .api_key = request.api_key,
                                    .stream = request.stream,
                                    .deadline = request.deadline});
    }

    mutable std::mutex mutex_;
    std::map<Provider, ProviderResponse> responses_;
    std::map<Provider, ProviderError> failures_;
    std::map<Provider, std::pair<std::vector<std::string>, std::shared_ptr<SourceProbe>>> streams_;
    std::vector<RecordedCall> calls_;
  };

}  // namespace switchboard::testing
