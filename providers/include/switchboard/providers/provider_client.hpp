#pragma once
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  // =============================================================================
  // Dispatch Types
  // =============================================================================

  /// Everything a provider transport needs for one call
  struct DispatchRequest {
    std::string request_id;
    Provider provider;
    std::string model;
    std::string pool_id;
    std::string api_key;
    const RoutingRequest* request = nullptr;  // owned by the caller for the call's duration
    bool stream = false;
    std::optional<SystemTime> deadline;  // from maxResponseTimeMs
    std::stop_token stop;
  };

  struct ProviderResponse {
    std::string content;
    FinishReason finish_reason = FinishReason::Stop;
    Usage usage;
    std::vector<ToolCall> tool_calls;
  };

  struct ProviderError {
    std::string kind;  // transport, timeout, auth, rate_limited, provider, cancelled, malformed
    std::string message;
    std::optional<int> status;
  };

  // =============================================================================
  // Transport Interfaces
  // =============================================================================

  /// Raw streaming body from a provider. read() returns nullopt at end of stream.
  class IByteSource {
  public:
    virtual ~IByteSource() = default;

    IByteSource(const IByteSource&) = delete;
    IByteSource& operator=(const IByteSource&) = delete;
    IByteSource(IByteSource&&) = delete;
    IByteSource& operator=(IByteSource&&) = delete;

    [[nodiscard]] virtual Result<std::optional<std::string>, ProviderError> read(
        std::stop_token stop)
        = 0;

    /// Idempotent; a blocked read() must return promptly afterwards
    virtual void close() noexcept = 0;

  protected:
    IByteSource() = default;
  };

  /// Network transport to the providers; supplied by the embedding application
  class IProviderClient {
  public:
    virtual ~IProviderClient() = default;

    IProviderClient(const IProviderClient&) = delete;
    IProviderClient& operator=(const IProviderClient&) = delete;
    IProviderClient(IProviderClient&&) = delete;
    IProviderClient& operator=(IProviderClient&&) = delete;

    [[nodiscard]] virtual Result<ProviderResponse, ProviderError> complete(
        const DispatchRequest& request)
        = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<IByteSource>, ProviderError> open_stream(
        const DispatchRequest& request)
        = 0;

  protected:
    IProviderClient() = default;
  };

}  // namespace switchboard
