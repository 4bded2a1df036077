#include <format>
#include <switchboard/common/error.hpp>

namespace switchboard {

  std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
      case ErrorCode::QuotaExhausted:
        return "quota_exhausted";
      case ErrorCode::NoEligibleProvider:
        return "no_eligible_provider";
      case ErrorCode::ProviderDispatchFailed:
        return "provider_dispatch_failed";
      case ErrorCode::DuplicateOutcome:
        return "duplicate_outcome";
      case ErrorCode::MalformedStreamFrame:
        return "malformed_stream_frame";
      case ErrorCode::UnknownRequest:
        return "unknown_request";
      case ErrorCode::Cancelled:
        return "cancelled";
    }
    return "unknown";
  }

  std::string_view to_string(Urgency urgency) noexcept {
    switch (urgency) {
      case Urgency::Low:
        return "low";
      case Urgency::Medium:
        return "medium";
      case Urgency::High:
        return "high";
      case Urgency::Critical:
        return "critical";
    }
    return "unknown";
  }

  int http_status(ErrorCode code) noexcept {
    switch (code) {
      case ErrorCode::QuotaExhausted:
        return 429;
      case ErrorCode::NoEligibleProvider:
        return 422;
      case ErrorCode::ProviderDispatchFailed:
        return 502;
      case ErrorCode::DuplicateOutcome:
        return 409;
      case ErrorCode::MalformedStreamFrame:
        return 502;
      case ErrorCode::UnknownRequest:
        return 404;
      case ErrorCode::Cancelled:
        return 499;
    }
    return 500;
  }

  std::string RoutingError::describe() const {
    return std::format("{}: {}", to_string(code), message);
  }

  RoutingError make_error(ErrorCode code, std::string message) {
    return RoutingError{.code = code,
                        .message = std::move(message),
                        .upgrade_prompt = std::nullopt,
                        .attempted_providers = {}};
  }

}  // namespace switchboard
