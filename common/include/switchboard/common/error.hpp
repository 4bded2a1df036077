#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  enum class ErrorCode {
    QuotaExhausted,
    NoEligibleProvider,
    ProviderDispatchFailed,
    DuplicateOutcome,
    MalformedStreamFrame,
    UnknownRequest,
    Cancelled
  };

  enum class Urgency { Low, Medium, High, Critical };

  struct UpgradePrompt {
    std::string title;
    std::string message;
    Urgency urgency = Urgency::Medium;
    std::vector<std::string> benefits;
  };

  struct RoutingError {
    ErrorCode code;
    std::string message;
    std::optional<UpgradePrompt> upgrade_prompt;
    std::vector<Provider> attempted_providers;

    /// "<code>: <message>"
    [[nodiscard]] std::string describe() const;
  };

  [[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;
  [[nodiscard]] std::string_view to_string(Urgency urgency) noexcept;

  /// HTTP status an outer surface should use for this error
  [[nodiscard]] int http_status(ErrorCode code) noexcept;

  [[nodiscard]] RoutingError make_error(ErrorCode code, std::string message);

}  // namespace switchboard
