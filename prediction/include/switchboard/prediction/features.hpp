#pragma once
#include <cstddef>
#include <string_view>
#include <switchboard/common/types.hpp>

namespace switchboard {

  struct FeatureOptions {
    int chars_per_token = 4;
    int default_completion_tokens = 256;
  };

  struct RequestFeatures {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    size_t message_count = 0;
    size_t prompt_chars = 0;
    bool has_system_message = false;
    bool has_tool_calls = false;  // tool definitions or tool calls in the history
    double complexity = 0.0;      // [0, 1]
    CapabilityClass capability = CapabilityClass::Chat;
  };

  /// ceil(chars / chars_per_token), at least 1 for non-empty text
  [[nodiscard]] int estimate_tokens(size_t chars, int chars_per_token = 4) noexcept;

  /// Keyword classification of the user-authored text
  [[nodiscard]] CapabilityClass classify_request(std::string_view user_text);

  [[nodiscard]] double complexity_score(const RoutingRequest& request);

  /// Deterministic and side-effect free
  [[nodiscard]] RequestFeatures extract_features(const RoutingRequest& request,
                                                 const FeatureOptions& options = {});

}  // namespace switchboard
