#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <switchboard/common/types.hpp>

namespace switchboard {

  struct ChunkDelta {
    std::optional<std::string> role;
    std::optional<std::string> content;
  };

  /// One element of the canonical stream (OpenAI chat.completion.chunk shape)
  struct CanonicalChunk {
    std::string id;
    std::string model;
    std::int64_t created = 0;  // unix seconds
    ChunkDelta delta;
    std::optional<FinishReason> finish_reason;
    std::optional<Usage> usage;  // terminal chunk only

    [[nodiscard]] bool terminal() const noexcept { return finish_reason.has_value(); }
  };

  inline constexpr std::string_view kSseDone = "data: [DONE]\n\n";

  void to_json(nlohmann::json& j, const CanonicalChunk& c);

  /// "data: <json>\n\n"
  [[nodiscard]] std::string encode_sse(const CanonicalChunk& chunk);

}  // namespace switchboard
