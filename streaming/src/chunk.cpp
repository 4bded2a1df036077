#include <switchboard/common/json.hpp>
#include <switchboard/streaming/chunk.hpp>

namespace switchboard {

  void to_json(json& j, const CanonicalChunk& c) {
    json delta = json::object();
    if (c.delta.role) delta["role"] = *c.delta.role;
    if (c.delta.content) delta["content"] = *c.delta.content;

    json choice = {{"index", 0}, {"delta", delta}, {"finish_reason", nullptr}};
    if (c.finish_reason) choice["finish_reason"] = *c.finish_reason;

    j = {{"id", c.id},
         {"object", "chat.completion.chunk"},
         {"created", c.created},
         {"model", c.model},
         {"choices", json::array({choice})}};
    if (c.usage) {
      j["usage"] = {{"prompt_tokens", c.usage->prompt_tokens},
                    {"completion_tokens", c.usage->completion_tokens},
                    {"total_tokens", c.usage->prompt_tokens + c.usage->completion_tokens}};
    }
  }

  std::string encode_sse(const CanonicalChunk& chunk) {
    std::string out = "data: ";
    out += json(chunk).dump();
    out += "\n\n";
    return out;
  }

}  // namespace switchboard
