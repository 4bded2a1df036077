#pragma once

#include <array>
#include <filesystem>
#include <format>
#include <random>
#include <string>
#include <switchboard/common/types.hpp>
#include <switchboard/profile/profile.hpp>
#include <vector>

namespace switchboard::testing {

  class FixturesLoader {
  public:
    static std::filesystem::path fixtures_dir() {
      return std::filesystem::path(SWITCHBOARD_FIXTURES_DIR);
    }

    static EngineProfile load_profile(const std::string& name = "profile.json") {
      return EngineProfile::from_json((fixtures_dir() / name).string());
    }

    /// Mixed chat, code, creative and analysis prompts with varied lengths and strategies
    static std::vector<RoutingRequest> generate_requests(size_t n, unsigned seed = 42) {
      static const std::array<const char*, 6> kPrompts = {
          "Hi, how are you today?",
          "Write a Python function that merges two sorted lists and explain the complexity.",
          "Write a short poem about autumn leaves falling over a quiet lake.",
          "Analyze this sales data and summarize the quarterly trend for the board.",
          "My order has not arrived yet, can you help me track it?",
          "Design a distributed architecture for a multi-region payment system with failover."};
      static const std::array<Strategy, 4> kStrategies = {Strategy::Cost, Strategy::Speed,
                                                          Strategy::Quality, Strategy::Balanced};

      std::mt19937 rng(seed);
      std::uniform_int_distribution<size_t> prompt_dist(0, kPrompts.size() - 1);
      std::uniform_int_distribution<size_t> strategy_dist(0, kStrategies.size() - 1);
      std::uniform_int_distribution<int> repeat_dist(1, 8);
      std::uniform_int_distribution<int> tokens_dist(50, 800);

      std::vector<RoutingRequest> requests;
      requests.reserve(n);
      for (size_t i = 0; i < n; ++i) {
        std::string prompt;
        int repeats = repeat_dist(rng);
        for (int r = 0; r < repeats; ++r) {
          if (!prompt.empty()) prompt += ' ';
          prompt += kPrompts[prompt_dist(rng)];
        }

        RoutingRequest request;
        request.user_id = std::format("user-{}", i % 16);
        request.messages = {Message{.role = "user", .content = std::move(prompt), .tool_calls = {}}};
        request.max_tokens = tokens_dist(rng);
        request.optimize_for = kStrategies[strategy_dist(rng)];
        requests.push_back(std::move(request));
      }
      return requests;
    }

    /// OpenAI-style SSE body split into `slices` roughly equal reads
    static std::vector<std::string> openai_stream(size_t deltas, size_t slices = 4) {
      std::string body;
      body += R"(data: {"id":"c1","choices":[{"index":0,"delta":{"role":"assistant"}}]})";
      body += "\n\n";
      for (size_t i = 0; i < deltas; ++i) {
        body += std::format(
            R"(data: {{"id":"c1","choices":[{{"index":0,"delta":{{"content":"token{} "}}}}]}})", i);
        body += "\n\n";
      }
      body += R"(data: {"id":"c1","choices":[{"index":0,"delta":{},"finish_reason":"stop"}]})";
      body += "\n\n";
      body += R"(data: {"id":"c1","choices":[],"usage":{"prompt_tokens":12,"completion_tokens":)";
      body += std::format("{}}}}}", deltas);
      body += "\n\n";
      body += "data: [DONE]\n\n";
      return split(body, slices);
    }

    /// Anthropic messages SSE body split into `slices` reads
    static std::vector<std::string> anthropic_stream(size_t deltas, size_t slices = 4) {
      std::string body;
      body += "event: message_start\n";
      body += R"(data: {"type":"message_start","message":{"usage":{"input_tokens":12,"output_tokens":1}}})";
      body += "\n\n";
      for (size_t i = 0; i < deltas; ++i) {
        body += "event: content_block_delta\n";
        body += std::format(
            R"(data: {{"type":"content_block_delta","index":0,"delta":{{"type":"text_delta","text":"token{} "}}}})",
            i);
        body += "\n\n";
      }
      body += "event: message_delta\n";
      body += std::format(
          R"(data: {{"type":"message_delta","delta":{{"stop_reason":"end_turn"}},"usage":{{"output_tokens":{}}}}})",
          deltas);
      body += "\n\n";
      body += "event: message_stop\n";
      body += R"(data: {"type":"message_stop"})";
      body += "\n\n";
      return split(body, slices);
    }

  private:
    static std::vector<std::string> split(const std::string& body, size_t slices) {
      std::vector<std::string> out;
      if (slices == 0) slices = 1;
      size_t step = (body.size() + slices - 1) / slices;
      for (size_t pos = 0; pos < body.size(); pos += step) out.push_back(body.substr(pos, step));
      return out;
    }
  };

}  // namespace switchboard::testing
