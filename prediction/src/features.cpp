#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <switchboard/prediction/features.hpp>

namespace switchboard {

  namespace {

    constexpr size_t kLongPromptChars = 500;
    constexpr size_t kVeryLongTextChars = 1000;

    std::string lowercase(std::string_view text) {
      std::string out(text);
      std::ranges::transform(out, out.begin(),
                             [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return out;
    }

    bool contains_any(std::string_view text, std::initializer_list<std::string_view> words) {
      return std::ranges::any_of(words,
                                 [&](std::string_view w) { return text.find(w) != text.npos; });
    }

  }  // namespace

  int estimate_tokens(size_t chars, int chars_per_token) noexcept {
    if (chars == 0) return 0;
    const auto per = static_cast<size_t>(std::max(chars_per_token, 1));
    return static_cast<int>((chars + per - 1) / per);
  }

  CapabilityClass classify_request(std::string_view user_text) {
    const auto text = lowercase(user_text);
    if (contains_any(text, {"code", "function", "programming"})) return CapabilityClass::Code;
    if (contains_any(text, {"analyze", "data", "report"})) return CapabilityClass::Analysis;
    if (contains_any(text, {"write", "story", "creative"})) return CapabilityClass::Creative;
    if (contains_any(text, {"help", "support", "problem"})) return CapabilityClass::Support;
    if (contains_any(text, {"complex", "difficult"}) || text.size() > kLongPromptChars) {
      return CapabilityClass::Complex;
    }
    return CapabilityClass::Chat;
  }

  double complexity_score(const RoutingRequest& request) {
    double score = static_cast<double>(request.messages.size()) * 0.1;
    score += static_cast<double>(request.max_tokens.value_or(0)) / 1000.0;
    score += static_cast<double>(request.tools.size());

    std::string all;
    for (const auto& m : request.messages) {
      if (!all.empty()) all += ' ';
      all += m.content;
    }
    if (contains_any(all, {"analyze", "compare"})) score += 0.3;
    if (contains_any(all, {"code", "function"})) score += 0.4;
    if (contains_any(all, {"explain", "detail"})) score += 0.2;
    if (all.size() > kVeryLongTextChars) score += 0.3;

    return std::min(1.0, score);
  }

  RequestFeatures extract_features(const RoutingRequest& request, const FeatureOptions& options) {
    RequestFeatures f;
    f.message_count = request.messages.size();
    f.has_tool_calls = !request.tools.empty();

    std::string user_text;
    for (const auto& m : request.messages) {
      f.prompt_chars += m.content.size();
      for (const auto& call : m.tool_calls) {
        f.prompt_chars += call.name.size() + call.arguments.size();
        f.has_tool_calls = true;
      }
      if (m.role == "system") f.has_system_message = true;
      if (m.role == "user") {
        if (!user_text.empty()) user_text += ' ';
        user_text += m.content;
      }
    }
    for (const auto& tool : request.tools) {
      f.prompt_chars += tool.name.size() + tool.description.size() + tool.parameters.size();
    }

    f.prompt_tokens = estimate_tokens(f.prompt_chars, options.chars_per_token);
    f.completion_tokens = request.max_tokens.value_or(options.default_completion_tokens);
    f.complexity = complexity_score(request);
    f.capability = classify_request(user_text);
    return f;
  }

}  // namespace switchboard
