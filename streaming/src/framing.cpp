#include <switchboard/streaming/framing.hpp>

namespace switchboard {

  namespace {

    std::string_view strip_cr(std::string_view line) noexcept {
      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
      return line;
    }

    bool is_blank(std::string_view s) noexcept {
      return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }

  }  // namespace

  // ============================================================================
  // SseFramer
  // ============================================================================

  std::vector<Frame> SseFramer::feed(std::string_view bytes) {
    buffer_.append(bytes);
    std::vector<Frame> out;

    size_t start = 0;
    for (size_t nl = buffer_.find('\n'); nl != std::string::npos;
         nl = buffer_.find('\n', start)) {
      take_line(strip_cr(std::string_view(buffer_).substr(start, nl - start)), out);
      start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
  }

  std::vector<Frame> SseFramer::finish() {
    std::vector<Frame> out;
    if (!is_blank(buffer_)) take_line(strip_cr(buffer_), out);
    buffer_.clear();
    emit(out);
    return out;
  }

  void SseFramer::take_line(std::string_view line, std::vector<Frame>& out) {
    if (line.empty()) {
      emit(out);
      return;
    }
    if (line.front() == ':') return;  // comment / keep-alive

    const auto colon = line.find(':');
    const auto field = line.substr(0, colon);
    auto value = colon == std::string_view::npos ? std::string_view{} : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') value.remove_prefix(1);

    if (field == "data") {
      if (has_data_) current_.data += '\n';
      current_.data.append(value);
      has_data_ = true;
    } else if (field == "event") {
      current_.event = std::string(value);
    }
  }

  void SseFramer::emit(std::vector<Frame>& out) {
    if (has_data_) out.push_back(std::move(current_));
    current_ = Frame{};
    has_data_ = false;
  }

  // ============================================================================
  // NdjsonFramer
  // ============================================================================

  std::vector<Frame> NdjsonFramer::feed(std::string_view bytes) {
    buffer_.append(bytes);
    std::vector<Frame> out;

    size_t start = 0;
    for (size_t nl = buffer_.find('\n'); nl != std::string::npos;
         nl = buffer_.find('\n', start)) {
      auto line = strip_cr(std::string_view(buffer_).substr(start, nl - start));
      if (!is_blank(line)) out.push_back(Frame{.event = {}, .data = std::string(line)});
      start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
  }

  std::vector<Frame> NdjsonFramer::finish() {
    std::vector<Frame> out;
    if (!is_blank(buffer_)) out.push_back(Frame{.event = {}, .data = std::string(strip_cr(buffer_))});
    buffer_.clear();
    return out;
  }

  std::unique_ptr<IFramer> make_framer(Provider provider) {
    if (provider == Provider::Ollama) return std::make_unique<NdjsonFramer>();
    return std::make_unique<SseFramer>();
  }

}  // namespace switchboard
