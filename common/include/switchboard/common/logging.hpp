#pragma once
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace switchboard {

  inline constexpr const char* kLoggerName = "switchboard";

  /// Shared engine logger, created on first use (stderr, colored)
  [[nodiscard]] std::shared_ptr<spdlog::logger> logger();

  /// Accepts spdlog level names: trace, debug, info, warn, err, critical, off
  void set_log_level(std::string_view level);

}  // namespace switchboard
