#include <format>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>
#include <string>
#include <switchboard/common/logging.hpp>

namespace switchboard {

  std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
      instance = spdlog::get(kLoggerName);
      if (!instance) {
        instance = spdlog::stderr_color_mt(kLoggerName);
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      }
    });
    return instance;
  }

  void set_log_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off; only "off" itself may produce it
    if (parsed == spdlog::level::off && level != "off") {
      throw std::invalid_argument(std::format("unknown log level '{}'", level));
    }
    logger()->set_level(parsed);
  }

}  // namespace switchboard
