#include <switchboard/common/clock.hpp>

namespace switchboard {

  std::shared_ptr<Clock> make_system_clock() { return std::make_shared<SystemClock>(); }

  std::chrono::sys_days utc_day(SystemTime t) noexcept {
    return std::chrono::floor<std::chrono::days>(t);
  }

  SystemTime next_utc_midnight(SystemTime t) noexcept {
    return SystemTime(utc_day(t) + std::chrono::days{1});
  }

  std::int64_t to_unix_millis(SystemTime t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  }

  std::int64_t to_unix_seconds(SystemTime t) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
  }

  SystemTime from_unix_millis(std::int64_t ms) noexcept {
    return SystemTime(std::chrono::milliseconds{ms});
  }

}  // namespace switchboard
