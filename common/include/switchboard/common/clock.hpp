#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace switchboard {

  using SystemTime = std::chrono::system_clock::time_point;

  // =============================================================================
  // Clock Interface
  // =============================================================================

  class Clock {
  public:
    virtual ~Clock() = default;

    Clock(const Clock&) = delete;
    Clock& operator=(const Clock&) = delete;
    Clock(Clock&&) = delete;
    Clock& operator=(Clock&&) = delete;

    [[nodiscard]] virtual SystemTime now() const = 0;

  protected:
    Clock() = default;
  };

  class SystemClock final : public Clock {
  public:
    SystemClock() = default;
    [[nodiscard]] SystemTime now() const override { return std::chrono::system_clock::now(); }
  };

  /// Test clock; time moves only when told to
  class ManualClock final : public Clock {
  public:
    explicit ManualClock(SystemTime start = SystemTime{}) : now_(start) {}

    [[nodiscard]] SystemTime now() const override {
      std::lock_guard lock(mutex_);
      return now_;
    }

    void set(SystemTime t) {
      std::lock_guard lock(mutex_);
      now_ = t;
    }

    void advance(std::chrono::system_clock::duration d) {
      std::lock_guard lock(mutex_);
      now_ += d;
    }

  private:
    mutable std::mutex mutex_;
    SystemTime now_;
  };

  [[nodiscard]] std::shared_ptr<Clock> make_system_clock();

  // =============================================================================
  // UTC Calendar Helpers
  // =============================================================================

  [[nodiscard]] std::chrono::sys_days utc_day(SystemTime t) noexcept;
  [[nodiscard]] SystemTime next_utc_midnight(SystemTime t) noexcept;
  [[nodiscard]] std::int64_t to_unix_millis(SystemTime t) noexcept;
  [[nodiscard]] std::int64_t to_unix_seconds(SystemTime t) noexcept;
  [[nodiscard]] SystemTime from_unix_millis(std::int64_t ms) noexcept;

}  // namespace switchboard
