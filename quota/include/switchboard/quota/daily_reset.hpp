#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <switchboard/common/clock.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <thread>

namespace switchboard {

  /// Fires PoolManager::roll_over at the next UTC midnight and every 24h after that.
  ///
  /// poll() performs any reset that is due according to the injected clock and is what the
  /// background thread calls; tests drive it directly with a ManualClock.
  class DailyResetScheduler {
  public:
    DailyResetScheduler(PoolManager& pools, std::shared_ptr<const Clock> clock,
                        std::chrono::milliseconds poll_interval = std::chrono::seconds{30});
    ~DailyResetScheduler();

    DailyResetScheduler(const DailyResetScheduler&) = delete;
    DailyResetScheduler& operator=(const DailyResetScheduler&) = delete;

    /// Spawns the background thread; calling start() twice is a no-op
    void start();
    void stop();

    /// Returns true when a reset fired
    bool poll();

    [[nodiscard]] SystemTime next_fire() const;
    [[nodiscard]] std::chrono::milliseconds time_until_next_reset() const;
    [[nodiscard]] bool running() const;

  private:
    void run(std::stop_token token);

    PoolManager& pools_;
    std::shared_ptr<const Clock> clock_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    SystemTime next_fire_;
    std::jthread worker_;
  };

}  // namespace switchboard
