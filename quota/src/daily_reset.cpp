#include <algorithm>
#include <stdexcept>
#include <switchboard/common/logging.hpp>
#include <switchboard/quota/daily_reset.hpp>

namespace switchboard {

  namespace {
    constexpr auto kResetPeriod = std::chrono::hours{24};
  }

  DailyResetScheduler::DailyResetScheduler(PoolManager& pools, std::shared_ptr<const Clock> clock,
                                           std::chrono::milliseconds poll_interval)
      : pools_(pools), clock_(std::move(clock)), poll_interval_(poll_interval) {
    if (!clock_) {
      throw std::invalid_argument("DailyResetScheduler requires a clock");
    }
    if (poll_interval_ <= std::chrono::milliseconds::zero()) {
      throw std::invalid_argument("DailyResetScheduler poll interval must be positive");
    }
    next_fire_ = next_utc_midnight(clock_->now());
  }

  DailyResetScheduler::~DailyResetScheduler() { stop(); }

  void DailyResetScheduler::start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token token) { run(std::move(token)); });
    logger()->info("daily reset scheduled in {} minutes",
                   std::chrono::duration_cast<std::chrono::minutes>(next_fire_ - clock_->now())
                       .count());
  }

  void DailyResetScheduler::stop() {
    std::jthread worker;
    {
      std::lock_guard lock(mutex_);
      worker = std::move(worker_);
    }
    if (worker.joinable()) {
      worker.request_stop();
      cv_.notify_all();
      worker.join();
    }
  }

  bool DailyResetScheduler::poll() {
    const auto now = clock_->now();
    {
      std::lock_guard lock(mutex_);
      if (now < next_fire_) return false;
      // Catch up after long sleeps without firing once per missed day
      while (next_fire_ <= now) next_fire_ += kResetPeriod;
    }
    if (!pools_.roll_over(now)) {
      // An allocation already rolled the day over lazily
      logger()->debug("daily reset already applied for this UTC day");
    }
    return true;
  }

  SystemTime DailyResetScheduler::next_fire() const {
    std::lock_guard lock(mutex_);
    return next_fire_;
  }

  std::chrono::milliseconds DailyResetScheduler::time_until_next_reset() const {
    std::lock_guard lock(mutex_);
    return std::max(std::chrono::milliseconds::zero(),
                    std::chrono::duration_cast<std::chrono::milliseconds>(next_fire_
                                                                          - clock_->now()));
  }

  bool DailyResetScheduler::running() const {
    std::lock_guard lock(mutex_);
    return worker_.joinable();
  }

  void DailyResetScheduler::run(std::stop_token token) {
    std::unique_lock lock(mutex_);
    while (!token.stop_requested()) {
      auto wait = std::min(poll_interval_, std::chrono::duration_cast<std::chrono::milliseconds>(
                                               next_fire_ - clock_->now()));
      wait = std::max(wait, std::chrono::milliseconds{1});
      cv_.wait_for(lock, token, wait, [] { return false; });
      if (token.stop_requested()) break;

      lock.unlock();
      try {
        poll();
      } catch (const std::exception& e) {
        logger()->error("daily reset failed: {}", e.what());
      }
      lock.lock();
    }
  }

}  // namespace switchboard
