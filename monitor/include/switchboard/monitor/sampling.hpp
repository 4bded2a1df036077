#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/types.hpp>

namespace switchboard {

  enum class SamplingStrategy { Uniform, Adaptive, Tiered };

  [[nodiscard]] std::string_view to_string(SamplingStrategy s) noexcept;
  [[nodiscard]] std::optional<SamplingStrategy> parse_sampling_strategy(
      std::string_view name) noexcept;

  struct SamplingOptions {
    SamplingStrategy strategy = SamplingStrategy::Uniform;
    double base_rate = 1.0;
    double high_volume_rps = 100.0;
    double slow_request_ms = 5000.0;
    std::uint64_t seed = 0;  // 0 seeds from std::random_device
  };

  /// Decides which outcomes get full accuracy processing. Failures and slow requests are
  /// always kept; under load the rate drops according to the strategy.
  class Sampler {
  public:
    Sampler(SamplingOptions options, std::shared_ptr<const Clock> clock);

    [[nodiscard]] bool should_sample(const ExecutionOutcome& outcome);

    [[nodiscard]] double current_rate() const;
    [[nodiscard]] double observed_rps() const;

  private:
    [[nodiscard]] double rate_locked(double rps) const noexcept;
    [[nodiscard]] double rps_locked(SystemTime now) const noexcept;
    void trim_locked(SystemTime now);

    SamplingOptions options_;
    std::shared_ptr<const Clock> clock_;

    mutable std::mutex mutex_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
    std::deque<SystemTime> arrivals_;
  };

}  // namespace switchboard
