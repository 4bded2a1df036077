#include <algorithm>
#include <format>
#include <stdexcept>
#include <switchboard/monitor/sampling.hpp>

namespace switchboard {

  namespace {
    constexpr auto kRateWindow = std::chrono::seconds{60};
    constexpr double kMinAdaptiveRate = 0.1;
  }  // namespace

  std::string_view to_string(SamplingStrategy s) noexcept {
    switch (s) {
      case SamplingStrategy::Uniform:
        return "uniform";
      case SamplingStrategy::Adaptive:
        return "adaptive";
      case SamplingStrategy::Tiered:
        return "tiered";
    }
    return "unknown";
  }

  std::optional<SamplingStrategy> parse_sampling_strategy(std::string_view name) noexcept {
    if (name == "uniform") return SamplingStrategy::Uniform;
    if (name == "adaptive") return SamplingStrategy::Adaptive;
    if (name == "tiered") return SamplingStrategy::Tiered;
    return std::nullopt;
  }

  Sampler::Sampler(SamplingOptions options, std::shared_ptr<const Clock> clock)
      : options_(options),
        clock_(std::move(clock)),
        rng_(options.seed != 0 ? options.seed : std::random_device{}()) {
    if (!clock_) throw std::invalid_argument("Sampler requires a clock");
    if (options_.base_rate < 0.0 || options_.base_rate > 1.0) {
      throw std::invalid_argument(
          std::format("sampling base_rate must be within [0, 1], got {}", options_.base_rate));
    }
    if (options_.high_volume_rps <= 0.0) {
      throw std::invalid_argument("sampling high_volume_rps must be positive");
    }
  }

  bool Sampler::should_sample(const ExecutionOutcome& outcome) {
    const auto now = clock_->now();
    std::lock_guard lock(mutex_);
    arrivals_.push_back(now);
    trim_locked(now);

    if (!outcome.success || outcome.latency_ms > options_.slow_request_ms) return true;

    const double rate = rate_locked(rps_locked(now));
    if (rate >= 1.0) return true;
    if (rate <= 0.0) return false;
    return unit_(rng_) < rate;
  }

  double Sampler::current_rate() const {
    std::lock_guard lock(mutex_);
    return rate_locked(rps_locked(clock_->now()));
  }

  double Sampler::observed_rps() const {
    std::lock_guard lock(mutex_);
    return rps_locked(clock_->now());
  }

  double Sampler::rate_locked(double rps) const noexcept {
    const double base = options_.base_rate;
    const double threshold = options_.high_volume_rps;
    switch (options_.strategy) {
      case SamplingStrategy::Uniform:
        return base;
      case SamplingStrategy::Adaptive:
        if (rps <= threshold) return base;
        return std::max(kMinAdaptiveRate, base * threshold / rps);
      case SamplingStrategy::Tiered:
        if (rps > threshold * 10.0) return base * 0.1;
        if (rps > threshold) return base * 0.5;
        return base;
    }
    return base;
  }

  double Sampler::rps_locked(SystemTime now) const noexcept {
    // arrivals_ is in clock order
    auto first = std::ranges::partition_point(arrivals_, [&](SystemTime t) {
      return now - t > kRateWindow;
    });
    auto in_window = std::ranges::distance(first, arrivals_.end());
    return static_cast<double>(in_window) / static_cast<double>(kRateWindow.count());
  }

  void Sampler::trim_locked(SystemTime now) {
    while (!arrivals_.empty() && now - arrivals_.front() > kRateWindow) {
      arrivals_.pop_front();
    }
  }

}  // namespace switchboard
