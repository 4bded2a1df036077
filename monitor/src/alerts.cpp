#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <switchboard/common/logging.hpp>
#include <switchboard/monitor/alerts.hpp>

namespace switchboard {

  std::string_view to_string(AlertType t) noexcept {
    switch (t) {
      case AlertType::AccuracyDegradation:
        return "accuracy_degradation";
      case AlertType::DriftDetected:
        return "drift_detected";
      case AlertType::PerformanceAnomaly:
        return "performance_anomaly";
    }
    return "unknown";
  }

  std::string_view to_string(Severity s) noexcept {
    switch (s) {
      case Severity::Low:
        return "low";
      case Severity::Medium:
        return "medium";
      case Severity::High:
        return "high";
      case Severity::Critical:
        return "critical";
    }
    return "unknown";
  }

  AlertManager::AlertManager(std::chrono::milliseconds cooldown,
                             std::shared_ptr<const Clock> clock, size_t max_alerts)
      : cooldown_(cooldown), clock_(std::move(clock)), max_alerts_(max_alerts) {
    if (!clock_) throw std::invalid_argument("AlertManager requires a clock");
    if (max_alerts_ == 0) throw std::invalid_argument("max_alerts must be positive");
  }

  Alert AlertManager::raise(AlertSpec spec) {
    const auto now = clock_->now();
    Alert snapshot;
    bool is_new = false;
    {
      std::lock_guard lock(mutex_);
      auto existing = std::find_if(alerts_.rbegin(), alerts_.rend(), [&](const Alert& a) {
        return !a.resolved && a.type == spec.type && a.provider == spec.provider
               && a.model == spec.model;
      });

      if (existing != alerts_.rend() && now - existing->last_seen < cooldown_) {
        existing->value = spec.value;
        existing->threshold = spec.threshold;
        existing->message = std::move(spec.message);
        existing->last_seen = now;
        existing->severity = std::max(existing->severity, spec.severity);
        ++existing->occurrences;
        snapshot = *existing;
      } else {
        if (alerts_.size() >= max_alerts_) {
          // Oldest resolved alert goes first, then the oldest overall
          auto victim = std::ranges::find_if(alerts_, &Alert::resolved);
          alerts_.erase(victim != alerts_.end() ? victim : alerts_.begin());
        }
        alerts_.push_back(Alert{.id = std::format("alert-{}", next_id_++),
                                .type = spec.type,
                                .severity = spec.severity,
                                .provider = spec.provider,
                                .model = std::move(spec.model),
                                .message = std::move(spec.message),
                                .value = spec.value,
                                .threshold = spec.threshold,
                                .first_seen = now,
                                .last_seen = now,
                                .occurrences = 1,
                                .resolved = false});
        snapshot = alerts_.back();
        is_new = true;
      }
    }

    if (is_new) {
      logger()->warn("[{}] {} {}/{}: {}", to_string(snapshot.severity), to_string(snapshot.type),
                     to_string(snapshot.provider), snapshot.model, snapshot.message);
      notify(snapshot);
    }
    return snapshot;
  }

  bool AlertManager::resolve(const std::string& alert_id) {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find(alerts_, alert_id, &Alert::id);
    if (it == alerts_.end() || it->resolved) return false;
    it->resolved = true;
    return true;
  }

  size_t AlertManager::resolve_matching(AlertType type, Provider provider,
                                        const std::string& model) {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (auto& alert : alerts_) {
      if (!alert.resolved && alert.type == type && alert.provider == provider
          && alert.model == model) {
        alert.resolved = true;
        ++count;
      }
    }
    if (count > 0) {
      logger()->info("resolved {} {} alert(s) for {}/{}", count, to_string(type),
                     to_string(provider), model);
    }
    return count;
  }

  std::vector<Alert> AlertManager::alerts(bool unresolved_only) const {
    std::lock_guard lock(mutex_);
    if (!unresolved_only) return alerts_;
    auto open = alerts_ | std::views::filter([](const Alert& a) { return !a.resolved; });
    return {open.begin(), open.end()};
  }

  AlertSummary AlertManager::summary() const {
    std::lock_guard lock(mutex_);
    AlertSummary s;
    s.total = alerts_.size();
    for (const auto& alert : alerts_) {
      if (alert.resolved) continue;
      ++s.unresolved;
      switch (alert.severity) {
        case Severity::Critical:
          ++s.critical;
          break;
        case Severity::High:
          ++s.high;
          break;
        case Severity::Medium:
          ++s.medium;
          break;
        case Severity::Low:
          ++s.low;
          break;
      }
    }
    return s;
  }

  std::uint64_t AlertManager::subscribe(Subscriber subscriber) {
    std::lock_guard lock(subscribers_mutex_);
    auto token = next_token_++;
    subscribers_.emplace_back(token, std::make_shared<Subscriber>(std::move(subscriber)));
    return token;
  }

  void AlertManager::unsubscribe(std::uint64_t token) {
    std::lock_guard lock(subscribers_mutex_);
    std::erase_if(subscribers_, [&](const auto& entry) { return entry.first == token; });
  }

  void AlertManager::notify(const Alert& alert) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
      std::lock_guard lock(subscribers_mutex_);
      targets.reserve(subscribers_.size());
      for (const auto& [_, subscriber] : subscribers_) targets.push_back(subscriber);
    }
    for (const auto& subscriber : targets) {
      try {
        (*subscriber)(alert);
      } catch (const std::exception& e) {
        logger()->error("alert subscriber threw: {}", e.what());
      }
    }
  }

}  // namespace switchboard
