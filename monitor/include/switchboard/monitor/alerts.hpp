#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/types.hpp>
#include <vector>

namespace switchboard {

  enum class AlertType { AccuracyDegradation, DriftDetected, PerformanceAnomaly };
  enum class Severity { Low, Medium, High, Critical };

  [[nodiscard]] std::string_view to_string(AlertType t) noexcept;
  [[nodiscard]] std::string_view to_string(Severity s) noexcept;

  struct Alert {
    std::string id;
    AlertType type;
    Severity severity;
    Provider provider;
    std::string model;
    std::string message;
    double value = 0.0;
    double threshold = 0.0;
    SystemTime first_seen;
    SystemTime last_seen;
    int occurrences = 1;
    bool resolved = false;

    [[nodiscard]] std::chrono::milliseconds duration() const {
      return std::chrono::duration_cast<std::chrono::milliseconds>(last_seen - first_seen);
    }
  };

  struct AlertSummary {
    size_t total = 0;
    size_t unresolved = 0;
    size_t critical = 0;
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
  };

  struct AlertSpec {
    AlertType type;
    Severity severity;
    Provider provider;
    std::string model;
    std::string message;
    double value = 0.0;
    double threshold = 0.0;
  };

  /// Alert store with (type, provider, model) de-duplication.
  ///
  /// A repeat of an unresolved alert inside the cooldown updates it in place (value, message,
  /// last_seen, occurrences, worst severity) and is not pushed to subscribers again.
  class AlertManager {
  public:
    using Subscriber = std::function<void(const Alert&)>;

    AlertManager(std::chrono::milliseconds cooldown, std::shared_ptr<const Clock> clock,
                 size_t max_alerts = 1000);

    AlertManager(const AlertManager&) = delete;
    AlertManager& operator=(const AlertManager&) = delete;

    /// Returns a copy of the stored alert (new or updated)
    Alert raise(AlertSpec spec);

    bool resolve(const std::string& alert_id);
    size_t resolve_matching(AlertType type, Provider provider, const std::string& model);

    [[nodiscard]] std::vector<Alert> alerts(bool unresolved_only = false) const;
    [[nodiscard]] AlertSummary summary() const;

    /// Subscribers run on the thread that raised the alert, outside the store lock
    std::uint64_t subscribe(Subscriber subscriber);
    void unsubscribe(std::uint64_t token);

  private:
    void notify(const Alert& alert);

    std::chrono::milliseconds cooldown_;
    std::shared_ptr<const Clock> clock_;
    size_t max_alerts_;

    mutable std::mutex mutex_;
    std::vector<Alert> alerts_;
    std::uint64_t next_id_ = 1;

    std::mutex subscribers_mutex_;
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Subscriber>>> subscribers_;
    std::uint64_t next_token_ = 1;
  };

}  // namespace switchboard
