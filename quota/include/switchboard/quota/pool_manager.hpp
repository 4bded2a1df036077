#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <unordered_map>
#include <vector>

namespace switchboard {

  enum class PoolStatus { Active, Exhausted, Error };

  [[nodiscard]] std::string_view to_string(PoolStatus s) noexcept;

  /// One shared provider credential
  struct PoolConfig {
    std::string pool_id;
    Provider provider;
    std::string api_key;
    int daily_limit = 0;
    int used_today = 0;
    PoolStatus status = PoolStatus::Active;
    int priority = 5;  // 1 (first) .. 10 (last)
  };

  struct UserQuota {
    std::string user_id;
    Tier tier = Tier::Instant;
    int requests_today = 0;
    std::chrono::sys_days day;
  };

  struct QuotaOptions {
    int instant_daily_limit = 25;
    double upgrade_prompt_ratio = 0.8;
  };

  struct KeyGrant {
    std::string pool_id;
    Provider provider;
    std::string api_key;
    std::optional<int> quota_remaining;  // nullopt for tiers without a daily cap
  };

  struct PoolSummary {
    int total_pools = 0;
    int available_pools = 0;
  };

  struct QuotaStatus {
    Tier tier = Tier::Instant;
    int requests_today = 0;
    std::optional<int> remaining;
    PoolSummary pool_status;
  };

  struct PoolReport {
    std::string pool_id;
    Provider provider;
    int used_today = 0;
    int daily_limit = 0;
    PoolStatus status = PoolStatus::Active;
    double utilization_percent = 0.0;
  };

  struct PoolStatusReport {
    std::vector<PoolReport> pools;
    size_t total_users = 0;
    std::int64_t total_requests_today = 0;
  };

  class PoolManager;

  // =============================================================================
  // QuotaReservation
  // =============================================================================

  /// Quota held for one dispatch. Counters are incremented when the reservation is made;
  /// commit() keeps them, release() or destruction without commit() gives them back.
  class QuotaReservation {
  public:
    QuotaReservation() = default;
    ~QuotaReservation();

    QuotaReservation(QuotaReservation&& other) noexcept;
    QuotaReservation& operator=(QuotaReservation&& other) noexcept;
    QuotaReservation(const QuotaReservation&) = delete;
    QuotaReservation& operator=(const QuotaReservation&) = delete;

    void commit() noexcept;
    void release() noexcept;

    [[nodiscard]] bool active() const noexcept { return owner_ != nullptr; }
    [[nodiscard]] const KeyGrant& grant() const noexcept { return grant_; }
    [[nodiscard]] int units() const noexcept { return units_; }

  private:
    friend class PoolManager;

    QuotaReservation(PoolManager* owner, KeyGrant grant, std::string user_id, int units,
                     std::uint64_t epoch)
        : owner_(owner),
          grant_(std::move(grant)),
          user_id_(std::move(user_id)),
          units_(units),
          epoch_(epoch) {}

    PoolManager* owner_ = nullptr;
    KeyGrant grant_;
    std::string user_id_;
    int units_ = 0;
    std::uint64_t epoch_ = 0;
  };

  // =============================================================================
  // PoolManager
  // =============================================================================

  class PoolManager {
  public:
    explicit PoolManager(std::vector<PoolConfig> pools, QuotaOptions options = {},
                         std::shared_ptr<const Clock> clock = make_system_clock());

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;
    PoolManager(PoolManager&&) = delete;
    PoolManager& operator=(PoolManager&&) = delete;

    /// Allocates `units` from the best pool, falling back to any provider when the preferred
    /// one has no capacity. Counters are committed immediately.
    [[nodiscard]] Result<KeyGrant, RoutingError> get_available_key(
        const std::string& user_id, std::optional<Provider> preferred_provider = std::nullopt,
        int units = 1);

    /// Strict-provider allocation returning a reservation that must be committed.
    [[nodiscard]] Result<QuotaReservation, RoutingError> reserve(const std::string& user_id,
                                                                 Provider provider, int units = 1);

    /// Read-only probe: would reserve(user_id, provider, units) succeed right now?
    [[nodiscard]] bool check_availability(const std::string& user_id, Provider provider,
                                          int units = 1) const;

    /// Instant-tier cap check only; nullopt when the user may proceed
    [[nodiscard]] std::optional<RoutingError> check_user_cap(const std::string& user_id,
                                                             int units = 1) const;

    /// QuotaExhausted error with the critical "pools exhausted" upgrade prompt
    [[nodiscard]] RoutingError exhausted_error() const;

    void update_user_tier(const std::string& user_id, Tier tier);
    [[nodiscard]] bool should_show_upgrade_prompt(const std::string& user_id) const;

    [[nodiscard]] QuotaStatus quota_status(const std::string& user_id) const;
    [[nodiscard]] PoolStatusReport pool_status() const;

    void mark_pool_error(const std::string& pool_id);
    void restore_pool(const std::string& pool_id);

    /// Resets counters when `now` falls on a later UTC day than the last reset.
    /// Returns true when a reset happened.
    bool roll_over(SystemTime now);

    /// Unconditional reset of every pool and user counter
    void reset_daily_quotas();

    [[nodiscard]] std::uint64_t reset_epoch() const;
    [[nodiscard]] const QuotaOptions& options() const noexcept { return options_; }
    [[nodiscard]] const Clock& clock() const noexcept { return *clock_; }

  private:
    friend class QuotaReservation;

    struct Allocation {
      KeyGrant grant;
      std::uint64_t epoch;
    };

    Result<Allocation, RoutingError> allocate(const std::string& user_id,
                                              std::optional<Provider> provider, int units,
                                              bool allow_fallback);
    void release(const QuotaReservation& reservation) noexcept;

    // Callers hold mutex_
    void roll_over_locked(std::chrono::sys_days today);
    void reset_locked(std::chrono::sys_days today);
    UserQuota& user_locked(const std::string& user_id, std::chrono::sys_days today);
    [[nodiscard]] int effective_requests(const UserQuota& quota,
                                         std::chrono::sys_days today) const noexcept;
    [[nodiscard]] int effective_used(const PoolConfig& pool,
                                     std::chrono::sys_days today) const noexcept;
    [[nodiscard]] bool pool_has_capacity(const PoolConfig& pool, int units,
                                         std::chrono::sys_days today) const noexcept;
    [[nodiscard]] PoolConfig* find_pool_locked(std::optional<Provider> provider, int units,
                                               std::chrono::sys_days today);
    [[nodiscard]] std::optional<RoutingError> cap_error_locked(const UserQuota& quota, int units,
                                                               std::chrono::sys_days today) const;
    [[nodiscard]] UpgradePrompt upgrade_prompt_for(int remaining, int units) const;
    [[nodiscard]] std::optional<int> remaining_for(const UserQuota& quota,
                                                   std::chrono::sys_days today) const noexcept;

    static void validate_units(int units);

    mutable std::shared_mutex mutex_;
    std::vector<PoolConfig> pools_;
    std::unordered_map<std::string, UserQuota> users_;
    QuotaOptions options_;
    std::shared_ptr<const Clock> clock_;
    std::chrono::sys_days last_reset_day_;
    std::uint64_t epoch_ = 0;
  };

}  // namespace switchboard
