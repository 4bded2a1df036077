#include <algorithm>
#include <format>
#include <mutex>
#include <ranges>
#include <stdexcept>
#include <tuple>
#include <switchboard/common/logging.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <unordered_set>
#include <utility>

namespace switchboard {

  std::string_view to_string(PoolStatus s) noexcept {
    switch (s) {
      case PoolStatus::Active:
        return "active";
      case PoolStatus::Exhausted:
        return "exhausted";
      case PoolStatus::Error:
        return "error";
    }
    return "unknown";
  }

  // ============================================================================
  // QuotaReservation
  // ============================================================================

  QuotaReservation::~QuotaReservation() { release(); }

  QuotaReservation::QuotaReservation(QuotaReservation&& other) noexcept
      : owner_(std::exchange(other.owner_, nullptr)),
        grant_(std::move(other.grant_)),
        user_id_(std::move(other.user_id_)),
        units_(other.units_),
        epoch_(other.epoch_) {}

  QuotaReservation& QuotaReservation::operator=(QuotaReservation&& other) noexcept {
    if (this != &other) {
      release();
      owner_ = std::exchange(other.owner_, nullptr);
      grant_ = std::move(other.grant_);
      user_id_ = std::move(other.user_id_);
      units_ = other.units_;
      epoch_ = other.epoch_;
    }
    return *this;
  }

  void QuotaReservation::commit() noexcept { owner_ = nullptr; }

  void QuotaReservation::release() noexcept {
    if (owner_ == nullptr) return;
    owner_->release(*this);
    owner_ = nullptr;
  }

  // ============================================================================
  // PoolManager - construction
  // ============================================================================

  PoolManager::PoolManager(std::vector<PoolConfig> pools, QuotaOptions options,
                           std::shared_ptr<const Clock> clock)
      : pools_(std::move(pools)), options_(options), clock_(std::move(clock)) {
    if (!clock_) {
      throw std::invalid_argument("PoolManager requires a clock");
    }
    if (options_.instant_daily_limit <= 0) {
      throw std::invalid_argument(std::format("instant_daily_limit must be positive, got {}",
                                              options_.instant_daily_limit));
    }
    if (options_.upgrade_prompt_ratio <= 0.0 || options_.upgrade_prompt_ratio > 1.0) {
      throw std::invalid_argument(std::format("upgrade_prompt_ratio must be within (0, 1], got {}",
                                              options_.upgrade_prompt_ratio));
    }

    std::unordered_set<std::string> seen;
    for (auto& pool : pools_) {
      if (pool.pool_id.empty()) {
        throw std::invalid_argument("pool_id must not be empty");
      }
      if (!seen.insert(pool.pool_id).second) {
        throw std::invalid_argument(std::format("duplicate pool_id '{}'", pool.pool_id));
      }
      if (pool.daily_limit <= 0) {
        throw std::invalid_argument(std::format("pool '{}' daily_limit must be positive, got {}",
                                                pool.pool_id, pool.daily_limit));
      }
      if (pool.priority < 1 || pool.priority > 10) {
        throw std::invalid_argument(std::format("pool '{}' priority must be within [1, 10], got {}",
                                                pool.pool_id, pool.priority));
      }
      if (pool.used_today < 0) pool.used_today = 0;
      if (pool.status == PoolStatus::Active && pool.used_today >= pool.daily_limit) {
        pool.status = PoolStatus::Exhausted;
      }
    }

    last_reset_day_ = utc_day(clock_->now());
  }

  void PoolManager::validate_units(int units) {
    if (units < 1) [[unlikely]] {
      throw std::invalid_argument(std::format("units must be at least 1, got {}", units));
    }
  }

  // ============================================================================
  // PoolManager - allocation
  // ============================================================================

  Result<KeyGrant, RoutingError> PoolManager::get_available_key(
      const std::string& user_id, std::optional<Provider> preferred_provider, int units) {
    auto allocation = allocate(user_id, preferred_provider, units, true);
    if (!allocation) {
      return Unexpected(std::move(allocation.error()));
    }
    return std::move(allocation.value().grant);
  }

  Result<QuotaReservation, RoutingError> PoolManager::reserve(const std::string& user_id,
                                                              Provider provider, int units) {
    auto allocation = allocate(user_id, provider, units, false);
    if (!allocation) {
      return Unexpected(std::move(allocation.error()));
    }
    auto& [grant, epoch] = allocation.value();
    return QuotaReservation(this, std::move(grant), user_id, units, epoch);
  }

  Result<PoolManager::Allocation, RoutingError> PoolManager::allocate(
      const std::string& user_id, std::optional<Provider> provider, int units,
      bool allow_fallback) {
    SWITCHBOARD_ZONE;
    validate_units(units);

    std::unique_lock lock(mutex_);
    const auto today = utc_day(clock_->now());
    roll_over_locked(today);

    auto& quota = user_locked(user_id, today);
    if (auto err = cap_error_locked(quota, units, today)) {
      return Unexpected(std::move(*err));
    }

    PoolConfig* pool = find_pool_locked(provider, units, today);
    if (pool == nullptr && provider.has_value() && allow_fallback) {
      pool = find_pool_locked(std::nullopt, units, today);
    }
    if (pool == nullptr) {
      auto err = exhausted_error();
      if (provider && !allow_fallback) {
        err.message = std::format("no {} pool has {} units left today", to_string(*provider),
                                  units);
      }
      return Unexpected(std::move(err));
    }

    pool->used_today += units;
    if (pool->used_today >= pool->daily_limit) {
      pool->status = PoolStatus::Exhausted;
      logger()->warn("pool '{}' reached its daily limit of {}", pool->pool_id, pool->daily_limit);
    }
    quota.requests_today += units;

    return Allocation{.grant = KeyGrant{.pool_id = pool->pool_id,
                                        .provider = pool->provider,
                                        .api_key = pool->api_key,
                                        .quota_remaining = remaining_for(quota, today)},
                      .epoch = epoch_};
  }

  void PoolManager::release(const QuotaReservation& reservation) noexcept {
    std::unique_lock lock(mutex_);
    // Counters were cleared by a reset after this reservation was made
    if (reservation.epoch_ != epoch_) return;

    auto pool_it = std::ranges::find(pools_, reservation.grant_.pool_id, &PoolConfig::pool_id);
    if (pool_it != pools_.end()) {
      pool_it->used_today = std::max(0, pool_it->used_today - reservation.units_);
      if (pool_it->status == PoolStatus::Exhausted && pool_it->used_today < pool_it->daily_limit) {
        pool_it->status = PoolStatus::Active;
      }
    }

    auto user_it = users_.find(reservation.user_id_);
    if (user_it != users_.end()) {
      user_it->second.requests_today
          = std::max(0, user_it->second.requests_today - reservation.units_);
    }
  }

  // ============================================================================
  // PoolManager - queries
  // ============================================================================

  bool PoolManager::check_availability(const std::string& user_id, Provider provider,
                                       int units) const {
    validate_units(units);
    std::shared_lock lock(mutex_);
    const auto today = utc_day(clock_->now());

    auto it = users_.find(user_id);
    if (it != users_.end() && cap_error_locked(it->second, units, today)) {
      return false;
    }
    return std::ranges::any_of(pools_, [&](const PoolConfig& pool) {
      return pool.provider == provider && pool_has_capacity(pool, units, today);
    });
  }

  std::optional<RoutingError> PoolManager::check_user_cap(const std::string& user_id,
                                                          int units) const {
    validate_units(units);
    std::shared_lock lock(mutex_);
    const auto today = utc_day(clock_->now());

    auto it = users_.find(user_id);
    if (it == users_.end()) {
      UserQuota fresh{.user_id = user_id, .tier = Tier::Instant, .requests_today = 0, .day = today};
      return cap_error_locked(fresh, units, today);
    }
    return cap_error_locked(it->second, units, today);
  }

  void PoolManager::update_user_tier(const std::string& user_id, Tier tier) {
    std::unique_lock lock(mutex_);
    const auto today = utc_day(clock_->now());
    roll_over_locked(today);
    user_locked(user_id, today).tier = tier;
    logger()->info("user '{}' moved to tier {}", user_id, to_string(tier));
  }

  bool PoolManager::should_show_upgrade_prompt(const std::string& user_id) const {
    std::shared_lock lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end() || it->second.tier != Tier::Instant) return false;

    const int used = effective_requests(it->second, utc_day(clock_->now()));
    return static_cast<double>(used)
           >= options_.upgrade_prompt_ratio * static_cast<double>(options_.instant_daily_limit);
  }

  QuotaStatus PoolManager::quota_status(const std::string& user_id) const {
    std::shared_lock lock(mutex_);
    const auto today = utc_day(clock_->now());

    QuotaStatus status;
    status.pool_status.total_pools = static_cast<int>(pools_.size());
    status.pool_status.available_pools = static_cast<int>(std::ranges::count_if(
        pools_, [&](const PoolConfig& pool) { return pool_has_capacity(pool, 1, today); }));

    auto it = users_.find(user_id);
    if (it == users_.end()) {
      status.tier = Tier::Instant;
      status.requests_today = 0;
      status.remaining = options_.instant_daily_limit;
      return status;
    }

    status.tier = it->second.tier;
    status.requests_today = effective_requests(it->second, today);
    status.remaining = remaining_for(it->second, today);
    return status;
  }

  PoolStatusReport PoolManager::pool_status() const {
    std::shared_lock lock(mutex_);
    const auto today = utc_day(clock_->now());
    const bool stale = last_reset_day_ < today;

    PoolStatusReport report;
    report.pools.reserve(pools_.size());
    for (const auto& pool : pools_) {
      const int used = effective_used(pool, today);
      auto status = pool.status;
      if (stale && status == PoolStatus::Exhausted) status = PoolStatus::Active;
      report.pools.push_back(PoolReport{
          .pool_id = pool.pool_id,
          .provider = pool.provider,
          .used_today = used,
          .daily_limit = pool.daily_limit,
          .status = status,
          .utilization_percent = 100.0 * used / static_cast<double>(pool.daily_limit)});
    }

    report.total_users = users_.size();
    for (const auto& [_, quota] : users_) {
      report.total_requests_today += effective_requests(quota, today);
    }
    return report;
  }

  // ============================================================================
  // PoolManager - administration and resets
  // ============================================================================

  void PoolManager::mark_pool_error(const std::string& pool_id) {
    std::unique_lock lock(mutex_);
    auto it = std::ranges::find(pools_, pool_id, &PoolConfig::pool_id);
    if (it == pools_.end()) {
      throw std::invalid_argument(std::format("unknown pool '{}'", pool_id));
    }
    it->status = PoolStatus::Error;
    logger()->warn("pool '{}' taken out of rotation", pool_id);
  }

  void PoolManager::restore_pool(const std::string& pool_id) {
    std::unique_lock lock(mutex_);
    auto it = std::ranges::find(pools_, pool_id, &PoolConfig::pool_id);
    if (it == pools_.end()) {
      throw std::invalid_argument(std::format("unknown pool '{}'", pool_id));
    }
    it->status = it->used_today >= it->daily_limit ? PoolStatus::Exhausted : PoolStatus::Active;
    logger()->info("pool '{}' restored as {}", pool_id, to_string(it->status));
  }

  bool PoolManager::roll_over(SystemTime now) {
    std::unique_lock lock(mutex_);
    const auto today = utc_day(now);
    if (today <= last_reset_day_) return false;
    reset_locked(today);
    return true;
  }

  void PoolManager::reset_daily_quotas() {
    std::unique_lock lock(mutex_);
    reset_locked(std::max(last_reset_day_, utc_day(clock_->now())));
  }

  std::uint64_t PoolManager::reset_epoch() const {
    std::shared_lock lock(mutex_);
    return epoch_;
  }

  void PoolManager::roll_over_locked(std::chrono::sys_days today) {
    if (today > last_reset_day_) reset_locked(today);
  }

  void PoolManager::reset_locked(std::chrono::sys_days today) {
    for (auto& pool : pools_) {
      pool.used_today = 0;
      if (pool.status == PoolStatus::Exhausted) pool.status = PoolStatus::Active;
    }
    for (auto& [_, quota] : users_) {
      quota.requests_today = 0;
      quota.day = today;
    }
    last_reset_day_ = today;
    ++epoch_;
    logger()->info("daily quota reset: {} pools, {} users (epoch {})", pools_.size(),
                   users_.size(), epoch_);
  }

  // ============================================================================
  // PoolManager - helpers (mutex_ held by caller)
  // ============================================================================

  UserQuota& PoolManager::user_locked(const std::string& user_id, std::chrono::sys_days today) {
    auto [it, inserted] = users_.try_emplace(
        user_id,
        UserQuota{.user_id = user_id, .tier = Tier::Instant, .requests_today = 0, .day = today});
    auto& quota = it->second;
    if (!inserted && quota.day < today) {
      quota.requests_today = 0;
      quota.day = today;
    }
    return quota;
  }

  int PoolManager::effective_requests(const UserQuota& quota,
                                      std::chrono::sys_days today) const noexcept {
    return quota.day < today ? 0 : quota.requests_today;
  }

  int PoolManager::effective_used(const PoolConfig& pool,
                                  std::chrono::sys_days today) const noexcept {
    return last_reset_day_ < today ? 0 : pool.used_today;
  }

  bool PoolManager::pool_has_capacity(const PoolConfig& pool, int units,
                                      std::chrono::sys_days today) const noexcept {
    if (pool.status == PoolStatus::Error) return false;
    const bool stale = last_reset_day_ < today;
    if (pool.status == PoolStatus::Exhausted && !stale) return false;
    return effective_used(pool, today) + units <= pool.daily_limit;
  }

  PoolConfig* PoolManager::find_pool_locked(std::optional<Provider> provider, int units,
                                            std::chrono::sys_days today) {
    PoolConfig* best = nullptr;
    for (auto& pool : pools_) {
      if (provider && pool.provider != *provider) continue;
      if (!pool_has_capacity(pool, units, today)) continue;
      if (best == nullptr
          || std::tie(pool.priority, pool.used_today, pool.pool_id)
                 < std::tie(best->priority, best->used_today, best->pool_id)) {
        best = &pool;
      }
    }
    return best;
  }

  std::optional<RoutingError> PoolManager::cap_error_locked(const UserQuota& quota, int units,
                                                            std::chrono::sys_days today) const {
    if (quota.tier != Tier::Instant) return std::nullopt;

    const int used = effective_requests(quota, today);
    if (used + units <= options_.instant_daily_limit) return std::nullopt;

    const int remaining = options_.instant_daily_limit - used;
    auto err = make_error(ErrorCode::QuotaExhausted,
                          remaining <= 0
                              ? std::string("Daily limit reached")
                              : std::format("Only {} requests left today", remaining));
    err.upgrade_prompt = upgrade_prompt_for(remaining, units);
    return err;
  }

  RoutingError PoolManager::exhausted_error() const {
    auto err = make_error(ErrorCode::QuotaExhausted, "All shared pools are exhausted");
    err.upgrade_prompt = UpgradePrompt{
        .title = "Daily limit reached",
        .message = "Connect your provider to continue instantly",
        .urgency = Urgency::Critical,
        .benefits = {"60x more requests", "Priority processing", "Advanced features"}};
    return err;
  }

  UpgradePrompt PoolManager::upgrade_prompt_for(int remaining, int units) const {
    if (remaining <= 0) {
      return UpgradePrompt{
          .title = "Daily limit reached",
          .message = "Connect your provider for 1,500+ daily requests",
          .urgency = Urgency::Critical,
          .benefits = {std::format("60x more requests (1,500+ vs {})", options_.instant_daily_limit),
                       "Priority processing", "No sharing with others",
                       "Advanced orchestration features"}};
    }
    if (remaining <= 5) {
      return UpgradePrompt{.title = std::format("Only {} requests left today!", remaining),
                           .message = "Connect your provider for unlimited requests",
                           .urgency = Urgency::High,
                           .benefits = {"60x more requests", "Priority processing",
                                        "Dedicated quota"}};
    }
    return UpgradePrompt{
        .title = std::format("{} requests left today", remaining),
        .message = std::format("This request needs {} units. Connect your provider to continue",
                               units),
        .urgency = Urgency::Medium,
        .benefits = {"Dedicated quota", "Priority processing"}};
  }

  std::optional<int> PoolManager::remaining_for(const UserQuota& quota,
                                                std::chrono::sys_days today) const noexcept {
    if (quota.tier != Tier::Instant) return std::nullopt;
    return std::max(0, options_.instant_daily_limit - effective_requests(quota, today));
  }

}  // namespace switchboard
