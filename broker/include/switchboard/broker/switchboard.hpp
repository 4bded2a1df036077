#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_monitor.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <switchboard/profile/profile.hpp>
#include <switchboard/providers/provider_client.hpp>
#include <switchboard/providers/wire.hpp>
#include <switchboard/quota/daily_reset.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <switchboard/routing/engine.hpp>
#include <vector>

namespace switchboard {

  struct BrokerOptions {
    bool start_background = true;  // monitor worker and daily reset thread
  };

  /// JSON reply for an outer HTTP surface
  struct Reply {
    int status = 200;
    nlohmann::json body;
  };

  /**
   * Engine assembled from an EngineProfile.
   *
   * Owns the catalog, quota pools, accuracy monitor, routing engine and daily reset
   * scheduler. The provider client is supplied by the embedding application and must outlive
   * the broker.
   */
  class Switchboard {
  public:
    [[nodiscard]] static Result<std::unique_ptr<Switchboard>, std::string> from_profile(
        EngineProfile profile, IProviderClient& client,
        std::shared_ptr<const Clock> clock = make_system_clock(),
        BrokerOptions options = {}) noexcept;

    ~Switchboard();

    Switchboard(const Switchboard&) = delete;
    Switchboard& operator=(const Switchboard&) = delete;
    Switchboard(Switchboard&&) = delete;
    Switchboard& operator=(Switchboard&&) = delete;

    // =========================================================================
    // Typed API
    // =========================================================================

    [[nodiscard]] Result<RoutingDecision, RoutingError> route(const RoutingRequest& request) {
      return engine_->route(request);
    }

    [[nodiscard]] Result<CompletionResponse, RoutingError> execute(const RoutingRequest& request,
                                                                   std::stop_token stop = {}) {
      return engine_->execute(request, std::move(stop));
    }

    [[nodiscard]] Result<RoutedStream, RoutingError> execute_stream(const RoutingRequest& request,
                                                                    std::stop_token stop = {}) {
      return engine_->execute_stream(request, std::move(stop));
    }

    /// Outcome reported by a caller that dispatched a routed request itself
    [[nodiscard]] Result<OutcomeReceipt, RoutingError> record_outcome(ExecutionOutcome outcome) {
      return monitor_->record_outcome(std::move(outcome));
    }

    [[nodiscard]] QuotaStatus quota_status(const std::string& user_id) const {
      return pools_->quota_status(user_id);
    }

    void update_user_tier(const std::string& user_id, Tier tier) {
      pools_->update_user_tier(user_id, tier);
    }

    /// Provider-native HTTP request for a dispatch, using the profile's endpoints
    [[nodiscard]] WireRequest wire_request(const DispatchRequest& dispatch) const;

    /// Writes the monitor's calibration to the profile's calibration_path; false when unset
    bool save_calibration() const;

    // =========================================================================
    // JSON Surface
    // =========================================================================

    /// Routing request body -> completion response, or an error body with its HTTP status
    [[nodiscard]] Reply handle_completion(const std::string& user_id, const std::string& body,
                                          std::stop_token stop = {});

    [[nodiscard]] Reply handle_quota_status(const std::string& user_id) const;

    /// Outcome submission; a repeated request id answers 409
    [[nodiscard]] Reply handle_outcome(const std::string& body);

    [[nodiscard]] Reply handle_alerts(bool unresolved_only) const;

    [[nodiscard]] Reply handle_insights() const;

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] const EngineProfile& profile() const noexcept { return profile_; }
    [[nodiscard]] const ModelCatalog& catalog() const noexcept { return *catalog_; }
    [[nodiscard]] PoolManager& pools() noexcept { return *pools_; }
    [[nodiscard]] AccuracyMonitor& monitor() noexcept { return *monitor_; }
    [[nodiscard]] RoutingEngine& engine() noexcept { return *engine_; }
    [[nodiscard]] DailyResetScheduler& scheduler() noexcept { return *scheduler_; }

  private:
    Switchboard(EngineProfile profile, IProviderClient& client,
                std::shared_ptr<const Clock> clock, BrokerOptions options);

    EngineProfile profile_;
    std::shared_ptr<const Clock> clock_;
    std::unique_ptr<ModelCatalog> catalog_;
    std::unique_ptr<PoolManager> pools_;
    std::unique_ptr<AccuracyMonitor> monitor_;
    std::unique_ptr<RoutingEngine> engine_;
    std::unique_ptr<DailyResetScheduler> scheduler_;
  };

}  // namespace switchboard
