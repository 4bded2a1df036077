#include <chrono>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <switchboard/broker/switchboard.hpp>
#include <switchboard/common/json.hpp>
#include <switchboard/common/logging.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/monitor/calibration.hpp>

namespace switchboard {

  namespace {

    Reply error_reply(const RoutingError& error) {
      return Reply{.status = http_status(error.code), .body = error};
    }

    Reply bad_request(const std::string& message) {
      return Reply{.status = 400, .body = {{"error", "InvalidRequest"}, {"message", message}}};
    }

    json alert_json(const Alert& a) {
      return {{"id", a.id},
              {"type", std::string(to_string(a.type))},
              {"severity", std::string(to_string(a.severity))},
              {"provider", a.provider},
              {"model", a.model},
              {"message", a.message},
              {"value", a.value},
              {"threshold", a.threshold},
              {"firstSeen", to_unix_millis(a.first_seen)},
              {"lastSeen", to_unix_millis(a.last_seen)},
              {"occurrences", a.occurrences},
              {"resolved", a.resolved}};
    }

  }  // namespace

  // ============================================================================
  // Construction
  // ============================================================================

  Result<std::unique_ptr<Switchboard>, std::string> Switchboard::from_profile(
      EngineProfile profile, IProviderClient& client, std::shared_ptr<const Clock> clock,
      BrokerOptions options) noexcept {
    if (!clock) return Unexpected(std::string("Switchboard requires a clock"));
    try {
      profile.validate();
      return std::unique_ptr<Switchboard>(
          new Switchboard(std::move(profile), client, std::move(clock), options));
    } catch (const std::exception& e) {
      return Unexpected(std::string(e.what()));
    }
  }

  Switchboard::Switchboard(EngineProfile profile, IProviderClient& client,
                           std::shared_ptr<const Clock> clock, BrokerOptions options)
      : profile_(std::move(profile)), clock_(std::move(clock)) {
    SWITCHBOARD_ZONE;
    set_log_level(profile_.log_level);

    catalog_ = std::make_unique<ModelCatalog>(profile_.models);
    pools_ = std::make_unique<PoolManager>(profile_.resolve_pools(), profile_.quota_options(),
                                           clock_);

    auto monitor_options = profile_.monitor_options();
    monitor_options.start_worker = options.start_background;
    monitor_ = std::make_unique<AccuracyMonitor>(monitor_options, clock_);

    if (profile_.calibration_path && std::filesystem::exists(*profile_.calibration_path)) {
      monitor_->restore(CalibrationCheckpoint::from_json(*profile_.calibration_path));
    }
    // pinned baselines win over restored ones
    for (const auto& b : profile_.baselines) {
      monitor_->set_baseline(b.provider, b.model, b.to_metrics());
    }

    engine_ = std::make_unique<RoutingEngine>(*catalog_, *pools_, *monitor_, client,
                                              profile_.engine_options(), clock_);
    scheduler_ = std::make_unique<DailyResetScheduler>(
        *pools_, clock_, std::chrono::seconds{profile_.quota.reset_poll_seconds});
    if (options.start_background) scheduler_->start();

    logger()->info("switchboard ready: {} models, {} pools", catalog_->size(),
                   profile_.pools.size());
  }

  Switchboard::~Switchboard() {
    if (scheduler_) scheduler_->stop();
  }

  // ============================================================================
  // Typed API
  // ============================================================================

  WireRequest Switchboard::wire_request(const DispatchRequest& dispatch) const {
    return build_wire_request(dispatch, profile_.endpoint(dispatch.provider));
  }

  bool Switchboard::save_calibration() const {
    if (!profile_.calibration_path) return false;
    monitor_->checkpoint().to_json(*profile_.calibration_path);
    logger()->info("calibration saved to {}", *profile_.calibration_path);
    return true;
  }

  // ============================================================================
  // JSON Surface
  // ============================================================================

  Reply Switchboard::handle_completion(const std::string& user_id, const std::string& body,
                                       std::stop_token stop) {
    SWITCHBOARD_ZONE;
    RoutingRequest request;
    try {
      request = parse_routing_request(body);
    } catch (const std::invalid_argument& e) {
      return bad_request(e.what());
    }
    request.user_id = user_id;

    auto result = engine_->execute(request, std::move(stop));
    if (!result) return error_reply(result.error());
    return Reply{.status = 200, .body = result.value()};
  }

  Reply Switchboard::handle_quota_status(const std::string& user_id) const {
    auto status = pools_->quota_status(user_id);
    json body = {{"tier", status.tier},
                 {"requestsToday", status.requests_today},
                 {"remaining", status.remaining ? json(*status.remaining) : json(nullptr)},
                 {"poolStatus",
                  {{"totalPools", status.pool_status.total_pools},
                   {"availablePools", status.pool_status.available_pools}}}};
    return Reply{.status = 200, .body = std::move(body)};
  }

  Reply Switchboard::handle_outcome(const std::string& body) {
    ExecutionOutcome outcome;
    try {
      outcome = parse_outcome(body);
    } catch (const std::invalid_argument& e) {
      return bad_request(e.what());
    }

    auto receipt = monitor_->record_outcome(std::move(outcome));
    if (!receipt) return error_reply(receipt.error());
    return Reply{.status = 200,
                 .body = {{"requestId", receipt.value().request_id},
                          {"sampled", receipt.value().sampled}}};
  }

  Reply Switchboard::handle_alerts(bool unresolved_only) const {
    json alerts = json::array();
    for (const auto& alert : monitor_->alerts().alerts(unresolved_only)) {
      alerts.push_back(alert_json(alert));
    }
    return Reply{.status = 200, .body = {{"alerts", std::move(alerts)}}};
  }

  Reply Switchboard::handle_insights() const {
    auto insights = monitor_->insights();

    json top = json::array();
    for (const auto& pair : insights.top_performers) {
      top.push_back({{"model", pair.key},
                     {"overallAccuracy", pair.metrics.overall_accuracy},
                     {"sampleSize", pair.metrics.sample_size}});
    }

    const auto& perf = insights.performance;
    json body = {{"modelsTracked", insights.models_tracked},
                 {"outcomesAnalyzed", insights.outcomes_analyzed},
                 {"overallAccuracy", insights.overall_accuracy},
                 {"alerts",
                  {{"total", insights.alerts.total},
                   {"unresolved", insights.alerts.unresolved},
                   {"critical", insights.alerts.critical}}},
                 {"topPerformers", std::move(top)},
                 {"performance",
                  {{"requests", perf.requests},
                   {"p50LatencyMs", perf.p50_latency_ms},
                   {"p95LatencyMs", perf.p95_latency_ms},
                   {"p99LatencyMs", perf.p99_latency_ms},
                   {"errorRate", perf.error_rate},
                   {"healthScore", perf.health_score},
                   {"status", std::string(to_string(perf.status))}}}};
    return Reply{.status = 200, .body = std::move(body)};
  }

}  // namespace switchboard
