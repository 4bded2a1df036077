#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <switchboard/common/clock.hpp>
#include <switchboard/common/error.hpp>
#include <switchboard/common/result.hpp>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_monitor.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <switchboard/prediction/features.hpp>
#include <switchboard/prediction/predictor.hpp>
#include <switchboard/providers/provider_client.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <switchboard/routing/scoring.hpp>
#include <switchboard/streaming/normalizer.hpp>
#include <vector>

namespace switchboard {

  struct EngineOptions {
    PredictorOptions predictor;
    ScoringOptions scoring;
    double heuristic_quality = 0.7;     // quality posted for a successful execution
    double clean_stop_bonus = 0.1;      // added when the provider finished with `stop`
    bool post_outcomes = true;          // execute() reports outcomes to the monitor itself
    size_t decision_log_capacity = 1000;
  };

  /// execute_stream() result; the stream must not outlive the engine
  struct RoutedStream {
    RoutingDecision decision;
    std::unique_ptr<StreamNormalizer> stream;
  };

  /**
   * Per-request routing state machine:
   *
   *   Init -> CandidatesGathered -> QuotaFiltered -> Scored -> Decided
   *        -> Dispatched | FallbackDispatched | Failed
   *
   * route() stops at Decided. execute() and execute_stream() reserve quota for the winner,
   * dispatch, and on a transport or provider failure release the reservation and try the
   * next-ranked candidate exactly once.
   *
   * The engine owns no shared state of its own beyond the decision log; the catalog, pools,
   * monitor and provider client are injected and must outlive it.
   */
  class RoutingEngine {
  public:
    RoutingEngine(const ModelCatalog& catalog, PoolManager& pools, AccuracyMonitor& monitor,
                  IProviderClient& client, EngineOptions options = {},
                  std::shared_ptr<const Clock> clock = make_system_clock());

    RoutingEngine(const RoutingEngine&) = delete;
    RoutingEngine& operator=(const RoutingEngine&) = delete;
    RoutingEngine(RoutingEngine&&) = delete;
    RoutingEngine& operator=(RoutingEngine&&) = delete;

    /// Decision only; nothing is reserved or dispatched. The winner's prediction is registered
    /// so an outcome can be reported against the request id.
    [[nodiscard]] Result<RoutingDecision, RoutingError> route(const RoutingRequest& request);

    [[nodiscard]] Result<CompletionResponse, RoutingError> execute(const RoutingRequest& request,
                                                                   std::stop_token stop = {});

    /// Quota is committed when the stream ends cleanly and released when it fails or is
    /// cancelled
    [[nodiscard]] Result<RoutedStream, RoutingError> execute_stream(const RoutingRequest& request,
                                                                    std::stop_token stop = {});

    /// Most recent decisions, newest last
    [[nodiscard]] std::vector<RoutingDecision> recent_decisions(size_t limit = 100) const;

    [[nodiscard]] const Predictor& predictor() const noexcept { return predictor_; }
    [[nodiscard]] const StrategyScorer& scorer() const noexcept { return scorer_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

  private:
    struct Plan {
      RoutingDecision decision;
      RequestFeatures features;
    };

    struct Attempt {
      const CandidatePrediction* candidate;
      const ModelSpec* spec;
      QuotaReservation reservation;
      DispatchRequest dispatch;
    };

    [[nodiscard]] Result<Plan, RoutingError> plan(const RoutingRequest& request);
    [[nodiscard]] std::vector<const ModelSpec*> gather(const RoutingRequest& request,
                                                       const RequestFeatures& features) const;
    [[nodiscard]] std::optional<Attempt> prepare(const RoutingRequest& request, Plan& plan,
                                                 size_t index, std::stop_token stop);

    [[nodiscard]] double actual_cost(const ModelSpec& spec, const CandidatePrediction& predicted,
                                     const Usage& usage) const noexcept;
    void post_outcome(ExecutionOutcome outcome);
    void log_decision(const RoutingDecision& decision);
    [[nodiscard]] RoutingError dispatch_failed(const RoutingDecision& decision,
                                               const std::string& last_error) const;

    const ModelCatalog& catalog_;
    PoolManager& pools_;
    AccuracyMonitor& monitor_;
    IProviderClient& client_;
    EngineOptions options_;
    std::shared_ptr<const Clock> clock_;
    Predictor predictor_;
    StrategyScorer scorer_;

    mutable std::mutex log_mutex_;
    std::deque<RoutingDecision> decisions_;
  };

}  // namespace switchboard
