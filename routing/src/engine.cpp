#include <algorithm>
#include <chrono>
#include <format>
#include <ranges>
#include <stdexcept>
#include <switchboard/common/logging.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/routing/engine.hpp>

namespace switchboard {

  namespace {

    double elapsed_ms(std::chrono::steady_clock::time_point since) {
      return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since)
          .count();
    }

    bool contains(const std::vector<Provider>& providers, Provider p) {
      return std::ranges::find(providers, p) != providers.end();
    }

    std::string join(const std::vector<Provider>& providers) {
      std::string out;
      for (auto p : providers) {
        if (!out.empty()) out += ", ";
        out += to_string(p);
      }
      return out;
    }

  }  // namespace

  RoutingEngine::RoutingEngine(const ModelCatalog& catalog, PoolManager& pools,
                               AccuracyMonitor& monitor, IProviderClient& client,
                               EngineOptions options, std::shared_ptr<const Clock> clock)
      : catalog_(catalog),
        pools_(pools),
        monitor_(monitor),
        client_(client),
        options_(std::move(options)),
        clock_(std::move(clock)),
        predictor_(monitor.calibration(), options_.predictor),
        scorer_(options_.scoring) {
    if (!clock_) throw std::invalid_argument("RoutingEngine requires a clock");
    if (options_.heuristic_quality < 0.0 || options_.heuristic_quality > 1.0) {
      throw std::invalid_argument(
          std::format("heuristic_quality must be in [0, 1], got {}", options_.heuristic_quality));
    }
    if (options_.decision_log_capacity == 0) {
      throw std::invalid_argument("decision_log_capacity must be positive");
    }
  }

  // ============================================================================
  // Decision
  // ============================================================================

  std::vector<const ModelSpec*> RoutingEngine::gather(const RoutingRequest& request,
                                                      const RequestFeatures& features) const {
    std::vector<const ModelSpec*> specs;
    if (request.model && !request.model->empty()) {
      specs = catalog_.match_hint(*request.model);
      if (specs.empty()) {
        logger()->debug("model hint '{}' matches no catalog entry, routing by capability {}",
                        *request.model, to_string(features.capability));
      }
    }
    if (specs.empty()) specs = catalog_.for_capability(features.capability);

    if (!request.tools.empty()) {
      std::erase_if(specs, [](const ModelSpec* s) { return !s->supports_tools; });
    }

    const auto& k = request.constraints;
    std::erase_if(specs, [&](const ModelSpec* s) { return contains(k.exclude_providers, s->provider); });

    if (!k.preferred_providers.empty()) {
      auto preferred = specs | std::views::filter([&](const ModelSpec* s) {
                         return contains(k.preferred_providers, s->provider);
                       });
      specs = std::vector<const ModelSpec*>(preferred.begin(), preferred.end());
    }
    return specs;
  }

  Result<RoutingEngine::Plan, RoutingError> RoutingEngine::plan(const RoutingRequest& request) {
    SWITCHBOARD_ZONE;
    const auto started = std::chrono::steady_clock::now();

    Plan p{};
    auto& d = p.decision;
    d.request_id = request.request_id.empty() ? make_request_id() : request.request_id;
    d.strategy = request.optimize_for;
    d.timestamp = clock_->now();
    d.state = DecisionState::Init;

    auto fail = [&](RoutingError err) {
      d.state = DecisionState::Failed;
      d.reasoning = err.message;
      log_decision(d);
      return Unexpected(std::move(err));
    };

    p.features = predictor_.features(request);
    auto specs = gather(request, p.features);
    if (specs.empty()) {
      const auto& preferred = request.constraints.preferred_providers;
      if (!preferred.empty()) {
        return fail(make_error(ErrorCode::NoEligibleProvider,
                               std::format("no catalog model from the preferred providers ({}) "
                                           "serves this {} request",
                                           join(preferred), to_string(p.features.capability))));
      }
      return fail(make_error(ErrorCode::NoEligibleProvider,
                             std::format("no catalog model serves this {} request",
                                         to_string(p.features.capability))));
    }
    d.state = DecisionState::CandidatesGathered;

    if (auto cap = pools_.check_user_cap(request.user_id)) return fail(std::move(*cap));

    const auto gathered = specs.size();
    std::erase_if(specs, [&](const ModelSpec* s) {
      return !pools_.check_availability(request.user_id, s->provider);
    });
    if (specs.empty()) {
      auto err = pools_.exhausted_error();
      err.code = ErrorCode::NoEligibleProvider;
      err.message = std::format("none of the {} candidate providers has pool capacity", gathered);
      return fail(std::move(err));
    }
    d.state = DecisionState::QuotaFiltered;

    auto candidates = predictor_.predict_all(specs, p.features);
    const auto predicted = candidates.size();
    const auto first_violation = violation(candidates.front(), request.constraints);
    std::erase_if(candidates, [&](const CandidatePrediction& c) {
      return !satisfies(c, request.constraints);
    });
    if (candidates.empty()) {
      return fail(make_error(ErrorCode::NoEligibleProvider,
                             std::format("all {} candidates violate the request constraints ({})",
                                         predicted, first_violation)));
    }

    scorer_.rank(candidates, d.strategy);
    d.state = DecisionState::Scored;
    d.ranked = std::move(candidates);

    const auto& winner = d.ranked.front();
    d.provider = winner.provider;
    d.model = winner.model;
    d.reasoning = std::format(
        "{} strategy picked {} from {} candidates (score {:.4f}, cost ${:.6f}, latency {:.0f}ms, "
        "quality {:.2f})",
        to_string(d.strategy), winner.model_id(), d.ranked.size(), winner.score,
        winner.predicted_cost, winner.predicted_latency_ms, winner.predicted_quality);
    d.state = DecisionState::Decided;

    monitor_.record_routing_latency(elapsed_ms(started));
    return p;
  }

  Result<RoutingDecision, RoutingError> RoutingEngine::route(const RoutingRequest& request) {
    auto planned = plan(request);
    if (!planned) return Unexpected(planned.error());
    auto& decision = planned.value().decision;
    monitor_.register_prediction(decision.request_id, decision.ranked.front());
    log_decision(decision);
    return std::move(decision);
  }

  // ============================================================================
  // Dispatch
  // ============================================================================

  std::optional<RoutingEngine::Attempt> RoutingEngine::prepare(const RoutingRequest& request,
                                                               Plan& plan, size_t index,
                                                               std::stop_token stop) {
    auto& d = plan.decision;
    const auto& candidate = d.ranked[index];

    auto reservation = pools_.reserve(request.user_id, candidate.provider);
    if (!reservation) {
      logger()->warn("request {}: {} lost pool capacity before dispatch: {}", d.request_id,
                     to_string(candidate.provider), reservation.error().message);
      return std::nullopt;
    }

    const auto& grant = reservation.value().grant();
    d.attempted_providers.push_back(candidate.provider);
    d.pool_id = grant.pool_id;

    DispatchRequest dispatch{.request_id = d.request_id,
                             .provider = candidate.provider,
                             .model = candidate.model,
                             .pool_id = grant.pool_id,
                             .api_key = grant.api_key,
                             .request = &request,
                             .stream = false,
                             .deadline = std::nullopt,
                             .stop = std::move(stop)};
    if (request.constraints.max_response_time_ms) {
      dispatch.deadline = clock_->now()
                          + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                              std::chrono::duration<double, std::milli>(
                                  *request.constraints.max_response_time_ms));
    }

    monitor_.register_prediction(d.request_id, candidate);
    return Attempt{.candidate = &candidate,
                   .spec = catalog_.find(candidate.provider, candidate.model),
                   .reservation = std::move(reservation.value()),
                   .dispatch = std::move(dispatch)};
  }

  Result<CompletionResponse, RoutingError> RoutingEngine::execute(const RoutingRequest& request,
                                                                  std::stop_token stop) {
    SWITCHBOARD_ZONE;
    auto planned = plan(request);
    if (!planned) return Unexpected(planned.error());
    auto& p = planned.value();
    auto& d = p.decision;

    std::string last_error = "no candidate could be reserved";
    std::optional<ExecutionOutcome> last_failure;
    const size_t attempts = std::min<size_t>(2, d.ranked.size());

    for (size_t i = 0; i < attempts; ++i) {
      if (stop.stop_requested()) break;
      auto attempt = prepare(request, p, i, stop);
      if (!attempt) continue;

      const auto& c = *attempt->candidate;
      const auto started = std::chrono::steady_clock::now();
      auto response = client_.complete(attempt->dispatch);
      const double latency_ms = elapsed_ms(started);

      if (response) {
        attempt->reservation.commit();
        auto& r = response.value();
        Usage usage = r.usage;
        usage.cost = actual_cost(*attempt->spec, c, r.usage);

        d.state = i == 0 ? DecisionState::Dispatched : DecisionState::FallbackDispatched;
        d.provider = c.provider;
        d.model = c.model;
        if (i > 0) d.reasoning += std::format("; fell back to {} after {}", c.model_id(), last_error);
        log_decision(d);

        const double bonus = r.finish_reason == FinishReason::Stop ? options_.clean_stop_bonus : 0.0;
        post_outcome(ExecutionOutcome{.request_id = d.request_id,
                                      .provider = c.provider,
                                      .model = c.model,
                                      .cost = usage.cost,
                                      .latency_ms = latency_ms,
                                      .success = true,
                                      .error_kind = std::nullopt,
                                      .quality_score = std::min(1.0, options_.heuristic_quality + bonus),
                                      .timestamp = clock_->now()});

        return CompletionResponse{.request_id = d.request_id,
                                  .provider = c.provider,
                                  .model = c.model,
                                  .content = std::move(r.content),
                                  .finish_reason = r.finish_reason,
                                  .usage = usage,
                                  .decision = d};
      }

      attempt->reservation.release();
      const auto& err = response.error();
      last_error = std::format("{} {}: {}", c.model_id(), err.kind, err.message);
      if (err.kind == "auth") pools_.mark_pool_error(attempt->dispatch.pool_id);
      if (err.kind == "cancelled" || stop.stop_requested()) break;

      logger()->warn("request {}: dispatch to {} failed ({})", d.request_id, c.model_id(),
                     last_error);
      last_failure = ExecutionOutcome{.request_id = d.request_id,
                                      .provider = c.provider,
                                      .model = c.model,
                                      .cost = 0.0,
                                      .latency_ms = latency_ms,
                                      .success = false,
                                      .error_kind = err.kind,
                                      .quality_score = std::nullopt,
                                      .timestamp = clock_->now()};
    }

    d.state = DecisionState::Failed;
    if (stop.stop_requested()) {
      d.reasoning += "; cancelled";
      log_decision(d);
      auto err = make_error(ErrorCode::Cancelled,
                            std::format("request {} was cancelled", d.request_id));
      err.attempted_providers = d.attempted_providers;
      return Unexpected(std::move(err));
    }

    log_decision(d);
    if (last_failure) post_outcome(std::move(*last_failure));
    return Unexpected(dispatch_failed(d, last_error));
  }

  Result<RoutedStream, RoutingError> RoutingEngine::execute_stream(const RoutingRequest& request,
                                                                   std::stop_token stop) {
    SWITCHBOARD_ZONE;
    auto planned = plan(request);
    if (!planned) return Unexpected(planned.error());
    auto& p = planned.value();
    auto& d = p.decision;

    std::string last_error = "no candidate could be reserved";
    std::optional<ExecutionOutcome> last_failure;
    const size_t attempts = std::min<size_t>(2, d.ranked.size());

    for (size_t i = 0; i < attempts; ++i) {
      if (stop.stop_requested()) break;
      auto attempt = prepare(request, p, i, stop);
      if (!attempt) continue;
      attempt->dispatch.stream = true;

      const auto& c = *attempt->candidate;
      const auto started = std::chrono::steady_clock::now();
      auto source = client_.open_stream(attempt->dispatch);

      if (source) {
        d.state = i == 0 ? DecisionState::Dispatched : DecisionState::FallbackDispatched;
        d.provider = c.provider;
        d.model = c.model;
        if (i > 0) d.reasoning += std::format("; fell back to {} after {}", c.model_id(), last_error);
        log_decision(d);

        auto stream = std::make_unique<StreamNormalizer>(
            std::move(source.value()),
            StreamIdentity{.id = d.request_id,
                           .provider = c.provider,
                           .model = c.model,
                           .created = to_unix_seconds(clock_->now())},
            stop);

        auto held = std::make_shared<QuotaReservation>(std::move(attempt->reservation));
        stream->on_complete([this, held, candidate = c, spec = attempt->spec,
                             started](const StreamSummary& s) {
          const bool ok = !s.cancelled && s.finish_reason != FinishReason::Error;
          if (!ok) {
            held->release();
            if (s.cancelled) return;
          } else {
            held->commit();
          }

          Usage usage = s.usage;
          if (usage.completion_tokens == 0 && s.content_chars > 0) {
            usage.completion_tokens
                = estimate_tokens(s.content_chars, options_.predictor.features.chars_per_token);
          }
          const double bonus
              = s.finish_reason == FinishReason::Stop ? options_.clean_stop_bonus : 0.0;
          post_outcome(ExecutionOutcome{
              .request_id = s.id,
              .provider = candidate.provider,
              .model = candidate.model,
              .cost = actual_cost(*spec, candidate, usage),
              .latency_ms = elapsed_ms(started),
              .success = ok,
              .error_kind = ok ? std::nullopt : std::optional<std::string>("stream_error"),
              .quality_score = ok ? std::optional<double>(std::min(1.0, options_.heuristic_quality + bonus))
                                  : std::nullopt,
              .timestamp = clock_->now()});
        });

        return RoutedStream{.decision = d, .stream = std::move(stream)};
      }

      attempt->reservation.release();
      const auto& err = source.error();
      last_error = std::format("{} {}: {}", c.model_id(), err.kind, err.message);
      if (err.kind == "auth") pools_.mark_pool_error(attempt->dispatch.pool_id);
      if (err.kind == "cancelled" || stop.stop_requested()) break;

      logger()->warn("request {}: opening stream on {} failed ({})", d.request_id, c.model_id(),
                     last_error);
      last_failure = ExecutionOutcome{.request_id = d.request_id,
                                      .provider = c.provider,
                                      .model = c.model,
                                      .cost = 0.0,
                                      .latency_ms = elapsed_ms(started),
                                      .success = false,
                                      .error_kind = err.kind,
                                      .quality_score = std::nullopt,
                                      .timestamp = clock_->now()};
    }

    d.state = DecisionState::Failed;
    if (stop.stop_requested()) {
      d.reasoning += "; cancelled";
      log_decision(d);
      auto err = make_error(ErrorCode::Cancelled,
                            std::format("request {} was cancelled", d.request_id));
      err.attempted_providers = d.attempted_providers;
      return Unexpected(std::move(err));
    }

    log_decision(d);
    if (last_failure) post_outcome(std::move(*last_failure));
    return Unexpected(dispatch_failed(d, last_error));
  }

  // ============================================================================
  // Helpers
  // ============================================================================

  double RoutingEngine::actual_cost(const ModelSpec& spec, const CandidatePrediction& predicted,
                                    const Usage& usage) const noexcept {
    const int prompt = usage.prompt_tokens > 0 ? usage.prompt_tokens : predicted.prompt_tokens;
    const int completion
        = usage.completion_tokens > 0 ? usage.completion_tokens : predicted.completion_tokens;
    return (prompt * spec.cost_per_1m_input_tokens + completion * spec.cost_per_1m_output_tokens)
           / 1e6;
  }

  void RoutingEngine::post_outcome(ExecutionOutcome outcome) {
    if (!options_.post_outcomes) return;
    try {
      auto receipt = monitor_.record_outcome(std::move(outcome));
      if (!receipt) logger()->debug("outcome not recorded: {}", receipt.error().describe());
    } catch (const std::exception& e) {
      logger()->error("posting outcome failed: {}", e.what());
    }
  }

  void RoutingEngine::log_decision(const RoutingDecision& decision) {
    logger()->debug("request {} {}: {}", decision.request_id, to_string(decision.state),
                    decision.reasoning);
    std::lock_guard lock(log_mutex_);
    decisions_.push_back(decision);
    while (decisions_.size() > options_.decision_log_capacity) decisions_.pop_front();
  }

  std::vector<RoutingDecision> RoutingEngine::recent_decisions(size_t limit) const {
    std::lock_guard lock(log_mutex_);
    const auto n = std::min(limit, decisions_.size());
    return {decisions_.end() - static_cast<std::ptrdiff_t>(n), decisions_.end()};
  }

  RoutingError RoutingEngine::dispatch_failed(const RoutingDecision& decision,
                                              const std::string& last_error) const {
    auto err = make_error(ErrorCode::ProviderDispatchFailed,
                          std::format("{} dispatch attempt(s) failed; last error: {}",
                                      decision.attempted_providers.size(), last_error));
    err.attempted_providers = decision.attempted_providers;
    return err;
  }

}  // namespace switchboard
