#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <switchboard/routing/engine.hpp>
#include <vector>

#include "fixtures/fakes.hpp"

#pragma GCC diagnostic ignored "-Wunused-result"

using namespace switchboard;
using namespace std::chrono;
using switchboard::testing::ScriptedProviderClient;

// ============================================================================
// Test Fixture
// ============================================================================

class RoutingEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>(SystemTime(sys_days{year{2025} / March / 10}));
    catalog_ = std::make_unique<ModelCatalog>(std::vector<ModelSpec>{
        Spec(Provider::OpenAI, "cheap", 1.0, 2.0, 1000.0, 10.0, 0.7, true),
        Spec(Provider::Anthropic, "smart", 10.0, 20.0, 2000.0, 10.0, 0.95, true),
        Spec(Provider::Google, "fast", 5.0, 5.0, 200.0, 1.0, 0.8, false)});
    Build(Pools(100));
    pools_->update_user_tier("u1", Tier::Connected);
  }

  static ModelSpec Spec(Provider provider, std::string model, double in, double out,
                        double base, double per_token, double quality, bool tools) {
    return ModelSpec{.provider = provider,
                     .model = std::move(model),
                     .cost_per_1m_input_tokens = in,
                     .cost_per_1m_output_tokens = out,
                     .base_latency_ms = base,
                     .ms_per_output_token = per_token,
                     .baseline_quality = quality,
                     .capabilities = {CapabilityClass::Chat, CapabilityClass::Code,
                                      CapabilityClass::Analysis, CapabilityClass::Creative,
                                      CapabilityClass::Support, CapabilityClass::Complex},
                     .supports_tools = tools};
  }

  static std::vector<PoolConfig> Pools(int limit) {
    return {PoolConfig{.pool_id = "openai-main", .provider = Provider::OpenAI, .api_key = "key-openai", .daily_limit = limit},
            PoolConfig{.pool_id = "anthropic-main", .provider = Provider::Anthropic, .api_key = "key-anthropic", .daily_limit = limit},
            PoolConfig{.pool_id = "google-main", .provider = Provider::Google, .api_key = "key-google", .daily_limit = limit}};
  }

  void Build(std::vector<PoolConfig> pools, QuotaOptions quota = {}) {
    engine_.reset();
    MonitorOptions monitor;
    monitor.start_worker = false;
    monitor.sampling.seed = 7;
    monitor_ = std::make_unique<AccuracyMonitor>(monitor, clock_);
    pools_ = std::make_unique<PoolManager>(std::move(pools), quota, clock_);
    engine_ = std::make_unique<RoutingEngine>(*catalog_, *pools_, *monitor_, client_,
                                              EngineOptions{}, clock_);
  }

  // "hello there": 11 chars -> 3 prompt tokens, 100 completion tokens
  static RoutingRequest Request(Strategy strategy = Strategy::Cost) {
    RoutingRequest r;
    r.user_id = "u1";
    r.messages = {Message{.role = "user", .content = "hello there"}};
    r.max_tokens = 100;
    r.optimize_for = strategy;
    return r;
  }

  int Used(const std::string& pool_id) const {
    for (const auto& p : pools_->pool_status().pools) {
      if (p.pool_id == pool_id) return p.used_today;
    }
    return -1;
  }

  static ProviderError Failure(std::string kind = "transport") {
    return ProviderError{.kind = std::move(kind), .message = "connection reset", .status = std::nullopt};
  }

  std::shared_ptr<ManualClock> clock_;
  std::unique_ptr<ModelCatalog> catalog_;
  ScriptedProviderClient client_;
  std::unique_ptr<AccuracyMonitor> monitor_;
  std::unique_ptr<PoolManager> pools_;
  std::unique_ptr<RoutingEngine> engine_;
};

// ============================================================================
// Decision
// ============================================================================

TEST_F(RoutingEngineTest, RouteDecidesWithoutReserving) {
  auto decision = engine_->route(Request());
  ASSERT_TRUE(decision.has_value()) << decision.error().describe();

  const auto& d = decision.value();
  EXPECT_EQ(d.state, DecisionState::Decided);
  EXPECT_EQ(d.provider, Provider::OpenAI);
  EXPECT_EQ(d.model, "cheap");
  ASSERT_EQ(d.ranked.size(), 3u);
  EXPECT_EQ(d.ranked[1].model, "fast");
  EXPECT_EQ(d.ranked[2].model, "smart");
  EXPECT_NEAR(d.ranked[0].predicted_cost, 203e-6, 1e-12);
  EXPECT_NE(d.reasoning.find("cost strategy"), std::string::npos);
  EXPECT_EQ(d.request_id.size(), 20u);
  EXPECT_EQ(Used("openai-main"), 0);
  EXPECT_TRUE(client_.calls().empty());
}

TEST_F(RoutingEngineTest, StrategiesPickDifferentWinners) {
  EXPECT_EQ(engine_->route(Request(Strategy::Speed)).value().model, "fast");
  EXPECT_EQ(engine_->route(Request(Strategy::Quality)).value().model, "smart");
}

TEST_F(RoutingEngineTest, ModelHintNarrowsCandidates) {
  auto r = Request();
  r.model = "anthropic";
  auto d = engine_->route(r);
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d.value().ranked.size(), 1u);
  EXPECT_EQ(d.value().model, "smart");

  r.model = "openai/cheap";
  EXPECT_EQ(engine_->route(r).value().ranked.size(), 1u);
}

TEST_F(RoutingEngineTest, UnknownHintFallsBackToCapability) {
  auto r = Request();
  r.model = "gpt-9-turbo";
  auto d = engine_->route(r);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d.value().ranked.size(), 3u);
}

TEST_F(RoutingEngineTest, RoutedRequestAcceptsExternalOutcome) {
  auto d = engine_->route(Request());
  ASSERT_TRUE(d.has_value());

  ExecutionOutcome outcome;
  outcome.request_id = d.value().request_id;
  outcome.provider = Provider::OpenAI;
  outcome.model = "cheap";
  outcome.cost = 203e-6;
  outcome.latency_ms = 2000.0;
  outcome.success = true;
  outcome.timestamp = clock_->now();

  ASSERT_TRUE(monitor_->record_outcome(outcome).has_value());
  monitor_->flush();

  auto metrics = monitor_->metrics(Provider::OpenAI, "cheap");
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->sample_size, 1u);

  auto again = monitor_->record_outcome(outcome);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::DuplicateOutcome);
}

TEST_F(RoutingEngineTest, ExcludedAndPreferredProviders) {
  auto r = Request();
  r.constraints.exclude_providers = {Provider::OpenAI};
  auto excluded = engine_->route(r);
  ASSERT_TRUE(excluded.has_value());
  EXPECT_EQ(excluded.value().ranked.size(), 2u);
  EXPECT_EQ(excluded.value().model, "fast");

  r.constraints.exclude_providers.clear();
  r.constraints.preferred_providers = {Provider::Anthropic};
  auto preferred = engine_->route(r);
  ASSERT_TRUE(preferred.has_value());
  EXPECT_EQ(preferred.value().model, "smart");
  EXPECT_EQ(preferred.value().ranked.size(), 1u);
}

TEST_F(RoutingEngineTest, PreferredProviderWithoutModelsFailsInsteadOfFallingBack) {
  auto r = Request();
  r.constraints.preferred_providers = {Provider::Ollama};

  auto routed = engine_->route(r);
  ASSERT_FALSE(routed.has_value());
  EXPECT_EQ(routed.error().code, ErrorCode::NoEligibleProvider);
  EXPECT_NE(routed.error().message.find("ollama"), std::string::npos);

  auto executed = engine_->execute(r);
  ASSERT_FALSE(executed.has_value());
  EXPECT_EQ(executed.error().code, ErrorCode::NoEligibleProvider);
  EXPECT_TRUE(client_.calls().empty());
  EXPECT_EQ(Used("openai-main"), 0);
}

TEST_F(RoutingEngineTest, PreferredProviderWithoutQuotaFailsInsteadOfFallingBack) {
  Build({PoolConfig{.pool_id = "openai-main", .provider = Provider::OpenAI, .api_key = "key-openai", .daily_limit = 100},
         PoolConfig{.pool_id = "anthropic-main", .provider = Provider::Anthropic, .api_key = "key-anthropic", .daily_limit = 1}});
  pools_->update_user_tier("u1", Tier::Connected);
  ASSERT_TRUE(pools_->get_available_key("u1", Provider::Anthropic).has_value());

  auto r = Request();
  r.constraints.preferred_providers = {Provider::Anthropic};
  auto routed = engine_->route(r);
  ASSERT_FALSE(routed.has_value());
  EXPECT_EQ(routed.error().code, ErrorCode::NoEligibleProvider);
  EXPECT_TRUE(client_.calls().empty());
}

TEST_F(RoutingEngineTest, ToolRequestsSkipModelsWithoutToolSupport) {
  auto r = Request();
  r.tools = {ToolDefinition{.name = "lookup", .description = "", .parameters = "{}"}};
  auto d = engine_->route(r);
  ASSERT_TRUE(d.has_value());
  for (const auto& c : d.value().ranked) EXPECT_NE(c.provider, Provider::Google);
}

TEST_F(RoutingEngineTest, ConstraintsFilterBeforeScoring) {
  auto r = Request(Strategy::Quality);
  r.constraints.max_cost = 0.0003;
  auto d = engine_->route(r);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d.value().model, "cheap");
  EXPECT_EQ(d.value().ranked.size(), 1u);

  r.constraints.max_cost = 1e-9;
  auto none = engine_->route(r);
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error().code, ErrorCode::NoEligibleProvider);
  EXPECT_NE(none.error().message.find("maxCost"), std::string::npos);
}

TEST_F(RoutingEngineTest, InstantTierOverCapFailsWithUpgradePrompt) {
  Build(Pools(100), QuotaOptions{.instant_daily_limit = 1});
  auto r = Request();
  r.user_id = "newcomer";

  ASSERT_TRUE(engine_->execute(r).has_value());
  auto second = engine_->execute(r);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, ErrorCode::QuotaExhausted);
  ASSERT_TRUE(second.error().upgrade_prompt.has_value());
  EXPECT_EQ(second.error().upgrade_prompt->urgency, Urgency::Critical);
}

TEST_F(RoutingEngineTest, ExhaustedPoolsAreNoEligibleProvider) {
  Build({PoolConfig{.pool_id = "openai-main", .provider = Provider::OpenAI, .api_key = "k", .daily_limit = 1}});
  pools_->update_user_tier("u1", Tier::Connected);

  auto first = engine_->execute(Request());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first.value().decision.ranked.size(), 1u);

  auto second = engine_->execute(Request());
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, ErrorCode::NoEligibleProvider);
  EXPECT_TRUE(second.error().upgrade_prompt.has_value());
  EXPECT_EQ(client_.calls().size(), 1u);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(RoutingEngineTest, ExecuteCommitsQuotaAndPostsOutcome) {
  auto response = engine_->execute(Request());
  ASSERT_TRUE(response.has_value()) << response.error().describe();

  const auto& r = response.value();
  EXPECT_EQ(r.provider, Provider::OpenAI);
  EXPECT_EQ(r.content, "ok");
  EXPECT_EQ(r.decision.state, DecisionState::Dispatched);
  EXPECT_EQ(r.decision.pool_id, "openai-main");
  EXPECT_NEAR(r.usage.cost, (10 * 1.0 + 5 * 2.0) / 1e6, 1e-12);
  EXPECT_EQ(Used("openai-main"), 1);

  auto calls = client_.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].api_key, "key-openai");
  EXPECT_FALSE(calls[0].stream);
  EXPECT_FALSE(calls[0].deadline.has_value());

  monitor_->flush();
  auto metrics = monitor_->metrics(Provider::OpenAI, "cheap");
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->sample_size, 1u);
  EXPECT_DOUBLE_EQ(metrics->match_rate, 1.0);
}

TEST_F(RoutingEngineTest, FallsBackOnceToNextRanked) {
  client_.fail(Provider::OpenAI, Failure());

  auto response = engine_->execute(Request());
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response.value().provider, Provider::Google);
  EXPECT_EQ(response.value().decision.state, DecisionState::FallbackDispatched);
  EXPECT_EQ(response.value().decision.attempted_providers,
            (std::vector<Provider>{Provider::OpenAI, Provider::Google}));
  EXPECT_EQ(Used("openai-main"), 0);
  EXPECT_EQ(Used("google-main"), 1);
}

TEST_F(RoutingEngineTest, FailsAfterExactlyOneFallback) {
  client_.fail(Provider::OpenAI, Failure());
  client_.fail(Provider::Google, Failure("timeout"));

  auto response = engine_->execute(Request());
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error().code, ErrorCode::ProviderDispatchFailed);
  EXPECT_EQ(response.error().attempted_providers.size(), 2u);
  EXPECT_EQ(client_.calls().size(), 2u);
  EXPECT_EQ(Used("openai-main"), 0);
  EXPECT_EQ(Used("google-main"), 0);
  EXPECT_EQ(Used("anthropic-main"), 0);

  auto log = engine_->recent_decisions();
  ASSERT_FALSE(log.empty());
  EXPECT_EQ(log.back().state, DecisionState::Failed);
  EXPECT_EQ(log.back().ranked.size(), 3u);
}

TEST_F(RoutingEngineTest, AuthFailureTakesPoolOutOfRotation) {
  client_.fail(Provider::OpenAI, Failure("auth"));
  ASSERT_TRUE(engine_->execute(Request()).has_value());

  for (const auto& p : pools_->pool_status().pools) {
    if (p.pool_id == "openai-main") EXPECT_EQ(p.status, PoolStatus::Error);
  }
  EXPECT_EQ(engine_->route(Request()).value().model, "fast");
}

TEST_F(RoutingEngineTest, MaxResponseTimeBecomesDeadline) {
  auto r = Request();
  r.constraints.max_response_time_ms = 2500.0;
  ASSERT_TRUE(engine_->execute(r).has_value());

  auto calls = client_.calls();
  ASSERT_EQ(calls.size(), 1u);
  ASSERT_TRUE(calls[0].deadline.has_value());
  EXPECT_EQ(*calls[0].deadline, clock_->now() + milliseconds(2500));
}

TEST_F(RoutingEngineTest, CancelledBeforeDispatch) {
  std::stop_source stop;
  stop.request_stop();
  auto response = engine_->execute(Request(), stop.get_token());
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error().code, ErrorCode::Cancelled);
  EXPECT_TRUE(client_.calls().empty());
  EXPECT_EQ(Used("openai-main"), 0);
}

TEST_F(RoutingEngineTest, ObservedCostRecalibratesPredictions) {
  client_.succeed(Provider::OpenAI,
                  ProviderResponse{.content = "long answer",
                                   .finish_reason = FinishReason::Stop,
                                   .usage = Usage{.prompt_tokens = 3, .completion_tokens = 200},
                                   .tool_calls = {}});
  const double before = engine_->route(Request()).value().ranked[0].predicted_cost;
  ASSERT_TRUE(engine_->execute(Request()).has_value());
  monitor_->flush();

  const double after = engine_->route(Request()).value().ranked[0].predicted_cost;
  EXPECT_GT(after, before);
  EXPECT_NEAR(after / before, 0.9 + 0.1 * (403.0 / 203.0), 1e-9);
}

// ============================================================================
// Streaming
// ============================================================================

TEST_F(RoutingEngineTest, StreamCommitsQuotaWhenFinished) {
  client_.stream(Provider::OpenAI,
                 {"data: {\"choices\":[{\"delta\":{\"content\":\"Hi\"}}]}\n\n",
                  "data: {\"choices\":[{\"delta\":{},\"finish_reason\":\"stop\"}]}\n\ndata: [DONE]\n\n"});

  auto routed = engine_->execute_stream(Request());
  ASSERT_TRUE(routed.has_value()) << routed.error().describe();
  auto& stream = *routed.value().stream;
  EXPECT_EQ(routed.value().decision.state, DecisionState::Dispatched);
  EXPECT_EQ(Used("openai-main"), 1);

  size_t terminals = 0;
  while (auto chunk = stream.next()) terminals += chunk->terminal() ? 1 : 0;
  EXPECT_EQ(terminals, 1u);
  EXPECT_EQ(Used("openai-main"), 1);
  EXPECT_TRUE(client_.calls()[0].stream);

  monitor_->flush();
  auto metrics = monitor_->metrics(Provider::OpenAI, "cheap");
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->sample_size, 1u);
}

TEST_F(RoutingEngineTest, StreamOpenFailureFallsBack) {
  client_.fail(Provider::OpenAI, Failure());
  client_.stream(Provider::Google, {"data: {\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"x\"}]},"
                                    "\"finishReason\":\"STOP\"}]}\n\n"});

  auto routed = engine_->execute_stream(Request());
  ASSERT_TRUE(routed.has_value());
  EXPECT_EQ(routed.value().decision.state, DecisionState::FallbackDispatched);
  EXPECT_EQ(routed.value().decision.provider, Provider::Google);
}

TEST_F(RoutingEngineTest, CancelledStreamReleasesQuota) {
  client_.stream(Provider::OpenAI, {"data: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\n\n",
                                    "data: {\"choices\":[{\"delta\":{\"content\":\"b\"}}]}\n\n"});

  auto routed = engine_->execute_stream(Request());
  ASSERT_TRUE(routed.has_value());
  auto& stream = *routed.value().stream;
  ASSERT_TRUE(stream.next().has_value());
  EXPECT_EQ(Used("openai-main"), 1);

  stream.cancel();
  auto terminal = stream.next();
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->finish_reason, FinishReason::Error);
  EXPECT_EQ(Used("openai-main"), 0);

  monitor_->flush();
  EXPECT_FALSE(monitor_->metrics(Provider::OpenAI, "cheap").has_value());
}

TEST_F(RoutingEngineTest, DecisionLogKeepsNewestLast) {
  auto first = engine_->route(Request());
  auto second = engine_->route(Request(Strategy::Quality));
  auto log = engine_->recent_decisions(10);
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].request_id, first.value().request_id);
  EXPECT_EQ(log[1].model, "smart");
  EXPECT_EQ(engine_->recent_decisions(1).size(), 1u);
}
