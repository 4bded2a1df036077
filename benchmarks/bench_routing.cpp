#include <benchmark/benchmark.h>

#include <memory>
#include <switchboard/broker/switchboard.hpp>
#include <switchboard/routing/engine.hpp>
#include <switchboard/routing/scoring.hpp>
#include <vector>

#include "bench_utils.hpp"
#include "fixtures/fixtures_loader.hpp"

using namespace switchboard;
using switchboard::testing::FixturesLoader;

namespace {

  struct EngineHarness {
    explicit EngineHarness(size_t n_models)
        : catalog(bench_utils::GenerateModels(n_models)),
          pools(bench_utils::GeneratePools(1'000'000'000)),
          monitor(MonitorOptions{.start_worker = false}) {
      pools.update_user_tier("bench", Tier::Connected);
      engine = std::make_unique<RoutingEngine>(catalog, pools, monitor, client);
    }

    ModelCatalog catalog;
    PoolManager pools;
    AccuracyMonitor monitor;
    bench_utils::StaticProviderClient client;
    std::unique_ptr<RoutingEngine> engine;
  };

  RoutingRequest BenchRequest(Strategy strategy) {
    auto requests = FixturesLoader::generate_requests(1, 11);
    auto request = std::move(requests.front());
    request.user_id = "bench";
    request.optimize_for = strategy;
    return request;
  }

}  // namespace

static void BM_RouteDecision(benchmark::State& state) {
  EngineHarness harness(static_cast<size_t>(state.range(0)));
  auto request = BenchRequest(Strategy::Balanced);

  for (auto _ : state) {
    auto decision = harness.engine->route(request);
    benchmark::DoNotOptimize(decision);
  }
  state.SetLabel(std::to_string(state.range(0)) + " models");
}
BENCHMARK(BM_RouteDecision)->Arg(4)->Arg(16)->Arg(64)->Arg(256)->Unit(benchmark::kMicrosecond);

static void BM_RouteStrategy(benchmark::State& state) {
  EngineHarness harness(32);
  const auto strategy = static_cast<Strategy>(state.range(0));
  auto request = BenchRequest(strategy);

  for (auto _ : state) {
    auto decision = harness.engine->route(request);
    benchmark::DoNotOptimize(decision);
  }
  state.SetLabel(std::string(to_string(strategy)));
}
BENCHMARK(BM_RouteStrategy)
    ->Arg(static_cast<int>(Strategy::Cost))
    ->Arg(static_cast<int>(Strategy::Speed))
    ->Arg(static_cast<int>(Strategy::Quality))
    ->Arg(static_cast<int>(Strategy::Balanced))
    ->Unit(benchmark::kMicrosecond);

static void BM_ScoreBalanced(benchmark::State& state) {
  const auto n = static_cast<size_t>(state.range(0));
  auto models = bench_utils::GenerateModels(n);
  std::vector<CandidatePrediction> candidates;
  candidates.reserve(n);
  for (const auto& m : models) {
    CandidatePrediction c;
    c.provider = m.provider;
    c.model = m.model;
    c.predicted_cost = m.cost_per_1m_input_tokens * 1e-4;
    c.predicted_latency_ms = m.base_latency_ms;
    c.predicted_quality = m.baseline_quality;
    candidates.push_back(std::move(c));
  }
  StrategyScorer scorer;

  for (auto _ : state) {
    auto ranked = candidates;
    scorer.rank(ranked, Strategy::Balanced);
    benchmark::DoNotOptimize(ranked);
  }
}
BENCHMARK(BM_ScoreBalanced)->Arg(4)->Arg(64)->Arg(1024)->Unit(benchmark::kMicrosecond);

static void BM_ExecuteBuffered(benchmark::State& state) {
  EngineHarness harness(16);
  auto request = BenchRequest(Strategy::Cost);

  for (auto _ : state) {
    auto response = harness.engine->execute(request);
    benchmark::DoNotOptimize(response);
  }
  harness.monitor.flush();
}
BENCHMARK(BM_ExecuteBuffered)->Unit(benchmark::kMicrosecond);

static void BM_BrokerFromProfile(benchmark::State& state) {
  bench_utils::StaticProviderClient client;
  auto result = Switchboard::from_profile(
      EngineProfile::from_json(bench_utils::GetFixturePath("profile.json")), client,
      make_system_clock(), BrokerOptions{.start_background = false});

  if (!result.has_value()) {
    state.SkipWithError(("Failed to create switchboard: " + result.error()).c_str());
    return;
  }

  auto broker = std::move(result).value();
  auto requests = FixturesLoader::generate_requests(256);
  size_t i = 0;

  for (auto _ : state) {
    auto decision = broker->route(requests[i++ % requests.size()]);
    benchmark::DoNotOptimize(decision);
  }
}
BENCHMARK(BM_BrokerFromProfile)->Unit(benchmark::kMicrosecond);
