#include <benchmark/benchmark.h>

#include <format>
#include <memory>
#include <switchboard/quota/pool_manager.hpp>

#include "bench_utils.hpp"

using namespace switchboard;

static void BM_GetAvailableKey(benchmark::State& state) {
  PoolManager pools(bench_utils::GeneratePools(1'000'000'000));
  pools.update_user_tier("bench", Tier::Connected);

  for (auto _ : state) {
    auto grant = pools.get_available_key("bench", Provider::Anthropic);
    benchmark::DoNotOptimize(grant);
  }
}
BENCHMARK(BM_GetAvailableKey)->Unit(benchmark::kNanosecond);

static void BM_ReserveCommit(benchmark::State& state) {
  PoolManager pools(bench_utils::GeneratePools(1'000'000'000));
  pools.update_user_tier("bench", Tier::Connected);

  for (auto _ : state) {
    auto reservation = pools.reserve("bench", Provider::OpenAI);
    if (reservation) reservation.value().commit();
    benchmark::DoNotOptimize(reservation);
  }
}
BENCHMARK(BM_ReserveCommit)->Unit(benchmark::kNanosecond);

static void BM_ReserveRelease(benchmark::State& state) {
  PoolManager pools(bench_utils::GeneratePools(1000));

  for (auto _ : state) {
    // release() returns the units, the pool never drains
    auto reservation = pools.reserve("bench", Provider::Google);
    if (reservation) reservation.value().release();
    benchmark::DoNotOptimize(reservation);
  }
}
BENCHMARK(BM_ReserveRelease)->Unit(benchmark::kNanosecond);

static void BM_CheckAvailability(benchmark::State& state) {
  PoolManager pools(bench_utils::GeneratePools(1000));
  const auto users = static_cast<int>(state.range(0));
  for (int i = 0; i < users; ++i) {
    pools.update_user_tier(std::format("user-{}", i), Tier::Connected);
  }

  int i = 0;
  for (auto _ : state) {
    bool ok = pools.check_availability(std::format("user-{}", i++ % users), Provider::Ollama);
    benchmark::DoNotOptimize(ok);
  }
  state.SetLabel(std::to_string(users) + " users");
}
BENCHMARK(BM_CheckAvailability)->Arg(10)->Arg(1000)->Arg(100000)->Unit(benchmark::kNanosecond);

static void BM_ConcurrentReserve(benchmark::State& state) {
  static std::unique_ptr<PoolManager> pools;
  if (state.thread_index() == 0) {
    pools = std::make_unique<PoolManager>(bench_utils::GeneratePools(1'000'000'000));
    pools->update_user_tier("shared", Tier::Connected);
  }

  for (auto _ : state) {
    auto reservation = pools->reserve("shared", Provider::OpenAI);
    if (reservation) reservation.value().commit();
    benchmark::DoNotOptimize(reservation);
  }

  if (state.thread_index() == 0) {
    state.counters["used"] = static_cast<double>(pools->pool_status().total_requests_today);
  }
}
BENCHMARK(BM_ConcurrentReserve)->Threads(1)->Threads(2)->Threads(4)->Threads(8)->UseRealTime();
