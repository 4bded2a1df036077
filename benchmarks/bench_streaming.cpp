#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <switchboard/streaming/chunk.hpp>
#include <switchboard/streaming/framing.hpp>
#include <switchboard/streaming/normalizer.hpp>
#include <vector>

#include "fixtures/fakes.hpp"
#include "fixtures/fixtures_loader.hpp"

using namespace switchboard;
using switchboard::testing::ChunkedByteSource;
using switchboard::testing::FixturesLoader;

static void BM_SseFraming(benchmark::State& state) {
  auto reads = FixturesLoader::openai_stream(static_cast<size_t>(state.range(0)), 64);
  size_t bytes = 0;
  for (const auto& r : reads) bytes += r.size();

  for (auto _ : state) {
    SseFramer framer;
    size_t frames = 0;
    for (const auto& r : reads) frames += framer.feed(r).size();
    frames += framer.finish().size();
    benchmark::DoNotOptimize(frames);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_SseFraming)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMicrosecond);

static void BM_NormalizeStream(benchmark::State& state) {
  const auto provider = static_cast<Provider>(state.range(0));
  const size_t deltas = 512;
  auto reads = provider == Provider::Anthropic ? FixturesLoader::anthropic_stream(deltas, 32)
                                               : FixturesLoader::openai_stream(deltas, 32);

  for (auto _ : state) {
    StreamNormalizer normalizer(std::make_unique<ChunkedByteSource>(reads),
                                StreamIdentity{.id = "bench", .provider = provider,
                                               .model = "bench-model", .created = 0});
    size_t chunks = 0;
    while (auto chunk = normalizer.next()) {
      benchmark::DoNotOptimize(chunk);
      ++chunks;
    }
    benchmark::DoNotOptimize(chunks);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(deltas));
  state.SetLabel(std::string(to_string(provider)));
}
BENCHMARK(BM_NormalizeStream)
    ->Arg(static_cast<int>(Provider::OpenAI))
    ->Arg(static_cast<int>(Provider::Anthropic))
    ->Unit(benchmark::kMicrosecond);

static void BM_EncodeSse(benchmark::State& state) {
  CanonicalChunk chunk{.id = "chatcmpl-bench",
                       .model = "gpt-4o-mini",
                       .created = 1741564800,
                       .delta = ChunkDelta{.role = std::nullopt, .content = "Hello there, "},
                       .finish_reason = std::nullopt,
                       .usage = std::nullopt};

  for (auto _ : state) {
    auto encoded = encode_sse(chunk);
    benchmark::DoNotOptimize(encoded);
  }
}
BENCHMARK(BM_EncodeSse)->Unit(benchmark::kNanosecond);
