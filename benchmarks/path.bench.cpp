#include "libflow/expand.hpp"
#include "benchmark/benchmark.h"
#include "libflow/formats/json.hpp"
#include "libflow/path.hpp"

static libflow::Document make_items(int count) {
  libflow::Sequence items{};
  for (int i{0}; i < count; ++i) {
    items.push_back(libflow::Mapping{
        {"id", i}, {"tags", libflow::Sequence{"a", "b", "c"}}});
  }
  return libflow::Mapping{{"items", std::move(items)}};
}

static void BM_ParseDotted(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(libflow::parse("user.profile.address.city"));
  }
}

static void BM_ParseIndexed(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(libflow::parse("items[12].tags[3].name"));
  }
}

static void BM_ExpandWildcard(benchmark::State& state) {
  auto document{make_items(static_cast<int>(state.range(0)))};
  auto steps{libflow::parse("items[*].tags[*]")};
  for (auto _ : state) {
    benchmark::DoNotOptimize(libflow::expand(document, steps));
  }
}

BENCHMARK(BM_ParseDotted);
BENCHMARK(BM_ParseIndexed);
BENCHMARK(BM_ExpandWildcard)->Arg(10)->Arg(1000);

BENCHMARK_MAIN();
