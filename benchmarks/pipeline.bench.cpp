#include "libflow/pipeline.hpp"
#include "benchmark/benchmark.h"
#include "libflow/formats/json.hpp"
#include "libflow/operations.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static const char* RECORD{R"({
  "user": {"name": "alice", "email": "alice@example.com", "id": 42},
  "status": "active",
  "items": [{"sku": "a1", "qty": 2}, {"sku": "b7", "qty": 1}],
  "password": "hunter2"
})"};

static libflow::Pipeline make_pipeline() {
  libflow::Pipeline pipeline{};
  pipeline.append(std::make_unique<libflow::Where>(
      libflow::Where::from_pairs({"status=active"})));
  pipeline.append(std::make_unique<libflow::Set>(
      libflow::Set::from_pairs({"user.verified=true", "items[*].seen=1"})));
  pipeline.append(
      std::make_unique<libflow::Delete>(std::vector<std::string>{"password"}));
  return pipeline;
}

static void BM_ApplyPipeline(benchmark::State& state) {
  auto pipeline{make_pipeline()};
  auto document{*libflow::parse_json_literal(RECORD)};
  for (auto _ : state) {
    benchmark::DoNotOptimize(pipeline.apply(document));
  }
}

static void BM_PickMany(benchmark::State& state) {
  libflow::Pick pick{
      std::vector<std::string>{"user.name", "user.id", "items[*].sku"}};
  auto document{*libflow::parse_json_literal(RECORD)};
  for (auto _ : state) {
    benchmark::DoNotOptimize(pick.apply(document));
  }
}

static void BM_ParseJsonStream(benchmark::State& state) {
  std::string input{"["};
  for (int i{0}; i < 1000; ++i) {
    input += (i ? "," : "") + std::string{RECORD};
  }
  input += "]";

  libflow::JsonFormat format{};
  for (auto _ : state) {
    std::istringstream in{input};
    std::size_t count{0};
    format.new_parser(in)->for_each([&count](libflow::Document) { ++count; });
    benchmark::DoNotOptimize(count);
  }
}

BENCHMARK(BM_ApplyPipeline);
BENCHMARK(BM_PickMany);
BENCHMARK(BM_ParseJsonStream);

BENCHMARK_MAIN();
