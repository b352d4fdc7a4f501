#include <absl/container/btree_map.h>
#include <ankerl/unordered_dense.h>
#include <benchmark/benchmark.h>

#include <map>
#include <random>
#include <sorted_containers/sorted_map.hpp>
#include <unordered_set>
#include <vector>

using namespace kressler::sorted_containers;

// Generate unique random keys for benchmarking
template <std::size_t Size>
std::vector<int> GenerateUniqueKeys() {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 1000000);
  std::unordered_set<int> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < Size) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

// Benchmark remove + insert cycle on a populated map
// Pre-populates Size-1 keys, then repeatedly removes and re-inserts the last
// key, measuring the cost of shifting the arrays in both directions.
template <std::size_t Size, SearchMode search_mode>
static void BM_SortedMap_RemoveInsert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();

  sorted_map<int, int, std::less<int>, search_mode> map;
  for (std::size_t i = 0; i < Size - 1; ++i) {
    map.insert(keys[i], i);
  }

  for (auto _ : state) {
    if (map.size() == Size) {
      map.remove(keys[Size - 1]);
    }
    map.insert(keys[Size - 1], Size - 1);
    benchmark::DoNotOptimize(map);
  }
  state.SetItemsProcessed(state.iterations());
}

template <std::size_t Size, SearchMode search_mode>
static void BM_SortedMap_Get(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();

  sorted_map<int, int, std::less<int>, search_mode> map;
  for (std::size_t i = 0; i < Size; ++i) {
    map.insert(keys[i], i);
  }

  std::size_t idx = 0;
  for (auto _ : state) {
    auto* value = map.get(keys[idx % Size]);
    benchmark::DoNotOptimize(value);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Same find loop for the reference containers
template <typename Map, std::size_t Size>
static void BM_Reference_Find(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();

  Map map;
  for (std::size_t i = 0; i < Size; ++i) {
    map.emplace(keys[i], i);
  }

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = map.find(keys[idx % Size]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

template <typename Map, std::size_t Size>
static void BM_Reference_RemoveInsert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();

  Map map;
  for (std::size_t i = 0; i < Size - 1; ++i) {
    map.emplace(keys[i], i);
  }

  for (auto _ : state) {
    if (map.size() == Size) {
      map.erase(keys[Size - 1]);
    }
    map.emplace(keys[Size - 1], Size - 1);
    benchmark::DoNotOptimize(map);
  }
  state.SetItemsProcessed(state.iterations());
}

// Merge two maps of Size keys with half of the keys shared
template <std::size_t Size>
static void BM_SortedMap_Merge(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size + Size / 2>();

  sorted_map<int, int> left;
  sorted_map<int, int> right;
  for (std::size_t i = 0; i < Size; ++i) {
    left.insert(keys[i], i);
    right.insert(keys[i + Size / 2], i);
  }

  for (auto _ : state) {
    auto merged = left.merged_with(
        right, [](const int&, int& mine, const int& theirs) { mine += theirs; });
    benchmark::DoNotOptimize(merged);
  }
  state.SetItemsProcessed(state.iterations() * Size * 2);
}

using StdMap = std::map<int, int>;
using AbslMap = absl::btree_map<int, int>;
using DenseMap = ankerl::unordered_dense::map<int, int>;

// Register remove+insert benchmarks
BENCHMARK(BM_SortedMap_RemoveInsert<8, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_RemoveInsert<8, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_RemoveInsert<8, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_RemoveInsert<32, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_RemoveInsert<32, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_RemoveInsert<32, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_RemoveInsert<128, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_RemoveInsert<128, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_RemoveInsert<128, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_RemoveInsert<512, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_RemoveInsert<512, SearchMode::Hybrid>);
BENCHMARK(BM_Reference_RemoveInsert<StdMap, 32>);
BENCHMARK(BM_Reference_RemoveInsert<StdMap, 128>);
BENCHMARK(BM_Reference_RemoveInsert<AbslMap, 32>);
BENCHMARK(BM_Reference_RemoveInsert<AbslMap, 128>);
BENCHMARK(BM_Reference_RemoveInsert<DenseMap, 32>);
BENCHMARK(BM_Reference_RemoveInsert<DenseMap, 128>);

// Register lookup benchmarks for various sizes
BENCHMARK(BM_SortedMap_Get<8, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_Get<8, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_Get<8, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_Get<16, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_Get<16, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_Get<16, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_Get<64, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_Get<64, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_Get<64, SearchMode::Hybrid>);
BENCHMARK(BM_SortedMap_Get<256, SearchMode::Binary>);
BENCHMARK(BM_SortedMap_Get<256, SearchMode::Linear>);
BENCHMARK(BM_SortedMap_Get<256, SearchMode::Hybrid>);
BENCHMARK(BM_Reference_Find<StdMap, 16>);
BENCHMARK(BM_Reference_Find<StdMap, 64>);
BENCHMARK(BM_Reference_Find<StdMap, 256>);
BENCHMARK(BM_Reference_Find<AbslMap, 16>);
BENCHMARK(BM_Reference_Find<AbslMap, 64>);
BENCHMARK(BM_Reference_Find<AbslMap, 256>);
BENCHMARK(BM_Reference_Find<DenseMap, 16>);
BENCHMARK(BM_Reference_Find<DenseMap, 64>);
BENCHMARK(BM_Reference_Find<DenseMap, 256>);

BENCHMARK(BM_SortedMap_Merge<32>);
BENCHMARK(BM_SortedMap_Merge<256>);

BENCHMARK_MAIN();
