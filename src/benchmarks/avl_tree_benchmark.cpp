// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_set.h>
#include <benchmark/benchmark.h>

#include <algorithm>
#include <balanced_trees/avl_tree.hpp>
#include <iterator>
#include <random>
#include <set>
#include <unordered_set>
#include <vector>

using namespace kressler::balanced_trees;

namespace {

// Generate unique random keys for benchmarking
std::vector<int> GenerateUniqueKeys(std::size_t count) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 1 << 30);
  std::unordered_set<int> unique_keys;

  while (unique_keys.size() < count) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

// std::set and absl::btree_set spell removal as erase()
template <typename Set>
void RemoveKey(Set& set, int key) {
  set.erase(key);
}

void RemoveKey(avl_tree<int>& tree, int key) {
  int removed = tree.remove(key);
  benchmark::DoNotOptimize(removed);
}

}  // namespace

// Builds a container of state.range(0) keys from scratch
template <typename Set>
static void BM_Insert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  for (auto _ : state) {
    Set set;
    for (int key : keys) {
      set.insert(key);
    }
    benchmark::DoNotOptimize(set);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Insert<avl_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

// Looks up every key of a populated container
template <typename Set>
static void BM_Contains(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  Set set;
  for (int key : keys) {
    set.insert(key);
  }
  std::shuffle(keys.begin(), keys.end(), std::mt19937(7));

  for (auto _ : state) {
    for (int key : keys) {
      bool present = set.contains(key);
      benchmark::DoNotOptimize(present);
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Contains<avl_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Contains<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Contains<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

// Removes and re-inserts batches of keys in a populated container. Measures
// combined remove+insert cost without PauseTiming/ResumeTiming overhead.
template <typename Set>
static void BM_RemoveInsert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(state.range(0));
  Set set;
  for (int key : keys) {
    set.insert(key);
  }

  std::size_t next = 0;
  for (auto _ : state) {
    int key = keys[next];
    RemoveKey(set, key);
    set.insert(key);
    next = (next + 1) % keys.size();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RemoveInsert<avl_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_RemoveInsert<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_RemoveInsert<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

// Neighborhood queries on a 64K-key tree, radius given by state.range(0)
static void BM_Neighborhood(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(1 << 16);
  avl_tree<int> tree(keys.begin(), keys.end());
  int radius = static_cast<int>(state.range(0));

  std::size_t next = 0;
  std::size_t found = 0;
  std::vector<int> out;
  for (auto _ : state) {
    out.clear();
    tree.neighborhood(keys[next], radius, std::back_inserter(out));
    found += out.size();
    next = (next + 1) % keys.size();
  }
  state.SetItemsProcessed(found);
}
BENCHMARK(BM_Neighborhood)->DenseRange(0, 8, 2);

BENCHMARK_MAIN();
