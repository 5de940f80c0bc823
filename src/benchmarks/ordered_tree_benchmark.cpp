// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_set.h>
#include <benchmark/benchmark.h>

#include <algorithm>
#include <ordered_tree/ordered_tree.hpp>
#include <random>
#include <set>
#include <unordered_set>
#include <vector>

using namespace kressler::ordered_tree;

// Generate unique random keys for benchmarking
std::vector<int> GenerateUniqueKeys(std::size_t count) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 1 << 30);
  std::unordered_set<int> unique_keys;

  // Keep generating until we have enough unique keys
  while (unique_keys.size() < count) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

// Insert random keys into an empty container
template <typename Container>
static void BM_Insert(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    Container container;
    for (int key : keys) {
      container.insert(key);
    }
    benchmark::DoNotOptimize(container);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Look up every key of a container built from random insertions
template <typename Container>
static void BM_Find(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  Container container(keys.begin(), keys.end());

  std::size_t idx = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(container.contains(keys[idx % keys.size()]));
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Look up keys in a tree built from sorted input, optionally rebalanced
template <bool Balanced>
static void BM_FindSortedInsert(benchmark::State& state) {
  std::vector<int> keys(static_cast<std::size_t>(state.range(0)));
  for (std::size_t i = 0; i < keys.size(); ++i) {
    keys[i] = static_cast<int>(i);
  }
  ordered_tree<int> tree(keys.begin(), keys.end());
  if constexpr (Balanced) {
    tree.balance();
  }
  state.counters["height"] = static_cast<double>(tree.height());

  std::mt19937 rng(42);
  std::shuffle(keys.begin(), keys.end(), rng);
  std::size_t idx = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(tree.contains(keys[idx % keys.size()]));
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Rebuild a degenerate tree to minimum height
static void BM_Balance(benchmark::State& state) {
  for (auto _ : state) {
    state.PauseTiming();
    ordered_tree<int> tree;
    for (int i = 0; i < state.range(0); ++i) {
      tree.insert(i);
    }
    state.ResumeTiming();
    tree.balance();
    benchmark::DoNotOptimize(tree);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Iterate all elements in ascending order
template <typename Container>
static void BM_Iterate(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  Container container(keys.begin(), keys.end());
  for (auto _ : state) {
    long sum = 0;
    for (int key : container) {
      sum += key;
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Breadth-first snapshot, which has no std::set counterpart
static void BM_BreadthFirstSnapshot(benchmark::State& state) {
  auto keys = GenerateUniqueKeys(static_cast<std::size_t>(state.range(0)));
  ordered_tree<int> tree(keys.begin(), keys.end());
  for (auto _ : state) {
    benchmark::DoNotOptimize(tree.to_vector(Traversal::BreadthFirst));
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Insert<ordered_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Insert<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_Find<ordered_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Find<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Find<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

// Degenerate trees make lookups linear, so keep these sizes small
BENCHMARK(BM_FindSortedInsert<false>)->Range(1 << 8, 1 << 12);
BENCHMARK(BM_FindSortedInsert<true>)->Range(1 << 8, 1 << 12);
BENCHMARK(BM_Balance)->Range(1 << 8, 1 << 12);

BENCHMARK(BM_Iterate<ordered_tree<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Iterate<std::set<int>>)->Range(1 << 10, 1 << 18);
BENCHMARK(BM_Iterate<absl::btree_set<int>>)->Range(1 << 10, 1 << 18);

BENCHMARK(BM_BreadthFirstSnapshot)->Range(1 << 10, 1 << 18);

BENCHMARK_MAIN();
