// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <bit>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <ordered_tree/ordered_tree.hpp>
#include <random>
#include <set>
#include <unordered_set>

using namespace kressler::ordered_tree;

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  size_t target_iterations = 100;
  size_t min_keys = 1000;
  size_t max_keys = 20000;
  size_t batches = 50;
  size_t batch_size = 500;
  size_t balance_every = 10;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_keys,
                "min_keys")["--min-keys"]("Minimum keys to target in tree") |
      lyra::opt(max_keys,
                "max_keys")["--max-keys"]("Maximum keys to target in tree") |
      lyra::opt(batches, "batches")["-b"]["--batches"](
          "Number of erase/insert batches to run") |
      lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of an erase/insert batch") |
      lyra::opt(balance_every, "balance_every")["--balance-every"](
          "Rebalance after this many batches (0 disables)");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys > max_keys) {
    std::cerr << "--min-keys must not exceed --max-keys" << std::endl;
    return 1;
  }

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    std::set<int> ordered_set;
    ordered_tree<int> tree;
    std::unordered_set<int> seen;

    auto fail = [&](const char* what) -> int {
      std::cerr << "Iteration " << iter << " (seed " << iter + seed
                << "): " << what << std::endl;
      return 1;
    };

    auto insert = [&]() -> bool {
      int key = dist(rng);
      bool expected = ordered_set.insert(key).second;
      seen.insert(key);
      return tree.insert(key) == expected;
    };

    auto remove = [&]() -> bool {
      auto key = *seen.begin();
      seen.erase(key);
      ordered_set.erase(key);
      return tree.erase(key) && !tree.contains(key);
    };

    auto validate = [&]() -> bool {
      if (tree.size() != ordered_set.size()) {
        std::cout << "Size mismatch: " << tree.size()
                  << " != " << ordered_set.size() << std::endl;
        return false;
      }

      auto it = ordered_set.begin();
      auto tree_it = tree.begin();
      while (it != ordered_set.end() && tree_it != tree.end()) {
        if (*it != *tree_it) {
          std::cout << "Mismatch at key " << *it << " != " << *tree_it
                    << std::endl;
          return false;
        }
        ++it;
        ++tree_it;
      }

      if (it != ordered_set.end()) {
        std::cout << "Tree ended early!" << std::endl;
        return false;
      }

      if (tree_it != tree.end()) {
        std::cout << "Ordered set ended early!" << std::endl;
        return false;
      }
      return true;
    };

    auto balance = [&]() -> bool {
      tree.balance();
      size_t expected = std::bit_width(tree.size());
      if (tree.height() != expected) {
        std::cout << "Height " << tree.height() << " after balance, expected "
                  << expected << std::endl;
        return false;
      }
      return true;
    };

    // Build up the initial tree/set
    while (ordered_set.size() < num_keys) {
      if (!insert()) return fail("insert disagreed with std::set");
    }
    if (!validate()) return fail("validation failed after build");
    if (!balance()) return fail("balance failed after build");

    // Run erase/insert batches
    for (size_t batch = 0; batch < batches; ++batch) {
      for (size_t i = 0; i < batch_size && !seen.empty(); ++i) {
        if (!remove()) return fail("erase disagreed with std::set");
      }
      for (size_t i = 0; i < batch_size; ++i) {
        if (!insert()) return fail("insert disagreed with std::set");
      }
      if (!validate()) return fail("validation failed after batch");
      if (balance_every != 0 && (batch + 1) % balance_every == 0) {
        if (!balance()) return fail("balance failed after batch");
        if (!validate()) return fail("validation failed after balance");
      }
    }

    // Empty out the tree/set
    while (!seen.empty()) {
      if (!remove()) return fail("erase disagreed with std::set");
    }
    if (!validate()) return fail("validation failed after drain");
    if (!tree.empty() || tree.min().has_value()) {
      return fail("drained tree is not empty");
    }
  }
  std::cout << "All iterations passed" << std::endl;
  return 0;
}
