#include <balanced_trees/avl_tree.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <print>
#include <random>
#include <set>
#include <unordered_set>

#include "avl_tree_checks.hpp"

using kressler::balanced_trees::avl_tree;
using tree_type = avl_tree<int>;
using node_type = tree_type::node;
using avl_tree_checks::brute_force_neighborhood;

namespace {

// Recomputes heights bottom-up, returning -1 for an empty subtree. Sets ok to
// false on any order, cached metadata or balance violation.
int check_subtree(const node_type* n, const int* lower, const int* upper,
                  size_t& count, bool& ok) {
  if (n == nullptr) {
    return -1;
  }
  if ((lower != nullptr && !(*lower < n->key)) ||
      (upper != nullptr && !(n->key < *upper))) {
    std::cout << "Order violation at key " << n->key << std::endl;
    ok = false;
  }
  ++count;
  int left_h = check_subtree(n->left.get(), lower, &n->key, count, ok);
  int right_h = check_subtree(n->right.get(), &n->key, upper, count, ok);
  int height = 1 + std::max(left_h, right_h);
  if (n->height != height || n->balance_factor != left_h - right_h) {
    std::cout << "Stale metadata at key " << n->key << ": height "
              << n->height << " != " << height << " or balance "
              << n->balance_factor << " != " << left_h - right_h << std::endl;
    ok = false;
  }
  if (n->balance_factor < -1 || n->balance_factor > 1) {
    std::cout << "Unbalanced node " << n->key << " with balance factor "
              << n->balance_factor << std::endl;
    ok = false;
  }
  return height;
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t min_keys = 10000;
  size_t max_keys = 200000;
  size_t batches = 100;
  size_t batch_size = 1000;
  int max_radius = 6;
  size_t queries = 100;

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
          "Number of remove/insert batches to run") |
      lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of a remove/insert batch") |
      lyra::opt(max_radius, "max_radius")["-r"]["--max-radius"](
          "Largest neighborhood radius to check") |
      lyra::opt(queries, "queries")["-q"]["--queries"](
          "Neighborhood queries to check after each batch");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys == 0 || min_keys > max_keys || max_radius < 0) {
    std::cerr << "Invalid options: need 0 < min_keys <= max_keys and "
                 "max_radius >= 0"
              << std::endl;
    exit(1);
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());
    std::uniform_int_distribution<int> radius_dist(0, max_radius);

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    std::set<int> ordered_set;
    tree_type tree;
    std::unordered_set<int> seen;

    auto insert = [&]() -> void {
      int key = dist(rng);
      bool expected = ordered_set.insert(key).second;
      if (tree.insert(key) != expected) {
        std::cout << "Insert of " << key << " disagrees with std::set"
                  << std::endl;
        exit(1);
      }
      seen.insert(key);
    };

    auto remove = [&]() -> void {
      auto key = *seen.begin();
      seen.erase(key);
      ordered_set.erase(key);
      if (tree.remove(key) != key) {
        std::cout << "Remove of " << key << " returned the wrong key"
                  << std::endl;
        exit(1);
      }
    };

    auto validate = [&]() -> void {
      if (tree.size() != ordered_set.size()) {
        std::cout << "Size mismatch: " << tree.size()
                  << " != " << ordered_set.size() << std::endl;
        exit(1);
      }

      size_t count = 0;
      bool ok = true;
      int height = check_subtree(tree.root(), nullptr, nullptr, count, ok);
      if (!ok || count != tree.size() || height != tree.height()) {
        std::cout << "Invariant check failed: " << count << " reachable nodes, "
                  << "height " << height << " vs cached " << tree.height()
                  << std::endl;
        exit(1);
      }

      if (tree.empty()) {
        return;
      }
      std::uniform_int_distribution<size_t> pick(0, seen.bucket_count() - 1);
      for (size_t q = 0; q < queries; ++q) {
        // Any present key will do as a target
        size_t bucket = pick(rng);
        while (seen.bucket_size(bucket) == 0) {
          bucket = (bucket + 1) % seen.bucket_count();
        }
        int target = *seen.begin(bucket);
        int radius = radius_dist(rng);
        if (tree.neighborhood(target, radius) !=
            brute_force_neighborhood(tree, target, radius)) {
          std::cout << "Neighborhood mismatch for " << target << " radius "
                    << radius << std::endl;
          exit(1);
        }
      }
    };

    // Build up the initial tree/set
    while (ordered_set.size() < num_keys) {
      insert();
    }
    validate();

    // Run remove/insert batches
    for (size_t batch = 0; batch < batches; ++batch) {
      for (size_t i = 0; i < batch_size && !seen.empty(); ++i) {
        remove();
      }
      for (size_t i = 0; i < batch_size; ++i) {
        insert();
      }
      validate();
    }

    // Empty out the tree/set
    while (!seen.empty()) {
      remove();
    }
    validate();
    std::println("Iteration {} passed, final height {}", iter, tree.height());
  }
  return 0;
}
