// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <balanced_trees/avl_tree.hpp>
#include <catch2/catch_test_macros.hpp>
#include <iterator>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "avl_tree_checks.hpp"

using namespace kressler::balanced_trees;
using avl_tree_checks::brute_force_neighborhood;
using avl_tree_checks::is_valid_avl;

TEST_CASE("neighborhood on a small tree", "[avl_tree][neighborhood]") {
  /*
              76
           /      \
         34        90
        /  \      /
      20    40  81
  */
  avl_tree<int> tree = {76, 34, 90, 20, 40, 81};
  REQUIRE(tree.root()->key == 76);

  SECTION("Radius zero is the target alone") {
    REQUIRE(tree.neighborhood(90, 0) == std::set<int>{90});
    for (int key : {76, 34, 90, 20, 40, 81}) {
      REQUIRE(tree.neighborhood(key, 0) == std::set<int>{key});
    }
  }

  SECTION("Radius one reaches parent and children") {
    REQUIRE(tree.neighborhood(34, 1) == std::set<int>{20, 34, 40, 76});
    REQUIRE(tree.neighborhood(76, 1) == std::set<int>{34, 76, 90});
    REQUIRE(tree.neighborhood(81, 1) == std::set<int>{81, 90});
  }

  SECTION("Paths through an ancestor") {
    // 20 -> 34 -> 76 -> 90 -> 81
    REQUIRE(tree.neighborhood(20, 2) == std::set<int>{20, 34, 40, 76});
    REQUIRE(tree.neighborhood(20, 3) == std::set<int>{20, 34, 40, 76, 90});
    REQUIRE(tree.neighborhood(20, 4) ==
            std::set<int>{20, 34, 40, 76, 81, 90});
    REQUIRE(tree.neighborhood(81, 2) == std::set<int>{76, 81, 90});
  }

  SECTION("Large radius returns every key") {
    REQUIRE(tree.neighborhood(40, 100) ==
            std::set<int>{20, 34, 40, 76, 81, 90});
  }
}

TEST_CASE("neighborhood on a deeper tree", "[avl_tree][neighborhood]") {
  /*
                   50
                 /    \
              25      75
             /  \     / \
           13   37  70  80
          /  \    \      \
         12  15    40    85
        /
       10
  */
  avl_tree<int> tree = {50, 25, 75, 13, 37, 70, 80, 12, 15, 40, 85, 10};
  REQUIRE(is_valid_avl(tree));
  REQUIRE(tree.root()->key == 50);

  REQUIRE(tree.neighborhood(37, 3) ==
          std::set<int>{12, 13, 15, 25, 37, 40, 50, 75});
  REQUIRE(tree.neighborhood(85, 2) == std::set<int>{75, 80, 85});
  REQUIRE(tree.neighborhood(13, 1) == std::set<int>{12, 13, 15, 25});
  REQUIRE(tree.neighborhood(10, 0) == std::set<int>{10});
}

TEST_CASE("neighborhood argument checks", "[avl_tree][neighborhood]") {
  avl_tree<int> tree = {76, 34, 90, 20, 40, 81};

  SECTION("Missing target") {
    REQUIRE_THROWS_AS(tree.neighborhood(35, 1), std::out_of_range);
  }

  SECTION("Negative distance") {
    REQUIRE_THROWS_AS(tree.neighborhood(34, -1), std::invalid_argument);
  }

  SECTION("Missing target is reported before a negative distance") {
    REQUIRE_THROWS_AS(tree.neighborhood(35, -1), std::out_of_range);
  }

  SECTION("Empty tree") {
    avl_tree<int> empty;
    REQUIRE_THROWS_AS(empty.neighborhood(0, 0), std::out_of_range);
  }

  SECTION("Tree is unchanged after a failed query") {
    REQUIRE_THROWS(tree.neighborhood(34, -5));
    REQUIRE(tree.size() == 6);
    REQUIRE(is_valid_avl(tree));
  }
}

TEST_CASE("neighborhood output iterator overload",
          "[avl_tree][neighborhood]") {
  avl_tree<int> tree = {76, 34, 90, 20, 40, 81};

  std::vector<int> keys;
  tree.neighborhood(34, 1, std::back_inserter(keys));

  // Each key is written exactly once
  REQUIRE(keys.size() == 4);
  REQUIRE(std::set<int>(keys.begin(), keys.end()) ==
          std::set<int>{20, 34, 40, 76});
}

TEST_CASE("neighborhood with string keys", "[avl_tree][neighborhood]") {
  avl_tree<std::string> tree = {"m", "f", "t", "c", "h", "p", "w"};
  REQUIRE(tree.neighborhood("f", 1) ==
          std::set<std::string>{"c", "f", "h", "m"});
  REQUIRE(tree.neighborhood("c", 2) ==
          std::set<std::string>{"c", "f", "h", "m"});
}

TEST_CASE("neighborhood matches breadth-first search",
          "[avl_tree][neighborhood][random]") {
  std::mt19937 rng(2025);
  std::uniform_int_distribution<int> key_dist(0, 10000);

  avl_tree<int> tree;
  std::vector<int> keys;
  while (tree.size() < 300) {
    int key = key_dist(rng);
    if (tree.insert(key)) {
      keys.push_back(key);
    }
  }
  // Remove some keys so two-child removals shape the tree too
  for (std::size_t i = 0; i < 100; ++i) {
    tree.remove(keys.back());
    keys.pop_back();
  }
  REQUIRE(is_valid_avl(tree));

  std::uniform_int_distribution<std::size_t> pick(0, keys.size() - 1);
  for (int trial = 0; trial < 200; ++trial) {
    int target = keys[pick(rng)];
    int radius = trial % (tree.height() * 2 + 2);
    auto expected = brute_force_neighborhood(tree, target, radius);

    REQUIRE(tree.neighborhood(target, radius) == expected);

    std::vector<int> written;
    tree.neighborhood(target, radius, std::back_inserter(written));
    REQUIRE(written.size() == expected.size());
  }
}
