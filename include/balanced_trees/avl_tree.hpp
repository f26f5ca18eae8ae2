// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace kressler::balanced_trees {

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

/**
 * A height-balanced (AVL) binary search tree holding unique keys.
 *
 * Every node caches its height and balance factor (left height minus right
 * height). Both are recomputed on the way back up from every insert and
 * remove, and any node whose balance factor leaves [-1, 1] is restored with a
 * single or double rotation before the operation returns.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Compare Strict weak ordering over Key (defaults to std::less<Key>).
 *         Two keys are equal when neither orders before the other.
 *
 * ## Ownership
 *
 * Each node owns its children through std::unique_ptr and the tree owns the
 * root. Insert and remove descend through references to these owning slots
 * and only relink on the way back up, storing the (possibly rotated)
 * replacement into the slot it came from:
 *
 * @code
 * slot = rebalance(std::move(slot));
 * @endcode
 *
 * ## Exception safety
 *
 * insert() and remove() leave the tree unchanged if Compare or a Key copy
 * throws. Key moves are used only where they are noexcept.
 *
 * ## Neighborhood queries
 *
 * neighborhood() returns every key whose tree-edge distance from a target key
 * is at most a given radius. The search walks the root-to-target path first,
 * learning each path node's distance on the way back up, then fans out into
 * the off-path subtrees of path nodes that are still inside the radius.
 *
 * Not thread-safe. Callers sharing a tree across threads must serialize all
 * access externally.
 */
template <typename Key, typename Compare = std::less<Key>>
  requires ComparatorCompatible<Key, Compare>
class avl_tree {
 public:
  // Type aliases
  using key_type = Key;
  using value_type = Key;
  using size_type = std::size_t;
  using key_compare = Compare;

  /**
   * Tree node. Exposed read-only through root() for inspection; only the tree
   * itself mutates nodes.
   */
  struct node {
    Key key;
    std::unique_ptr<node> left;
    std::unique_ptr<node> right;
    int height;          // 0 for a leaf; an empty subtree counts as -1
    int balance_factor;  // height(left) - height(right)

    template <typename K>
    explicit node(K&& k)
        : key(std::forward<K>(k)), height(0), balance_factor(0) {}
  };

  /**
   * Default constructor - creates an empty tree.
   */
  avl_tree() : size_(0) {}

  /**
   * Destructor - releases all nodes.
   */
  ~avl_tree() = default;

  /**
   * Copy constructor - creates a deep copy of the tree.
   *
   * Implementation: Clones the node graph node-by-node, so the copy has the
   * same shape, heights and balance factors as other.
   *
   * Complexity: O(m) where m = other.size()
   */
  avl_tree(const avl_tree& other);

  /**
   * Copy assignment operator - replaces contents with a deep copy.
   * Complexity: O(n + m) where n = this.size(), m = other.size()
   */
  avl_tree& operator=(const avl_tree& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other in a valid but empty state.
   * Complexity: O(1)
   */
  avl_tree(avl_tree&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other in a valid but empty state.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  avl_tree& operator=(avl_tree&& other) noexcept;

  /**
   * Constructs the tree from an initializer list, inserting the keys in list
   * order. Duplicates after the first occurrence are ignored.
   * Enables syntax like: avl_tree<int> tree = {76, 34, 90};
   * Complexity: O(n log n) where n is the number of elements
   */
  avl_tree(std::initializer_list<Key> init);

  /**
   * Constructs the tree from a range of keys, inserting them in range order.
   * Duplicates after the first occurrence are ignored.
   * Complexity: O(n log n) where n is the distance between first and last
   */
  template <typename InputIt>
  avl_tree(InputIt first, InputIt last);

  /**
   * Returns the number of keys in the tree.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  /**
   * Returns true if the tree is empty.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return size_ == 0; }

  /**
   * Returns the height of the tree: -1 when empty, 0 for a single node.
   * Reads the cached height of the root.
   * Complexity: O(1)
   */
  [[nodiscard]] int height() const { return node_height(root_.get()); }

  /**
   * Returns the key comparison object.
   * Complexity: O(1)
   */
  key_compare key_comp() const { return key_compare(); }

  /**
   * Returns the root node, or nullptr for an empty tree. For inspection only.
   */
  const node* root() const { return root_.get(); }

  /**
   * Inserts a key. Does nothing if an equal key is already present.
   *
   * @param key The key to insert
   * @return true if the key was inserted, false if it was already present
   *
   * Complexity: O(log n)
   */
  bool insert(const Key& key);

  /**
   * Inserts a key by moving it into the tree. The key is only moved from if
   * it is actually inserted.
   */
  bool insert(Key&& key);

  /**
   * Removes the key equal to the argument and returns the key that was
   * stored in the tree.
   *
   * A node with two children is not unlinked. Its in-order successor's key is
   * moved into it and the successor's node is unlinked instead.
   *
   * @param key The key to remove
   * @return The stored key that compared equal to the argument
   * @throws std::out_of_range if no equal key exists (tree left unchanged)
   *
   * Complexity: O(log n)
   */
  Key remove(const Key& key);

  /**
   * Returns the stored key equal to the argument. The returned reference is
   * to the tree's own copy, which matters for keys that carry data beyond
   * what Compare looks at.
   *
   * @throws std::out_of_range if no equal key exists
   * Complexity: O(log n)
   */
  const Key& get(const Key& key) const;

  /**
   * Returns true if a key equal to the argument is stored.
   * Complexity: O(log n)
   */
  bool contains(const Key& key) const { return find_node(key) != nullptr; }

  /**
   * Removes all keys.
   * Complexity: O(n)
   */
  void clear();

  /**
   * Swaps contents with another tree.
   * Complexity: O(1)
   */
  void swap(avl_tree& other) noexcept;

  /**
   * Returns all keys whose tree-edge distance from target's node is at most
   * max_distance, target included.
   *
   * Example, for the tree
   * @code
   *            76
   *          /    \
   *        34      90
   *       /  \    /
   *     20   40  81
   * @endcode
   * neighborhood(34, 1) == {20, 34, 40, 76} and neighborhood(90, 0) == {90}.
   *
   * @param target Key whose node is the center of the neighborhood
   * @param max_distance Maximum number of edges from target's node
   * @throws std::out_of_range if target is not in the tree
   * @throws std::invalid_argument if max_distance is negative
   *
   * Complexity: O(log n + k) where k is the number of keys returned
   */
  std::set<Key, Compare> neighborhood(const Key& target,
                                      int max_distance) const;

  /**
   * Same as neighborhood(target, max_distance), writing each key exactly once
   * to out instead of collecting them into a set. Keys are written in no
   * particular order.
   *
   * @return The output iterator one past the last key written
   */
  template <typename OutputIt>
  OutputIt neighborhood(const Key& target, int max_distance,
                        OutputIt out) const;

 private:
  std::unique_ptr<node> root_;
  size_type size_;

  static bool less(const Key& lhs, const Key& rhs) {
    return key_compare()(lhs, rhs);
  }

  static int node_height(const node* n) {
    return n == nullptr ? -1 : n->height;
  }

  // Recomputes cached height and balance factor from the children
  static void update_metadata(node* n);

  static std::unique_ptr<node> rotate_left(std::unique_ptr<node> n);
  static std::unique_ptr<node> rotate_right(std::unique_ptr<node> n);

  // Recomputes n's metadata and restores |balance_factor| <= 1 at n
  static std::unique_ptr<node> rebalance(std::unique_ptr<node> n);

  // Inserts below slot, rebalancing on the way back up. The only throwing
  // steps (Compare and constructing the new node) run before any link changes.
  template <typename K>
  static bool insert_node(std::unique_ptr<node>& slot, K&& key);

  // Hands the stored key of the removed position back through removed
  static void remove_node(std::unique_ptr<node>& slot, const Key& key,
                          std::optional<Key>& removed);

  // Unlinks and destroys the leftmost node below slot
  static void remove_min(std::unique_ptr<node>& slot);

  const node* find_node(const Key& key) const;

  static std::unique_ptr<node> clone(const node* n);

  // Path phase: returns this node's distance from target
  template <typename OutputIt>
  static int collect_along_path(const node* n, const Key& target,
                                int max_distance, OutputIt& out);

  // Fan-out phase: n is known to be `distance` edges from target
  template <typename OutputIt>
  static void collect_below(const node* n, int distance, int max_distance,
                            OutputIt& out);
};

}  // namespace kressler::balanced_trees

#include "avl_tree.ipp"
