// Implementation file for avl_tree.hpp
// This file contains all method implementations for the avl_tree class.

namespace kressler::balanced_trees {

// Copy constructor
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
avl_tree<Key, Compare>::avl_tree(const avl_tree& other)
    : root_(clone(other.root_.get())), size_(other.size_) {}

// Copy assignment operator
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
avl_tree<Key, Compare>& avl_tree<Key, Compare>::operator=(
    const avl_tree& other) {
  if (this != &other) {
    // Copy first, then swap
    avl_tree temp(other);
    swap(temp);
  }
  return *this;
}

// Move constructor
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
avl_tree<Key, Compare>::avl_tree(avl_tree&& other) noexcept
    : root_(std::move(other.root_)), size_(other.size_) {
  other.size_ = 0;
}

// Move assignment operator
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
avl_tree<Key, Compare>& avl_tree<Key, Compare>::operator=(
    avl_tree&& other) noexcept {
  if (this != &other) {
    root_ = std::move(other.root_);
    size_ = other.size_;
    other.size_ = 0;
  }
  return *this;
}

// Initializer list constructor
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
avl_tree<Key, Compare>::avl_tree(std::initializer_list<Key> init)
    : avl_tree(init.begin(), init.end()) {}

// Range constructor
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename InputIt>
avl_tree<Key, Compare>::avl_tree(InputIt first, InputIt last) : size_(0) {
  for (; first != last; ++first) {
    insert(*first);
  }
}

// insert(const Key&)
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
bool avl_tree<Key, Compare>::insert(const Key& key) {
  bool inserted = insert_node(root_, key);
  if (inserted) {
    ++size_;
  }
  return inserted;
}

// insert(Key&&)
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
bool avl_tree<Key, Compare>::insert(Key&& key) {
  bool inserted = insert_node(root_, std::move(key));
  if (inserted) {
    ++size_;
  }
  return inserted;
}

// remove
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
Key avl_tree<Key, Compare>::remove(const Key& key) {
  if (find_node(key) == nullptr) {
    throw std::out_of_range("avl_tree::remove: key not found");
  }

  std::optional<Key> removed;
  remove_node(root_, key, removed);
  --size_;
  assert(removed.has_value());
  return std::move(*removed);
}

// get
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
const Key& avl_tree<Key, Compare>::get(const Key& key) const {
  const node* found = find_node(key);
  if (found == nullptr) {
    throw std::out_of_range("avl_tree::get: key not found");
  }
  return found->key;
}

// clear
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void avl_tree<Key, Compare>::clear() {
  root_.reset();
  size_ = 0;
}

// swap
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void avl_tree<Key, Compare>::swap(avl_tree& other) noexcept {
  std::swap(root_, other.root_);
  std::swap(size_, other.size_);
}

// neighborhood, collecting into a set
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::set<Key, Compare> avl_tree<Key, Compare>::neighborhood(
    const Key& target, int max_distance) const {
  std::set<Key, Compare> result;
  neighborhood(target, max_distance, std::inserter(result, result.end()));
  return result;
}

// neighborhood, writing to an output iterator
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename OutputIt>
OutputIt avl_tree<Key, Compare>::neighborhood(const Key& target,
                                              int max_distance,
                                              OutputIt out) const {
  if (find_node(target) == nullptr) {
    throw std::out_of_range("avl_tree::neighborhood: target not found");
  }
  if (max_distance < 0) {
    throw std::invalid_argument(
        "avl_tree::neighborhood: max_distance must be non-negative");
  }

  collect_along_path(root_.get(), target, max_distance, out);
  return out;
}

// update_metadata
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void avl_tree<Key, Compare>::update_metadata(node* n) {
  int left_h = node_height(n->left.get());
  int right_h = node_height(n->right.get());
  n->height = 1 + std::max(left_h, right_h);
  n->balance_factor = left_h - right_h;
}

// rotate_left
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::unique_ptr<typename avl_tree<Key, Compare>::node>
avl_tree<Key, Compare>::rotate_left(std::unique_ptr<node> n) {
  assert(n != nullptr && n->right != nullptr &&
         "rotate_left needs a right child");

  std::unique_ptr<node> pivot = std::move(n->right);
  n->right = std::move(pivot->left);
  // n is now below pivot; its metadata must be correct before pivot's
  update_metadata(n.get());
  pivot->left = std::move(n);
  update_metadata(pivot.get());
  return pivot;
}

// rotate_right
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::unique_ptr<typename avl_tree<Key, Compare>::node>
avl_tree<Key, Compare>::rotate_right(std::unique_ptr<node> n) {
  assert(n != nullptr && n->left != nullptr &&
         "rotate_right needs a left child");

  std::unique_ptr<node> pivot = std::move(n->left);
  n->left = std::move(pivot->right);
  update_metadata(n.get());
  pivot->right = std::move(n);
  update_metadata(pivot.get());
  return pivot;
}

// rebalance
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::unique_ptr<typename avl_tree<Key, Compare>::node>
avl_tree<Key, Compare>::rebalance(std::unique_ptr<node> n) {
  update_metadata(n.get());

  if (n->balance_factor < -1) {
    // Right-heavy. A left-heavy right child needs the right-left double
    // rotation.
    if (n->right->balance_factor > 0) {
      n->right = rotate_right(std::move(n->right));
    }
    return rotate_left(std::move(n));
  }

  if (n->balance_factor > 1) {
    // Left-heavy, mirror of the above
    if (n->left->balance_factor < 0) {
      n->left = rotate_left(std::move(n->left));
    }
    return rotate_right(std::move(n));
  }

  return n;
}

// insert_node
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
bool avl_tree<Key, Compare>::insert_node(std::unique_ptr<node>& slot,
                                         K&& key) {
  if (slot == nullptr) {
    slot = std::make_unique<node>(std::forward<K>(key));
    return true;
  }

  bool inserted;
  if (less(key, slot->key)) {
    inserted = insert_node(slot->left, std::forward<K>(key));
  } else if (less(slot->key, key)) {
    inserted = insert_node(slot->right, std::forward<K>(key));
  } else {
    // Duplicate - nothing below slot changed
    return false;
  }

  if (inserted) {
    slot = rebalance(std::move(slot));
  }
  return inserted;
}

// remove_node
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void avl_tree<Key, Compare>::remove_node(std::unique_ptr<node>& slot,
                                         const Key& key,
                                         std::optional<Key>& removed) {
  assert(slot != nullptr &&
         "remove_node called for a key that is not present");
  node* n = slot.get();

  if (less(key, n->key)) {
    remove_node(n->left, key, removed);
  } else if (less(n->key, key)) {
    remove_node(n->right, key, removed);
  } else {
    // Key copies and moves happen before any link changes
    removed.emplace(std::move_if_noexcept(n->key));

    // Zero or one child: splice the child (possibly empty) into n's slot
    if (n->left == nullptr) {
      slot = std::move(n->right);
      return;
    }
    if (n->right == nullptr) {
      slot = std::move(n->left);
      return;
    }

    // Two children: n stays, taking over its in-order successor's key
    node* successor = n->right.get();
    while (successor->left != nullptr) {
      successor = successor->left.get();
    }
    n->key = std::move_if_noexcept(successor->key);
    remove_min(n->right);
  }

  slot = rebalance(std::move(slot));
}

// remove_min
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
void avl_tree<Key, Compare>::remove_min(std::unique_ptr<node>& slot) {
  if (slot->left == nullptr) {
    slot = std::move(slot->right);
    return;
  }

  remove_min(slot->left);
  slot = rebalance(std::move(slot));
}

// find_node
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
const typename avl_tree<Key, Compare>::node* avl_tree<Key, Compare>::find_node(
    const Key& key) const {
  const node* n = root_.get();
  while (n != nullptr) {
    if (less(key, n->key)) {
      n = n->left.get();
    } else if (less(n->key, key)) {
      n = n->right.get();
    } else {
      return n;
    }
  }
  return nullptr;
}

// clone
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
std::unique_ptr<typename avl_tree<Key, Compare>::node>
avl_tree<Key, Compare>::clone(const node* n) {
  if (n == nullptr) {
    return nullptr;
  }

  auto copy = std::make_unique<node>(n->key);
  copy->left = clone(n->left.get());
  copy->right = clone(n->right.get());
  copy->height = n->height;
  copy->balance_factor = n->balance_factor;
  return copy;
}

// collect_along_path
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename OutputIt>
int avl_tree<Key, Compare>::collect_along_path(const node* n, const Key& target,
                                               int max_distance,
                                               OutputIt& out) {
  assert(n != nullptr && "neighborhood target must be present");

  // Children of n that are not on the path to target. Below the target
  // itself, both children are off-path.
  const node* off_path[2] = {nullptr, nullptr};
  int child_distance = -1;
  if (less(target, n->key)) {
    child_distance =
        collect_along_path(n->left.get(), target, max_distance, out);
    off_path[0] = n->right.get();
  } else if (less(n->key, target)) {
    child_distance =
        collect_along_path(n->right.get(), target, max_distance, out);
    off_path[0] = n->left.get();
  } else {
    off_path[0] = n->left.get();
    off_path[1] = n->right.get();
  }

  int distance = child_distance + 1;
  if (distance <= max_distance) {
    *out++ = n->key;
  }
  if (distance < max_distance) {
    for (const node* child : off_path) {
      if (child != nullptr) {
        collect_below(child, distance + 1, max_distance, out);
      }
    }
  }
  return distance;
}

// collect_below
template <typename Key, typename Compare>
  requires ComparatorCompatible<Key, Compare>
template <typename OutputIt>
void avl_tree<Key, Compare>::collect_below(const node* n, int distance,
                                           int max_distance, OutputIt& out) {
  *out++ = n->key;
  if (distance == max_distance) {
    return;
  }
  if (n->left != nullptr) {
    collect_below(n->left.get(), distance + 1, max_distance, out);
  }
  if (n->right != nullptr) {
    collect_below(n->right.get(), distance + 1, max_distance, out);
  }
}

}  // namespace kressler::balanced_trees
