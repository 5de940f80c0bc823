// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tree_traits.hpp"

namespace kressler::ordered_tree {

/**
 * An unbalanced binary search tree over totally-ordered elements.
 *
 * Elements are ordered by Compare and stored one per node; each node owns its
 * left and right subtrees exclusively. Equality is derived from the ordering
 * (neither a < b nor b < a), so the tree never holds two equivalent elements.
 *
 * Search cost depends on the tree height, which in turn depends on insertion
 * order: inserting pre-sorted data produces a degenerate, list-shaped tree.
 * The tree never rebalances on its own. Call balance() after a large batch
 * of insertions and/or removals to restore the minimum possible height.
 *
 * @tparam T The element type (must be ComparatorCompatible with Compare)
 * @tparam Compare The comparison function object type (defaults to
 *         std::less<T>)
 * @tparam Allocator The allocator type (defaults to std::allocator<T>)
 *
 * ## Node allocation
 *
 * Nodes are allocated through std::allocator_traits<Allocator>::rebind_alloc
 * of the internal node type, so any standard-conforming allocator (including
 * pooled ones) can back the tree.
 *
 * ## Recursion
 *
 * Traversals and copies walk the tree with explicit stacks and destruction
 * flattens it with rotations, so a degenerate tree of any size can be
 * traversed, copied or destroyed without exhausting the call stack. Only
 * balance() recurses, and its depth is bounded by the height of the rebuilt
 * (minimum-height) tree.
 *
 * Not thread-safe: concurrent access requires external synchronization
 * around the whole tree.
 */
template <typename T, typename Compare = std::less<T>,
          typename Allocator = std::allocator<T>>
  requires ComparatorCompatible<T, Compare>
class ordered_tree {
 public:
  // Type aliases
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using key_compare = Compare;
  using value_compare = Compare;
  using allocator_type = Allocator;
  using reference = value_type&;
  using const_reference = const value_type&;

 private:
  /**
   * Tree node - holds one element and owns both child subtrees.
   */
  struct tree_node {
    T value;
    tree_node* left;
    tree_node* right;

    template <typename... Args>
    explicit tree_node(std::in_place_t, Args&&... args)
        : value(std::forward<Args>(args)...), left(nullptr), right(nullptr) {}

    tree_node(const tree_node&) = delete;
    tree_node& operator=(const tree_node&) = delete;
  };

  using node_allocator_type =
      typename std::allocator_traits<Allocator>::template rebind_alloc<
          tree_node>;
  using node_traits = std::allocator_traits<node_allocator_type>;

 public:
  /**
   * Forward iterator for ordered_tree.
   * Yields elements in ascending order. Keeps the path of pending ancestors
   * on an explicit stack, so no parent pointers are needed in the nodes.
   * Any mutation of the tree invalidates all iterators.
   */
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = T;
    using pointer = const T*;
    using reference = const T&;

    const_iterator() = default;

    reference operator*() const {
      assert(!stack_.empty() && "Dereferencing end iterator");
      return stack_.back()->value;
    }

    pointer operator->() const {
      assert(!stack_.empty() && "Dereferencing end iterator");
      return &stack_.back()->value;
    }

    const_iterator& operator++() {
      assert(!stack_.empty() && "Incrementing end iterator");
      const tree_node* node = stack_.back();
      stack_.pop_back();
      push_left_spine(node->right);
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      // If both are end iterators, they're equal
      if (stack_.empty() || other.stack_.empty()) {
        return stack_.empty() && other.stack_.empty();
      }
      // The top of the stack is the current node, unique per position
      return stack_.back() == other.stack_.back();
    }

    bool operator!=(const const_iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class ordered_tree;

    explicit const_iterator(const tree_node* root) { push_left_spine(root); }

    void push_left_spine(const tree_node* node) {
      while (node != nullptr) {
        stack_.push_back(node);
        node = node->left;
      }
    }

    std::vector<const tree_node*> stack_;
  };

  using iterator = const_iterator;  // Elements are immutable in place

  /**
   * Default constructor - creates an empty tree.
   *
   * @param alloc Allocator to use for node allocation
   */
  explicit ordered_tree(const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates all nodes.
   * Complexity: O(n), constant stack depth
   */
  ~ordered_tree();

  /**
   * Copy constructor - creates a deep copy with the same shape as other.
   *
   * Implementation: Clones other node by node, walking both trees together
   * with an explicit stack, so the copy has exactly the source's layout.
   *
   * Complexity: O(n)
   */
  ordered_tree(const ordered_tree& other);

  /**
   * Copy assignment operator - replaces contents with a deep copy of other.
   * The existing nodes are released through this tree's allocator before the
   * copy is made. The allocator is replaced only when it propagates on copy
   * assignment. If copying an element throws, the tree is left empty.
   * Complexity: O(size() + other.size())
   */
  ordered_tree& operator=(const ordered_tree& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other in a valid but empty state.
   * Complexity: O(1)
   */
  ordered_tree(ordered_tree&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other in a valid but empty state.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  ordered_tree& operator=(ordered_tree&& other) noexcept;

  /**
   * Constructs the tree from an initializer list.
   * Elements are inserted in list order; duplicates are skipped.
   * Complexity: O(n * h)
   */
  ordered_tree(std::initializer_list<T> init,
               const Allocator& alloc = Allocator());

  /**
   * Constructs the tree from a range of elements.
   * Elements are inserted in range order; duplicates are skipped. If the
   * range yields std::optional<T>, disengaged entries are skipped as well.
   * Complexity: O(n * h)
   */
  template <std::input_iterator InputIt>
  ordered_tree(InputIt first, InputIt last,
               const Allocator& alloc = Allocator());

  /**
   * Constructs the tree from a C array of count elements.
   * Duplicates are skipped.
   *
   * @throws std::invalid_argument if elements is null (even when count is 0)
   */
  ordered_tree(const T* elements, size_type count,
               const Allocator& alloc = Allocator());

  /**
   * Returns the number of elements in the tree.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  /**
   * Returns true if the tree is empty.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return size_ == 0; }

  /**
   * Returns the number of nodes on the longest root-to-leaf path, or 0 for an
   * empty tree.
   * Complexity: O(n)
   */
  [[nodiscard]] size_type height() const;

  /**
   * Returns the comparison object.
   * Complexity: O(1)
   */
  key_compare key_comp() const { return comp_; }

  /**
   * Returns the allocator associated with the container.
   * Note: Returns a copy constructed from node_alloc_ via rebind.
   * Complexity: O(1)
   */
  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Returns an iterator to the smallest element.
   * Complexity: O(h)
   */
  const_iterator begin() const { return const_iterator(root_); }

  /**
   * Returns an iterator to one past the largest element.
   * Complexity: O(1)
   */
  const_iterator end() const { return const_iterator(); }

  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  /**
   * Checks if there is an element equivalent to the given one.
   * Complexity: O(h)
   */
  [[nodiscard]] bool contains(const T& element) const;

  /**
   * Returns a copy of the smallest element, or std::nullopt if the tree is
   * empty.
   * Complexity: O(h)
   */
  [[nodiscard]] std::optional<T> min() const;

  /**
   * Returns a copy of the largest element, or std::nullopt if the tree is
   * empty.
   * Complexity: O(h)
   */
  [[nodiscard]] std::optional<T> max() const;

  /**
   * Inserts an element into the tree.
   * The new node is attached as a leaf below the last node visited on the
   * search path (or becomes the root of an empty tree).
   *
   * @return true if the element was inserted, false if an equivalent element
   *         already exists (the tree is left unchanged)
   *
   * Complexity: O(h)
   */
  bool insert(const T& element);

  /**
   * Inserts an element into the tree, moving from it on success.
   * See insert(const T&).
   */
  bool insert(T&& element);

  /**
   * Constructs an element from args and inserts it.
   * The element is always constructed, even if an equivalent one exists.
   *
   * @return true if the element was inserted
   */
  template <typename... Args>
  bool emplace(Args&&... args);

  /**
   * Removes the element equivalent to the given one.
   *
   * If the matching node has no left child, it is replaced by its right
   * subtree. Otherwise the in-order predecessor (the rightmost node of the
   * left subtree) is moved into the matching node, and the predecessor node
   * is unlinked in its place, handing its left subtree to its parent. The
   * predecessor is always used, never the successor, so the resulting shape
   * is deterministic.
   *
   * @return true if an element was removed, false if none matched (the tree
   *         is left unchanged)
   *
   * Complexity: O(h)
   */
  bool erase(const T& element);

  /**
   * Removes all elements from the tree, leaving it empty.
   * All iterators are invalidated.
   *
   * Complexity: O(n)
   */
  void clear();

  /**
   * Rebuilds the tree to the minimum height for its current size.
   *
   * Elements are moved out in ascending order and reassembled by repeatedly
   * rooting each index range [low, high] at low + (high - low) / 2. The
   * resulting height is floor(log2(size())) + 1. Trees with two or fewer
   * elements are already minimal and are left untouched.
   *
   * Provides the basic exception guarantee: if node allocation throws, the
   * tree is left empty.
   *
   * Complexity: O(n)
   */
  void balance();

  /**
   * Invokes visitor(const T&) on every element in the given order.
   * Complexity: O(n)
   */
  template <typename Visitor>
  void for_each(Traversal order, Visitor&& visitor) const;

  /**
   * Returns a snapshot of all elements in the given order.
   * Later mutation of the tree does not affect the returned vector.
   * Complexity: O(n)
   */
  [[nodiscard]] std::vector<T> to_vector(
      Traversal order = Traversal::InOrder) const;

  /**
   * Renders all elements in the given order as "[e1, e2, ..., en]", using
   * operator<< for each element. An empty tree renders as "[]".
   * Complexity: O(n)
   */
  [[nodiscard]] std::string to_string(
      Traversal order = Traversal::InOrder) const;

  /**
   * Swaps the contents of this tree with another tree.
   * Complexity: O(1)
   */
  void swap(ordered_tree& other) noexcept;

  /**
   * Two trees are equal if they hold equivalent elements, regardless of
   * shape.
   */
  friend bool operator==(const ordered_tree& lhs, const ordered_tree& rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [&lhs](const T& a, const T& b) {
                        return !lhs.comp_(a, b) && !lhs.comp_(b, a);
                      });
  }

  /**
   * Writes the in-order rendering of the tree.
   */
  friend std::ostream& operator<<(std::ostream& os, const ordered_tree& tree) {
    return os << tree.to_string(Traversal::InOrder);
  }

  friend void swap(ordered_tree& lhs, ordered_tree& rhs) noexcept {
    lhs.swap(rhs);
  }

 private:
  /**
   * Allocate and construct a node holding T(args...).
   * Deallocates the node again if the element constructor throws.
   */
  template <typename... Args>
  tree_node* allocate_node(Args&&... args);

  /**
   * Destroy and deallocate a single node (children are not touched).
   */
  void deallocate_node(tree_node* node) noexcept;

  /**
   * Deallocate a whole subtree.
   * Flattens left children into the right spine with rotations as it goes,
   * so it needs neither recursion nor an auxiliary stack.
   */
  void deallocate_subtree(tree_node* node) noexcept;

  /**
   * Common implementation for the insert overloads.
   * Walks down from the root tracking the child link that will receive the
   * new node.
   */
  template <typename U>
  bool insert_impl(U&& element);

  /**
   * Clones the subtree rooted at source into this tree, which must be empty.
   * On exception the partial clone is released and the tree is left empty.
   */
  void copy_nodes(const tree_node* source);

  /**
   * Visits every node reachable from root in the given order.
   * Templated on the node pointer type so that balance() can move elements
   * out of mutable nodes while for_each() only sees const nodes.
   */
  template <typename NodePtr, typename Visitor>
  static void visit_nodes(NodePtr root, Traversal order, Visitor&& visitor);

  /**
   * Recursively build a minimum-height subtree from the sorted elements in
   * [low, high]. Returns nullptr for an empty range.
   */
  tree_node* build(std::vector<T>& elements, difference_type low,
                   difference_type high);

  // Comparator instance
  [[no_unique_address]] Compare comp_;

  // Allocator for tree_node, rebound from Allocator
  [[no_unique_address]] node_allocator_type node_alloc_;

  tree_node* root_;
  size_type size_;
};

}  // namespace kressler::ordered_tree

// Include implementation
#include "ordered_tree.ipp"
