// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

namespace kressler::ordered_tree {

// Enum to select the order in which a traversal visits elements
enum class Traversal {
  InOrder,      // Left subtree, node, right subtree (ascending order)
  PreOrder,     // Node, left subtree, right subtree
  PostOrder,    // Left subtree, right subtree, node
  BreadthFirst  // Level by level from the root, left to right
};

// Concept to enforce that a comparator is compatible with an element type
template <typename T, typename Compare>
concept ComparatorCompatible = requires(Compare comp, T a, T b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

/**
 * Returns the canonical lower-case name of a traversal order, as accepted by
 * the command-line tools.
 */
constexpr std::string_view traversal_name(Traversal order) {
  switch (order) {
    case Traversal::InOrder:
      return "inorder";
    case Traversal::PreOrder:
      return "preorder";
    case Traversal::PostOrder:
      return "postorder";
    case Traversal::BreadthFirst:
      return "breadth-first";
  }
  return "unknown";
}

/**
 * Parses a traversal name produced by traversal_name().
 * @return The traversal, or std::nullopt if the name is not recognized
 */
constexpr std::optional<Traversal> parse_traversal(std::string_view name) {
  for (Traversal order : {Traversal::InOrder, Traversal::PreOrder,
                          Traversal::PostOrder, Traversal::BreadthFirst}) {
    if (traversal_name(order) == name) {
      return order;
    }
  }
  return std::nullopt;
}

namespace detail {

// Detects std::optional<T> so range constructors can skip absent entries
template <typename U>
struct is_optional : std::false_type {};

template <typename U>
struct is_optional<std::optional<U>> : std::true_type {};

template <typename U>
inline constexpr bool is_optional_v =
    is_optional<std::remove_cvref_t<U>>::value;

}  // namespace detail

}  // namespace kressler::ordered_tree
