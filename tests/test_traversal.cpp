// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <iterator>
#include <numeric>
#include <ordered_tree/ordered_tree.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace kressler::ordered_tree;

TEST_CASE("traversals of an empty tree", "[traversal]") {
  ordered_tree<int> tree;
  for (Traversal order : {Traversal::InOrder, Traversal::PreOrder,
                          Traversal::PostOrder, Traversal::BreadthFirst}) {
    REQUIRE(tree.to_vector(order).empty());
    REQUIRE(tree.to_string(order) == "[]");
  }
}

TEST_CASE("traversals of a single node", "[traversal]") {
  ordered_tree<int> tree{42};
  for (Traversal order : {Traversal::InOrder, Traversal::PreOrder,
                          Traversal::PostOrder, Traversal::BreadthFirst}) {
    REQUIRE(tree.to_vector(order) == std::vector<int>{42});
    REQUIRE(tree.to_string(order) == "[42]");
  }
}

TEST_CASE("traversal orders of a full tree", "[traversal]") {
  // Perfect tree: 4 at the root, 2 and 6 below it, 1 3 5 7 as leaves
  ordered_tree<int> tree{4, 2, 6, 1, 3, 5, 7};

  SECTION("In-order") {
    REQUIRE(tree.to_vector(Traversal::InOrder) ==
            std::vector<int>{1, 2, 3, 4, 5, 6, 7});
    REQUIRE(tree.to_string(Traversal::InOrder) ==
            "[1, 2, 3, 4, 5, 6, 7]");
  }

  SECTION("Pre-order") {
    REQUIRE(tree.to_vector(Traversal::PreOrder) ==
            std::vector<int>{4, 2, 1, 3, 6, 5, 7});
    REQUIRE(tree.to_string(Traversal::PreOrder) ==
            "[4, 2, 1, 3, 6, 5, 7]");
  }

  SECTION("Post-order") {
    REQUIRE(tree.to_vector(Traversal::PostOrder) ==
            std::vector<int>{1, 3, 2, 5, 7, 6, 4});
    REQUIRE(tree.to_string(Traversal::PostOrder) ==
            "[1, 3, 2, 5, 7, 6, 4]");
  }

  SECTION("Breadth-first") {
    REQUIRE(tree.to_vector(Traversal::BreadthFirst) ==
            std::vector<int>{4, 2, 6, 1, 3, 5, 7});
    REQUIRE(tree.to_string(Traversal::BreadthFirst) ==
            "[4, 2, 6, 1, 3, 5, 7]");
  }

  SECTION("Default order is in-order") {
    REQUIRE(tree.to_vector() == tree.to_vector(Traversal::InOrder));
    REQUIRE(tree.to_string() == tree.to_string(Traversal::InOrder));
  }
}

TEST_CASE("traversal orders of an irregular tree", "[traversal]") {
  // Levels: 8 | 3 10 | 1 6 14 | 4 7 13, where 13 is the left child of 14
  ordered_tree<int> tree{8, 3, 10, 1, 6, 14, 4, 7, 13};

  REQUIRE(tree.to_vector(Traversal::InOrder) ==
          std::vector<int>{1, 3, 4, 6, 7, 8, 10, 13, 14});
  REQUIRE(tree.to_vector(Traversal::PreOrder) ==
          std::vector<int>{8, 3, 1, 6, 4, 7, 10, 14, 13});
  REQUIRE(tree.to_vector(Traversal::PostOrder) ==
          std::vector<int>{1, 4, 7, 6, 3, 13, 14, 10, 8});
  REQUIRE(tree.to_vector(Traversal::BreadthFirst) ==
          std::vector<int>{8, 3, 10, 1, 6, 14, 4, 7, 13});
  REQUIRE(tree.height() == 4);
}

TEST_CASE("traversals of degenerate trees", "[traversal]") {
  SECTION("Right-leaning chain") {
    ordered_tree<int> tree{1, 2, 3, 4, 5};
    REQUIRE(tree.to_vector(Traversal::PreOrder) ==
            std::vector<int>{1, 2, 3, 4, 5});
    REQUIRE(tree.to_vector(Traversal::PostOrder) ==
            std::vector<int>{5, 4, 3, 2, 1});
    REQUIRE(tree.to_vector(Traversal::BreadthFirst) ==
            std::vector<int>{1, 2, 3, 4, 5});
  }

  SECTION("Left-leaning chain") {
    ordered_tree<int> tree{5, 4, 3, 2, 1};
    REQUIRE(tree.to_vector(Traversal::InOrder) ==
            std::vector<int>{1, 2, 3, 4, 5});
    REQUIRE(tree.to_vector(Traversal::PreOrder) ==
            std::vector<int>{5, 4, 3, 2, 1});
    REQUIRE(tree.to_vector(Traversal::PostOrder) ==
            std::vector<int>{1, 2, 3, 4, 5});
  }

  SECTION("Long chain does not exhaust the stack") {
    ordered_tree<int> tree;
    constexpr int count = 20000;
    for (int i = 0; i < count; ++i) {
      tree.insert(i);
    }
    REQUIRE(tree.height() == static_cast<std::size_t>(count));
    auto inorder = tree.to_vector();
    REQUIRE(inorder.size() == static_cast<std::size_t>(count));
    REQUIRE(std::is_sorted(inorder.begin(), inorder.end()));
    REQUIRE(tree.to_vector(Traversal::PostOrder).front() == count - 1);
    tree.clear();
    REQUIRE(tree.empty());
  }
}

TEST_CASE("traversal results are snapshots", "[traversal]") {
  ordered_tree<int> tree{2, 1, 3};
  auto vec = tree.to_vector();
  auto str = tree.to_string(Traversal::PreOrder);

  tree.insert(4);
  tree.erase(1);

  REQUIRE(vec == std::vector<int>{1, 2, 3});
  REQUIRE(str == "[2, 1, 3]");
  REQUIRE(tree.to_vector() == std::vector<int>{2, 3, 4});
}

TEST_CASE("for_each visits in the requested order", "[traversal]") {
  ordered_tree<int> tree{4, 2, 6, 1, 3};
  std::vector<int> seen;
  tree.for_each(Traversal::PostOrder, [&seen](int v) { seen.push_back(v); });
  REQUIRE(seen == std::vector<int>{1, 3, 2, 6, 4});
}

TEST_CASE("string rendering", "[traversal][string]") {
  SECTION("Strings are rendered without quotes") {
    ordered_tree<std::string> tree{"pear", "apple", "fig"};
    REQUIRE(tree.to_string() == "[apple, fig, pear]");
    REQUIRE(tree.to_string(Traversal::BreadthFirst) == "[pear, apple, fig]");
  }

  SECTION("Stream insertion writes the in-order rendering") {
    ordered_tree<int> tree{3, 1, 2};
    std::ostringstream out;
    out << tree;
    REQUIRE(out.str() == "[1, 2, 3]");
  }

  SECTION("Negative numbers") {
    ordered_tree<int> tree{0, -5, 5};
    REQUIRE(tree.to_string() == "[-5, 0, 5]");
  }
}

TEST_CASE("ordered_tree iterator", "[traversal][iterator]") {
  SECTION("Empty tree") {
    ordered_tree<int> tree;
    REQUIRE(tree.begin() == tree.end());
    REQUIRE(tree.cbegin() == tree.cend());
  }

  SECTION("Range-for yields ascending order") {
    ordered_tree<int> tree{50, 20, 80, 10, 30, 70, 90};
    std::vector<int> seen;
    for (int v : tree) {
      seen.push_back(v);
    }
    REQUIRE(seen == std::vector<int>{10, 20, 30, 50, 70, 80, 90});
  }

  SECTION("Works with standard algorithms") {
    ordered_tree<int> tree{5, 3, 8, 1, 4};
    REQUIRE(std::distance(tree.begin(), tree.end()) == 5);
    REQUIRE(std::accumulate(tree.begin(), tree.end(), 0) == 21);
    REQUIRE(*std::find(tree.begin(), tree.end(), 4) == 4);
    REQUIRE(std::find(tree.begin(), tree.end(), 6) == tree.end());
  }

  SECTION("Post-increment") {
    ordered_tree<std::string> tree{"b", "a"};
    auto it = tree.begin();
    auto prev = it++;
    REQUIRE(*prev == "a");
    REQUIRE(*it == "b");
    REQUIRE(it->size() == 1);
    ++it;
    REQUIRE(it == tree.end());
  }

  SECTION("Copies iterate independently") {
    ordered_tree<int> tree{2, 1, 3};
    auto a = tree.begin();
    auto b = a;
    ++a;
    REQUIRE(*a == 2);
    REQUIRE(*b == 1);
    REQUIRE(a != b);
  }
}

TEST_CASE("traversal names", "[traversal]") {
  REQUIRE(traversal_name(Traversal::InOrder) == "inorder");
  REQUIRE(traversal_name(Traversal::PreOrder) == "preorder");
  REQUIRE(traversal_name(Traversal::PostOrder) == "postorder");
  REQUIRE(traversal_name(Traversal::BreadthFirst) == "breadth-first");

  for (Traversal order : {Traversal::InOrder, Traversal::PreOrder,
                          Traversal::PostOrder, Traversal::BreadthFirst}) {
    REQUIRE(parse_traversal(traversal_name(order)) == order);
  }
  REQUIRE_FALSE(parse_traversal("sideways").has_value());

  static_assert(std::forward_iterator<ordered_tree<int>::const_iterator>);
}
