// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <iostream>
#include <lyra/lyra.hpp>
#include <ordered_tree/ordered_tree.hpp>
#include <string>
#include <vector>

using namespace kressler::ordered_tree;

int main(int argc, char** argv) {
  // Command line parameters
  bool show_help = false;
  bool balance = false;
  std::string order = "all";
  std::vector<long> values;
  std::vector<long> extra_values;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(order, "order")["-o"]["--order"](
          "Traversal to print: inorder, preorder, postorder, breadth-first "
          "or all") |
      lyra::opt(balance)["-b"]["--balance"](
          "Balance the tree before printing") |
      lyra::opt(extra_values, "value")["-v"]["--value"](
          "Value to insert after the positional values; repeatable. Negative "
          "values must be given this way, as --value=-5")
          .cardinality(0, 0) |
      lyra::arg(values, "values")("Values to insert, in order")
          .cardinality(0, 0);

  // Parse command line
  auto result = cli.parse({argc, argv});

  // Check for errors
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  std::vector<Traversal> orders;
  if (order == "all") {
    orders = {Traversal::InOrder, Traversal::PreOrder, Traversal::PostOrder,
              Traversal::BreadthFirst};
  } else if (auto parsed = parse_traversal(order)) {
    orders.push_back(*parsed);
  } else {
    std::cerr << "Unknown traversal order: " << order << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  values.insert(values.end(), extra_values.begin(), extra_values.end());
  ordered_tree<long> tree(values.begin(), values.end());
  if (balance) {
    tree.balance();
  }

  // Use the parsed parameters
  std::cout << "Size: " << tree.size() << std::endl;
  std::cout << "Height: " << tree.height() << std::endl;
  for (Traversal t : orders) {
    std::cout << traversal_name(t) << ": " << tree.to_string(t) << std::endl;
  }

  return 0;
}
