// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace encodings::data {

/**
 * @brief One node of an encoding tree; node i represents mode/qubit i.
 */
struct TreeNode {
  /// Mode index of this node
  std::uint64_t index = 0;
  /// Child indices in link order
  std::vector<std::uint64_t> children;
  /// Parent index, std::nullopt for the root
  std::optional<std::uint64_t> parent;

  bool operator==(const TreeNode& other) const = default;
};

/**
 * @brief A rooted tree over the modes 0..n-1, stored as an index arena.
 *
 * Nodes refer to each other by index only, so trees are cheap to copy and
 * share between encoders.
 */
class EncodingTree {
 public:
  /**
   * @brief Construct a tree from its node list
   *
   * The list must be non-empty, with nodes[i].index == i, exactly one root,
   * children and parent links that agree, each node reachable from the root
   * exactly once, and no repeated children.
   *
   * @param nodes Node list indexed by mode
   * @throws std::invalid_argument if the nodes do not form such a tree
   */
  explicit EncodingTree(std::vector<TreeNode> nodes);

  /// Number of nodes
  std::uint64_t size() const { return nodes_.size(); }

  /// Index of the root node
  std::uint64_t root() const { return root_; }

  const std::vector<TreeNode>& nodes() const { return nodes_; }

  /**
   * @brief Node by index
   * @throws std::out_of_range if j >= size()
   */
  const TreeNode& node(std::uint64_t j) const;

  /**
   * @brief Ancestors of node j, nearest first, excluding j
   */
  std::vector<std::uint64_t> ancestors(std::uint64_t j) const;

  /**
   * @brief All descendants of node j in depth-first preorder, excluding j
   */
  std::vector<std::uint64_t> descendants(std::uint64_t j) const;

  /// Number of edges between node j and the root
  std::size_t depth(std::uint64_t j) const;

  /// Largest child count of any node
  std::size_t max_children() const;

  /// Nested debug form, e.g. "1(0, 2)"
  std::string to_string() const;

 private:
  std::vector<TreeNode> nodes_;
  std::uint64_t root_ = 0;
};

/**
 * @brief Chain 0 - 1 - ... - (n-1) rooted at 0
 * @throws std::invalid_argument if n == 0
 */
EncodingTree linear_tree(std::uint64_t n);

/**
 * @brief Balanced binary tree: the median of each range is the subtree root
 * @throws std::invalid_argument if n == 0
 */
EncodingTree balanced_binary_tree(std::uint64_t n);

/**
 * @brief Balanced ternary tree
 *
 * The element at position len/2 becomes the subtree root; the preceding
 * elements are split into two halves and the following elements form the
 * third child.
 *
 * @throws std::invalid_argument if n == 0
 */
EncodingTree balanced_ternary_tree(std::uint64_t n);

/**
 * @brief Tree of the Fenwick (binary indexed) structure over n modes
 *
 * The parent of 1-based node k is k + lsb(k); nodes whose parent would fall
 * outside the range hang from node n. Children are ordered nearest first.
 *
 * @throws std::invalid_argument if n == 0
 */
EncodingTree fenwick_tree(std::uint64_t n);

}  // namespace encodings::data
