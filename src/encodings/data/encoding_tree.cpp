// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <encodings/data/encoding_tree.hpp>
#include <encodings/data/fenwick_tree.hpp>
#include <encodings/utils/macros.hpp>
#include <functional>
#include <stdexcept>
#include <utility>

namespace encodings::data {

namespace {

// Assemble nodes from per-node child lists; parents are derived
EncodingTree from_children(std::vector<std::vector<std::uint64_t>> children) {
  std::vector<TreeNode> nodes(children.size());
  for (std::uint64_t i = 0; i < nodes.size(); ++i) nodes[i].index = i;
  for (std::uint64_t i = 0; i < nodes.size(); ++i) {
    for (auto c : children[i]) nodes[c].parent = i;
    nodes[i].children = std::move(children[i]);
  }
  return EncodingTree(std::move(nodes));
}

void require_nonempty(std::uint64_t n, const char* shape) {
  ENCODINGS_VERIFY_INPUT(n > 0, std::string("cannot build a ") + shape +
                                    " tree with zero nodes");
}

}  // namespace

EncodingTree::EncodingTree(std::vector<TreeNode> nodes)
    : nodes_(std::move(nodes)) {
  const auto n = nodes_.size();
  ENCODINGS_VERIFY_INPUT(n > 0, "an encoding tree needs at least one node");

  std::optional<std::uint64_t> root;
  for (std::uint64_t i = 0; i < n; ++i) {
    const auto& node = nodes_[i];
    ENCODINGS_VERIFY_INPUT(node.index == i,
                           "node at position " + std::to_string(i) +
                               " carries index " + std::to_string(node.index));
    if (!node.parent) {
      ENCODINGS_VERIFY_INPUT(!root, "tree has more than one root (" +
                                        std::to_string(*root) + " and " +
                                        std::to_string(i) + ")");
      root = i;
    } else {
      const auto p = *node.parent;
      ENCODINGS_VERIFY_INPUT(p < n, "parent " + std::to_string(p) +
                                        " of node " + std::to_string(i) +
                                        " is out of range");
      const auto& siblings = nodes_[p].children;
      ENCODINGS_VERIFY_INPUT(
          std::count(siblings.begin(), siblings.end(), i) == 1,
          "node " + std::to_string(i) + " is not listed exactly once among "
              "the children of its parent " + std::to_string(p));
    }
    for (auto c : node.children) {
      ENCODINGS_VERIFY_INPUT(c < n, "child " + std::to_string(c) + " of node " +
                                        std::to_string(i) +
                                        " is out of range");
      ENCODINGS_VERIFY_INPUT(nodes_[c].parent == i,
                             "child " + std::to_string(c) + " of node " +
                                 std::to_string(i) +
                                 " does not name it as parent");
    }
  }
  ENCODINGS_VERIFY_INPUT(root.has_value(), "tree has no root");
  root_ = *root;

  // Every node must be reached from the root exactly once
  std::vector<bool> seen(n, false);
  std::vector<std::uint64_t> stack{root_};
  std::uint64_t visited = 0;
  while (!stack.empty()) {
    const auto v = stack.back();
    stack.pop_back();
    ENCODINGS_VERIFY_INPUT(!seen[v], "node " + std::to_string(v) +
                                         " is reachable more than once");
    seen[v] = true;
    ++visited;
    for (auto c : nodes_[v].children) stack.push_back(c);
  }
  ENCODINGS_VERIFY_INPUT(visited == n,
                         "tree contains a cycle or nodes detached from root " +
                             std::to_string(root_));
}

const TreeNode& EncodingTree::node(std::uint64_t j) const {
  if (j >= nodes_.size()) {
    throw std::out_of_range("tree node " + std::to_string(j) +
                            " out of range for size " +
                            std::to_string(nodes_.size()));
  }
  return nodes_[j];
}

std::vector<std::uint64_t> EncodingTree::ancestors(std::uint64_t j) const {
  std::vector<std::uint64_t> result;
  for (auto p = node(j).parent; p; p = nodes_[*p].parent) result.push_back(*p);
  return result;
}

std::vector<std::uint64_t> EncodingTree::descendants(std::uint64_t j) const {
  std::vector<std::uint64_t> result;
  std::function<void(std::uint64_t)> collect = [&](std::uint64_t v) {
    for (auto c : nodes_[v].children) {
      result.push_back(c);
      collect(c);
    }
  };
  collect(node(j).index);
  return result;
}

std::size_t EncodingTree::depth(std::uint64_t j) const {
  return ancestors(j).size();
}

std::size_t EncodingTree::max_children() const {
  std::size_t result = 0;
  for (const auto& node : nodes_) {
    result = std::max(result, node.children.size());
  }
  return result;
}

std::string EncodingTree::to_string() const {
  std::function<std::string(std::uint64_t)> render = [&](std::uint64_t v) {
    std::string s = std::to_string(v);
    const auto& children = nodes_[v].children;
    if (children.empty()) return s;
    s += "(";
    for (std::size_t i = 0; i < children.size(); ++i) {
      if (i > 0) s += ", ";
      s += render(children[i]);
    }
    return s + ")";
  };
  return render(root_);
}

EncodingTree linear_tree(std::uint64_t n) {
  require_nonempty(n, "linear");
  std::vector<std::vector<std::uint64_t>> children(n);
  for (std::uint64_t i = 0; i + 1 < n; ++i) children[i].push_back(i + 1);
  return from_children(std::move(children));
}

EncodingTree balanced_binary_tree(std::uint64_t n) {
  require_nonempty(n, "balanced binary");
  std::vector<std::vector<std::uint64_t>> children(n);
  // Returns the root of the subtree over [lo, hi)
  std::function<std::optional<std::uint64_t>(std::uint64_t, std::uint64_t)>
      build = [&](std::uint64_t lo,
                  std::uint64_t hi) -> std::optional<std::uint64_t> {
    if (lo >= hi) return std::nullopt;
    const auto mid = lo + (hi - 1 - lo) / 2;
    if (auto left = build(lo, mid)) children[mid].push_back(*left);
    if (auto right = build(mid + 1, hi)) children[mid].push_back(*right);
    return mid;
  };
  build(0, n);
  return from_children(std::move(children));
}

EncodingTree balanced_ternary_tree(std::uint64_t n) {
  require_nonempty(n, "balanced ternary");
  std::vector<std::vector<std::uint64_t>> children(n);
  // Indices are contiguous, so a subtree is the half-open range [lo, hi)
  std::function<std::optional<std::uint64_t>(std::uint64_t, std::uint64_t)>
      build = [&](std::uint64_t lo,
                  std::uint64_t hi) -> std::optional<std::uint64_t> {
    if (lo >= hi) return std::nullopt;
    const auto len = hi - lo;
    const auto root = lo + len / 2;
    const auto split = lo + (root - lo) / 2;
    const std::pair<std::uint64_t, std::uint64_t> parts[] = {
        {lo, split}, {split, root}, {root + 1, hi}};
    for (const auto& [a, b] : parts) {
      if (auto child = build(a, b)) children[root].push_back(*child);
    }
    return root;
  };
  build(0, n);
  return from_children(std::move(children));
}

EncodingTree fenwick_tree(std::uint64_t n) {
  require_nonempty(n, "Fenwick");
  std::vector<std::vector<std::uint64_t>> children(n);
  for (std::uint64_t k = 1; k < n; ++k) {
    const auto parent = k + fenwick::lsb(k);
    children[(parent <= n ? parent : n) - 1].push_back(k - 1);
  }
  for (auto& c : children) std::sort(c.rbegin(), c.rend());
  return from_children(std::move(children));
}

}  // namespace encodings::data
