// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/algorithms/tree_encoding.hpp>
#include <encodings/data/index_set.hpp>
#include <encodings/utils/macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace encodings::algorithms {

namespace {

constexpr std::array<LinkLabel, 3> link_labels = {LinkLabel::X, LinkLabel::Y,
                                                  LinkLabel::Z};

const Link& link_with_label(const NodeLinks& links, LinkLabel label) {
  return links[static_cast<std::size_t>(label)];
}

// Follow the link with the given label, then Z links, down to a leg
LegId follow_to_leg(const std::vector<NodeLinks>& links, std::uint64_t start,
                    LinkLabel label) {
  const auto& first = link_with_label(links[start], label);
  if (!first.target) return {start, label};
  auto v = *first.target;
  while (const auto& next = link_with_label(links[v], LinkLabel::Z).target) {
    v = *next;
  }
  return {v, LinkLabel::Z};
}

// Label of the edge from a parent to one of its children
LinkLabel edge_label(const std::vector<NodeLinks>& links, std::uint64_t parent,
                     std::uint64_t child) {
  for (const auto& link : links[parent]) {
    if (link.target == child) return link.label;
  }
  throw std::invalid_argument("node " + std::to_string(child) +
                              " is not linked from node " +
                              std::to_string(parent));
}

}  // namespace

data::Pauli to_pauli(LinkLabel label) {
  switch (label) {
    case LinkLabel::X:
      return data::Pauli::X;
    case LinkLabel::Y:
      return data::Pauli::Y;
    case LinkLabel::Z:
      return data::Pauli::Z;
  }
  return data::Pauli::I;
}

data::EncodingScheme tree_encoding_scheme(const data::EncodingTree& tree) {
  auto shared = std::make_shared<const data::EncodingTree>(tree);

  const auto children_of = [shared](std::uint64_t j) {
    const auto& c = shared->node(j).children;
    return data::IndexSet(c.begin(), c.end());
  };

  data::EncodingScheme scheme;
  scheme.update = [shared](std::uint64_t j, std::uint64_t) {
    const auto a = shared->ancestors(j);
    return data::IndexSet(a.begin(), a.end());
  };
  scheme.parity = [shared, children_of](std::uint64_t j) {
    const auto ancestors = shared->ancestors(j);
    const data::IndexSet on_path(ancestors.begin(), ancestors.end());
    data::IndexSet remainder;
    for (auto a : ancestors) {
      for (auto c : shared->node(a).children) {
        if (c < j && !on_path.count(c)) remainder.insert(c);
      }
    }
    return data::set_union(remainder, children_of(j));
  };
  scheme.occupation = [children_of](std::uint64_t j) {
    auto result = children_of(j);
    result.insert(j);
    return result;
  };
  return scheme;
}

std::vector<NodeLinks> compute_links(const data::EncodingTree& tree) {
  std::vector<NodeLinks> result;
  result.reserve(tree.size());
  for (const auto& node : tree.nodes()) {
    ENCODINGS_VERIFY_INPUT(node.children.size() <= link_labels.size(),
                           "node " + std::to_string(node.index) + " has " +
                               std::to_string(node.children.size()) +
                               " children; the path construction allows at "
                               "most 3");
    NodeLinks links;
    for (std::size_t i = 0; i < link_labels.size(); ++i) {
      links[i].label = link_labels[i];
      if (i < node.children.size()) links[i].target = node.children[i];
    }
    result.push_back(links);
  }
  return result;
}

std::vector<LegId> all_legs(const std::vector<NodeLinks>& links) {
  std::vector<LegId> result;
  for (std::uint64_t u = 0; u < links.size(); ++u) {
    for (const auto& link : links[u]) {
      if (!link.target) result.push_back({u, link.label});
    }
  }
  return result;
}

std::vector<std::pair<LegId, LegId>> pair_legs(
    const data::EncodingTree& tree, const std::vector<NodeLinks>& links) {
  std::vector<std::pair<LegId, LegId>> result;
  result.reserve(tree.size());
  for (std::uint64_t u = 0; u < tree.size(); ++u) {
    result.emplace_back(follow_to_leg(links, u, LinkLabel::X),
                        follow_to_leg(links, u, LinkLabel::Y));
  }
  return result;
}

data::PauliRegister majorana_string_for_leg(const data::EncodingTree& tree,
                                            const std::vector<NodeLinks>& links,
                                            const LegId& leg, std::uint64_t n) {
  auto reg = data::PauliRegister(n);
  auto child = leg.node;
  for (auto parent : tree.ancestors(leg.node)) {
    reg = reg.with_operator_at(parent,
                               to_pauli(edge_label(links, parent, child)));
    child = parent;
  }
  return reg.with_operator_at(leg.node, to_pauli(leg.label));
}

data::PauliRegisterSequence encode_with_ternary_tree(
    const data::EncodingTree& tree, data::LadderOperatorUnit op,
    std::uint64_t j, std::uint64_t n) {
  if (op == data::LadderOperatorUnit::Identity || j >= n) {
    return data::PauliRegisterSequence();
  }
  ENCODINGS_VERIFY_INPUT(tree.size() == n,
                         "tree has " + std::to_string(tree.size()) +
                             " nodes but the register has " +
                             std::to_string(n) + " qubits");
  const auto links = compute_links(tree);
  const auto [sx, sy] = pair_legs(tree, links)[j];
  const Complex d_coefficient = op == data::LadderOperatorUnit::Raise
                                    ? Complex(0.0, -0.5)
                                    : Complex(0.0, 0.5);
  return data::PauliRegisterSequence(std::vector<data::PauliRegister>{
      majorana_string_for_leg(tree, links, sx, n).reset_phase({0.5, 0.0}),
      majorana_string_for_leg(tree, links, sy, n).reset_phase(d_coefficient)});
}

data::PauliRegisterSequence balanced_binary_tree_terms(
    data::LadderOperatorUnit op, std::uint64_t j, std::uint64_t n) {
  if (op == data::LadderOperatorUnit::Identity || j >= n) {
    return data::PauliRegisterSequence();
  }
  return encode_with_ternary_tree(data::balanced_binary_tree(n), op, j, n);
}

data::PauliRegisterSequence ternary_tree_terms(data::LadderOperatorUnit op,
                                               std::uint64_t j,
                                               std::uint64_t n) {
  if (op == data::LadderOperatorUnit::Identity || j >= n) {
    return data::PauliRegisterSequence();
  }
  return encode_with_ternary_tree(data::balanced_ternary_tree(n), op, j, n);
}

}  // namespace encodings::algorithms
