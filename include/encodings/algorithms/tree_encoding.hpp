// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <array>
#include <cstdint>
#include <encodings/data/encoding_scheme.hpp>
#include <encodings/data/encoding_tree.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/pauli_register.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace encodings::algorithms {

/**
 * @brief Label of one of the three links descending from a tree node
 */
enum class LinkLabel : std::uint8_t { X, Y, Z };

/// The Pauli operator a link label stands for
data::Pauli to_pauli(LinkLabel label);

/**
 * @brief A descending link: an edge to a child, or a leg when target is empty
 */
struct Link {
  LinkLabel label;
  std::optional<std::uint64_t> target;

  bool operator==(const Link& other) const = default;
};

/// The three links of a node, in X, Y, Z order
using NodeLinks = std::array<Link, 3>;

/**
 * @brief A leg: the dangling link with the given label at a node
 */
struct LegId {
  std::uint64_t node;
  LinkLabel label;

  bool operator==(const LegId& other) const = default;
};

/**
 * @brief Index-set scheme read off a tree
 *
 * update = ancestors, parity = remainder ∪ children, occupation = {j} ∪
 * children, where the remainder of j collects the children of j's ancestors
 * that have a smaller index and are not ancestors themselves. Only
 * Fenwick-shaped trees give a valid encoding this way; use
 * encode_with_ternary_tree for general trees.
 *
 * @param tree Tree to derive the sets from; copied into the scheme
 */
data::EncodingScheme tree_encoding_scheme(const data::EncodingTree& tree);

/**
 * @brief Label the three descending links of every node
 *
 * The first k labels of a node with k children are edges to the children in
 * order; the remaining labels are legs.
 *
 * @return Links indexed by node
 * @throws std::invalid_argument if a node has more than three children
 */
std::vector<NodeLinks> compute_links(const data::EncodingTree& tree);

/**
 * @brief Every leg of the tree, by node then label
 *
 * A tree on n nodes has 2n + 1 legs.
 */
std::vector<LegId> all_legs(const std::vector<NodeLinks>& links);

/**
 * @brief The two Majorana legs of every node
 *
 * For node u, s_x(u) (resp. s_y(u)) follows u's X (resp. Y) link and then
 * Z links downward until a leg is reached. The one leg left unpaired is the
 * end of the root's Z chain.
 *
 * @return (s_x, s_y) indexed by node
 */
std::vector<std::pair<LegId, LegId>> pair_legs(
    const data::EncodingTree& tree, const std::vector<NodeLinks>& links);

/**
 * @brief Pauli string of a leg
 *
 * Each ancestor of the leg's node carries the label of the edge leading
 * towards it, the node carries the leg's own label, and every other qubit is
 * the identity.
 *
 * @param n Number of qubits
 */
data::PauliRegister majorana_string_for_leg(const data::EncodingTree& tree,
                                            const std::vector<NodeLinks>& links,
                                            const LegId& leg, std::uint64_t n);

/**
 * @brief Encode a ladder operator with the path-based tree construction
 *
 * a†_j = ½(S_x - i S_y) and a_j = ½(S_x + i S_y) with S_x, S_y the strings of
 * the legs paired to node j. Valid for any tree with at most three children
 * per node.
 *
 * @return Two-term sequence, or the empty sequence for Identity or j >= n
 * @throws std::invalid_argument if a node has more than three children
 */
data::PauliRegisterSequence encode_with_ternary_tree(
    const data::EncodingTree& tree, data::LadderOperatorUnit op,
    std::uint64_t j, std::uint64_t n);

/// Path-based encoder on balanced_binary_tree(n), weight O(log2 n)
data::PauliRegisterSequence balanced_binary_tree_terms(
    data::LadderOperatorUnit op, std::uint64_t j, std::uint64_t n);

/// Path-based encoder on balanced_ternary_tree(n), weight O(log3 n)
data::PauliRegisterSequence ternary_tree_terms(data::LadderOperatorUnit op,
                                               std::uint64_t j,
                                               std::uint64_t n);

}  // namespace encodings::algorithms
