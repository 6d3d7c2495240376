// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <encodings/algorithms/majorana_encoding.hpp>
#include <encodings/algorithms/tree_encoding.hpp>
#include <encodings/data/encoding_tree.hpp>
#include <encodings/data/fenwick_tree.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace encodings;
using namespace encodings::algorithms;
using namespace encodings::data;

namespace {

EncoderFn path_encoder(const EncodingTree& tree) {
  return [tree](LadderOperatorUnit op, std::uint64_t j, std::uint64_t n) {
    return encode_with_ternary_tree(tree, op, j, n);
  };
}

std::size_t ceil_log(double base, std::uint64_t n) {
  return static_cast<std::size_t>(
      std::ceil(std::log(static_cast<double>(n)) / std::log(base) - 1e-9));
}

}  // namespace

TEST(TreeEncodingTest, LinkLabels) {
  EXPECT_EQ(to_pauli(LinkLabel::X), Pauli::X);
  EXPECT_EQ(to_pauli(LinkLabel::Y), Pauli::Y);
  EXPECT_EQ(to_pauli(LinkLabel::Z), Pauli::Z);

  auto links = compute_links(balanced_binary_tree(3));
  ASSERT_EQ(links.size(), 3u);
  EXPECT_EQ(links[1][0], (Link{LinkLabel::X, 0}));
  EXPECT_EQ(links[1][1], (Link{LinkLabel::Y, 2}));
  EXPECT_EQ(links[1][2], (Link{LinkLabel::Z, std::nullopt}));
  EXPECT_FALSE(links[0][0].target.has_value());
}

TEST(TreeEncodingTest, LegCount) {
  for (std::uint64_t n : {1u, 2u, 5u, 8u, 13u}) {
    EXPECT_EQ(all_legs(compute_links(balanced_ternary_tree(n))).size(),
              2 * n + 1);
    EXPECT_EQ(all_legs(compute_links(linear_tree(n))).size(), 2 * n + 1);
  }
}

TEST(TreeEncodingTest, PairedLegsLeaveRootZChain) {
  auto tree = balanced_ternary_tree(7);
  auto links = compute_links(tree);
  auto pairs = pair_legs(tree, links);
  ASSERT_EQ(pairs.size(), 7u);

  std::vector<LegId> paired;
  for (const auto& [sx, sy] : pairs) {
    paired.push_back(sx);
    paired.push_back(sy);
  }
  std::vector<LegId> unpaired;
  for (const auto& leg : all_legs(links)) {
    const auto count = std::count(paired.begin(), paired.end(), leg);
    EXPECT_LE(count, 1);
    if (count == 0) unpaired.push_back(leg);
  }
  ASSERT_EQ(unpaired.size(), 1u);
  EXPECT_EQ(unpaired.front(), (LegId{5, LinkLabel::Z}));
}

TEST(TreeEncodingTest, LinearTreeStrings) {
  auto tree = linear_tree(3);
  auto links = compute_links(tree);
  auto pairs = pair_legs(tree, links);
  EXPECT_EQ(pairs[0].first, (LegId{1, LinkLabel::Z}));
  EXPECT_EQ(pairs[0].second, (LegId{0, LinkLabel::Y}));
  EXPECT_EQ(majorana_string_for_leg(tree, links, {2, LinkLabel::Y}, 3),
            PauliRegister("XXY"));
  EXPECT_EQ(majorana_string_for_leg(tree, links, {1, LinkLabel::Z}, 3),
            PauliRegister("XZI"));

  EXPECT_EQ(encode_with_ternary_tree(tree, LadderOperatorUnit::Raise, 0, 3),
            PauliRegisterSequence(std::vector<PauliRegister>{
                PauliRegister("XZI", 0.5),
                PauliRegister("YII", Complex(0.0, -0.5))}));
}

TEST(TreeEncodingTest, AnticommutationRelations) {
  EXPECT_EQ(testing::check_anticommutation(balanced_binary_tree_terms, 6), "");
  EXPECT_EQ(testing::check_anticommutation(ternary_tree_terms, 6), "");
  EXPECT_EQ(testing::check_anticommutation(ternary_tree_terms, 9), "");
  EXPECT_EQ(testing::check_anticommutation(path_encoder(linear_tree(5)), 5),
            "");
  EXPECT_EQ(testing::check_anticommutation(path_encoder(fenwick_tree(4)), 4),
            "");
  EXPECT_EQ(testing::check_anticommutation(path_encoder(fenwick_tree(8)), 8),
            "");
}

TEST(TreeEncodingTest, LogarithmicWeights) {
  for (std::uint64_t n : {4u, 8u, 16u, 24u}) {
    EXPECT_LE(testing::max_raise_weight(ternary_tree_terms, n),
              ceil_log(3.0, n) + 2)
        << "n = " << n;
    EXPECT_LE(testing::max_raise_weight(balanced_binary_tree_terms, n),
              ceil_log(2.0, n) + 1)
        << "n = " << n;
  }
  EXPECT_EQ(testing::max_raise_weight(ternary_tree_terms, 16), 4u);
  EXPECT_EQ(testing::max_raise_weight(balanced_binary_tree_terms, 16), 5u);
}

// Weight ordering of the built-in encoders over system sizes
class EncodingWeightTest : public ::testing::TestWithParam<std::uint64_t> {};

TEST_P(EncodingWeightTest, TreeEncodingsAreNoHeavierThanJordanWigner) {
  const std::uint64_t n = GetParam();
  const auto jw = testing::max_raise_weight(jordan_wigner_terms, n);
  const auto bk = testing::max_raise_weight(bravyi_kitaev_terms, n);
  const auto binary = testing::max_raise_weight(balanced_binary_tree_terms, n);
  const auto ternary = testing::max_raise_weight(ternary_tree_terms, n);

  EXPECT_EQ(jw, n);
  EXPECT_LE(ternary, binary);
  EXPECT_LE(binary, jw);
  EXPECT_LE(bk, ceil_log(2.0, n) + 1);
  EXPECT_LE(binary, ceil_log(2.0, n) + 1);
  EXPECT_LE(ternary, ceil_log(3.0, n) + 2);
}

INSTANTIATE_TEST_SUITE_P(
    SystemSizes, EncodingWeightTest,
    ::testing::Values<std::uint64_t>(4, 8, 16, 24),
    [](const ::testing::TestParamInfo<std::uint64_t>& info) {
      return "n" + std::to_string(info.param);
    });

TEST(TreeEncodingTest, FenwickTreeSchemeIsBravyiKitaev) {
  for (std::uint64_t n : {2u, 4u, 8u}) {
    const auto scheme = tree_encoding_scheme(fenwick_tree(n));
    for (std::uint64_t j = 0; j < n; ++j) {
      EXPECT_EQ(scheme.update(j, n), fenwick::update_set(j, n));
      EXPECT_EQ(scheme.parity(j), fenwick::parity_set(j));
      EXPECT_EQ(scheme.occupation(j), fenwick::occupation_set(j));
      EXPECT_EQ(encode_operator(scheme, LadderOperatorUnit::Raise, j, n),
                bravyi_kitaev_terms(LadderOperatorUnit::Raise, j, n));
    }
  }
}

TEST(TreeEncodingTest, InvalidTrees) {
  // A 16-node Fenwick tree has a node with four children
  EXPECT_THROW(compute_links(fenwick_tree(16)), std::invalid_argument);
  EXPECT_THROW(encode_with_ternary_tree(fenwick_tree(16),
                                        LadderOperatorUnit::Raise, 0, 16),
               std::invalid_argument);
  EXPECT_THROW(encode_with_ternary_tree(fenwick_tree(4),
                                        LadderOperatorUnit::Raise, 0, 5),
               std::invalid_argument);
  EXPECT_TRUE(encode_with_ternary_tree(fenwick_tree(4),
                                       LadderOperatorUnit::Identity, 0, 5)
                  .empty());
}
