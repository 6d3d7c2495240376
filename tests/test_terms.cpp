// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <encodings/data/indexed_operator.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/swap_tracking_sort.hpp>
#include <encodings/data/terms.hpp>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace encodings;
using namespace encodings::data;

namespace {

using Unit = LadderOperatorProductTerm::unit_type;

LadderOperatorProductTerm product(Complex c, std::vector<LadderOperator> ops) {
  return LadderOperatorProductTerm::from_items(c, ops);
}

}  // namespace

// C Tests

TEST(TermsTest, WeightedUnitReducesCoefficient) {
  Unit plain(make_raise(1));
  EXPECT_EQ(plain.coefficient(), Complex(1.0, 0.0));
  EXPECT_FALSE(plain.is_zero());

  Unit nan(Complex(std::numeric_limits<double>::quiet_NaN(), 0.0), make_raise(1));
  EXPECT_TRUE(nan.is_zero());
  EXPECT_EQ(nan.coefficient(), Complex(0.0, 0.0));

  EXPECT_EQ(plain.scale(2.0).coefficient(), Complex(2.0, 0.0));
  EXPECT_EQ(plain.to_string(), "(u, 1)");
  EXPECT_EQ(plain.scale(0.5).to_string(), "(0.5 (u, 1))");
}

// P Tests

TEST(TermsTest, ProductReduceFoldsUnitCoefficients) {
  LadderOperatorProductTerm p(2.0, {Unit(3.0, make_raise(0)), Unit(make_lower(1))});
  auto r = p.reduce();
  EXPECT_EQ(r.coefficient(), Complex(6.0, 0.0));
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r.units()[0].coefficient(), Complex(1.0, 0.0));
  EXPECT_EQ(r.key(), (std::vector<LadderOperator>{make_raise(0), make_lower(1)}));
}

TEST(TermsTest, ZeroPropagatesThroughProducts) {
  LadderOperatorProductTerm with_zero_unit(
      1.0, {Unit(make_raise(0)), Unit(0.0, make_lower(1))});
  EXPECT_TRUE(with_zero_unit.is_zero());
  EXPECT_EQ(with_zero_unit.reduce(), LadderOperatorProductTerm::zero());

  auto inf = std::numeric_limits<double>::infinity();
  EXPECT_TRUE(product(Complex(inf, 0.0), {make_raise(0)}).is_zero());
  EXPECT_TRUE(LadderOperatorProductTerm(std::vector<Unit>{}).reduce().is_zero());
}

TEST(TermsTest, ProductMultiplicationConcatenates) {
  auto a = product(2.0, {make_raise(0)});
  auto b = product(Complex(0.0, 1.0), {make_lower(3), make_lower(2)});
  auto ab = a * b;
  EXPECT_EQ(ab.coefficient(), Complex(0.0, 2.0));
  EXPECT_EQ(ab.key(),
            (std::vector<LadderOperator>{make_raise(0), make_lower(3), make_lower(2)}));
  // Non-commutative
  EXPECT_NE((b * a).key(), ab.key());
}

TEST(TermsTest, ProductToString) {
  EXPECT_EQ(product(1.0, {make_raise(1), make_lower(0)}).to_string(),
            "[(u, 1) | (d, 0)]");
  EXPECT_EQ(product(-1.0, {make_raise(1)}).to_string(), "-[(u, 1)]");
  EXPECT_EQ(product(2.5, {make_lower(4)}).to_string(), "2.5 [(d, 4)]");
}

// S Tests

TEST(TermsTest, SumMergesLikeTerms) {
  LadderOperatorSumExpression s(
      {product(2.0, {make_raise(0)}), product(3.0, {make_raise(0)}),
       product(1.0, {make_lower(0)})});
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s.product_terms()[0].coefficient(), Complex(5.0, 0.0));
  EXPECT_EQ(*s.coefficient_of({make_raise(0)}), Complex(5.0, 0.0));
  EXPECT_FALSE(s.coefficient_of({make_raise(1)}).has_value());
}

TEST(TermsTest, SumDropsCancelledAndZeroTerms) {
  LadderOperatorSumExpression s(
      {product(1.0, {make_raise(0)}), product(-1.0, {make_raise(0)}),
       product(0.0, {make_lower(2)})});
  EXPECT_TRUE(s.is_zero());
  EXPECT_EQ(s.to_string(), "{}");
}

TEST(TermsTest, SumWeightedConstructionDistributesCoefficient) {
  LadderOperatorSumExpression s(
      2.0, {product(1.0, {make_raise(0)}), product(0.5, {make_lower(1)})});
  EXPECT_EQ(*s.coefficient_of({make_raise(0)}), Complex(2.0, 0.0));
  EXPECT_EQ(*s.coefficient_of({make_lower(1)}), Complex(1.0, 0.0));
}

TEST(TermsTest, SumArithmetic) {
  LadderOperatorSumExpression a(
      {product(1.0, {make_raise(0)}), product(1.0, {make_raise(1)})});
  LadderOperatorSumExpression b(product(2.0, {make_lower(0)}));

  auto sum = a + b;
  EXPECT_EQ(sum.size(), 3u);

  auto prod = a * b;
  ASSERT_EQ(prod.size(), 2u);
  EXPECT_EQ(*prod.coefficient_of({make_raise(0), make_lower(0)}), Complex(2.0, 0.0));
  EXPECT_EQ(*prod.coefficient_of({make_raise(1), make_lower(0)}), Complex(2.0, 0.0));

  EXPECT_TRUE((a * LadderOperatorSumExpression()).is_zero());
}

TEST(TermsTest, SumEqualityIgnoresOrder) {
  LadderOperatorSumExpression a(
      {product(1.0, {make_raise(0)}), product(2.0, {make_raise(1)})});
  LadderOperatorSumExpression b(
      {product(2.0, {make_raise(1)}), product(1.0, {make_raise(0)})});
  LadderOperatorSumExpression c(
      {product(2.0, {make_raise(1)}), product(3.0, {make_raise(0)})});
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a == c);
}

TEST(TermsTest, SumParseRoundTrip) {
  const std::string text = "{[(u, 1) | (d, 0)]; [(I, 0)]}";
  auto parsed =
      LadderOperatorSumExpression::try_parse(text, try_parse_ladder_operator);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->size(), 2u);
  EXPECT_EQ(parsed->to_string(), text);
}

TEST(TermsTest, MalformedTextDoesNotParse) {
  const auto parse = [](const std::string& s) {
    return LadderOperatorSumExpression::try_parse(s, try_parse_ladder_operator);
  };
  EXPECT_FALSE(parse("[(u, 1)]").has_value());
  EXPECT_FALSE(parse("{[(x, 1)]}").has_value());
  EXPECT_FALSE(parse("{[(u, -1)]}").has_value());
  EXPECT_FALSE(parse("{[(u, 1)}").has_value());
  EXPECT_FALSE(parse("{[(u 1)]}").has_value());
  EXPECT_TRUE(parse("{}").has_value());
}

// Indexed operator Tests

TEST(IndexedOperatorTest, ParseLadderOperator) {
  auto op = try_parse_ladder_operator(" ( d , 12 ) ");
  ASSERT_TRUE(op.has_value());
  EXPECT_EQ(*op, make_lower(12));
  EXPECT_EQ(*try_parse_ladder_operator("(I, 0)"),
            (LadderOperator{0, LadderOperatorUnit::Identity}));
  EXPECT_FALSE(try_parse_ladder_operator("(u, )").has_value());
  EXPECT_FALSE(try_parse_ladder_operator("(u, 1x)").has_value());
  EXPECT_FALSE(try_parse_ladder_operator("u, 1").has_value());
}

TEST(IndexedOperatorTest, IndicesInOrder) {
  std::vector<LadderOperator> ascending{make_raise(0), make_raise(2), make_raise(2)};
  std::vector<LadderOperator> descending{make_lower(3), make_lower(1)};
  EXPECT_TRUE(LadderOperator::indices_in_order(IndexOrder::Ascending,
                                               ascending));
  EXPECT_FALSE(LadderOperator::indices_in_order(IndexOrder::Descending,
                                                ascending));
  EXPECT_TRUE(LadderOperator::indices_in_order(IndexOrder::Descending,
                                               descending));
  EXPECT_TRUE(LadderOperator::indices_in_order(IndexOrder::Ascending, {}));
}

TEST(IndexedOperatorTest, EqualOperatorsHashEqually) {
  std::hash<LadderOperator> h;
  EXPECT_EQ(h(make_raise(5)), h(make_raise(5)));
  EXPECT_NE(make_raise(5), make_lower(5));
}

// SwapTrackingSort Tests

TEST(SwapTrackingSortTest, TracksPermutationSign) {
  SwapTrackingSort<int, int> sorter(
      [](int a, int b) { return a <= b; },
      [](std::size_t i, int sign) { return i % 2 == 0 ? sign : -sign; });

  auto [sorted, sign] = sorter.sort(1, {3, 1, 2});
  EXPECT_EQ(sorted, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(sign, 1);

  auto [swapped, odd] = sorter.sort(1, {2, 1});
  EXPECT_EQ(swapped, (std::vector<int>{1, 2}));
  EXPECT_EQ(odd, -1);

  auto [empty, unchanged] = sorter.sort(1, {});
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(unchanged, 1);
}

TEST(SwapTrackingSortTest, TiesKeepInputOrder) {
  using Item = std::pair<int, char>;
  SwapTrackingSort<Item, std::size_t> sorter(
      [](const Item& a, const Item& b) { return a.first <= b.first; },
      [](std::size_t i, std::size_t total) { return total + i; });

  auto [sorted, moves] = sorter.sort(0, {{1, 'a'}, {0, 'b'}, {1, 'c'}});
  EXPECT_EQ(sorted, (std::vector<Item>{{0, 'b'}, {1, 'a'}, {1, 'c'}}));
  EXPECT_EQ(moves, 1u);
  EXPECT_TRUE(sorter.is_sorted(sorted));
  EXPECT_FALSE(sorter.is_sorted({{1, 'a'}, {0, 'b'}}));
}
