// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstddef>
#include <encodings/data/combining_algebra.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/swap_tracking_sort.hpp>
#include <encodings/utils/logger.hpp>
#include <encodings/utils/macros.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace encodings::data {

/**
 * @brief A default-constructible combining algebra
 */
template <typename Algebra>
concept CombiningAlgebraType = std::derived_from<Algebra, CombiningAlgebra> &&
                               std::default_initializable<Algebra>;

/**
 * @brief A sum of ladder-operator products tied to a statistics.
 *
 * Wraps a canonical LadderOperatorSumExpression and adds the normal-ordering
 * and index-ordering constructions of the chosen algebra. Every product term
 * is stored without redundant Identity padding.
 *
 * @tparam Algebra FermionicAlgebra or BosonicAlgebra
 */
template <CombiningAlgebraType Algebra>
class LadderOperatorSumExpr {
 public:
  /**
   * @brief Wrap a sum expression as-is (no reordering)
   */
  explicit LadderOperatorSumExpr(const LadderOperatorSumExpression& expr)
      : expr_(canonicalize_(expr)) {}

  /**
   * @brief Parse the debug form "{[(u, 1) | (d, 0)]; ...}"
   * @return The parsed expression, or std::nullopt if malformed
   */
  static std::optional<LadderOperatorSumExpr> try_parse(std::string_view s) {
    auto parsed =
        LadderOperatorSumExpression::try_parse(s, try_parse_ladder_operator);
    if (!parsed) return std::nullopt;
    return LadderOperatorSumExpr(*parsed);
  }

  const LadderOperatorSumExpression& expression() const { return expr_; }

  const std::vector<LadderOperatorProductTerm>& product_terms() const {
    return expr_.product_terms();
  }

  bool all_terms_normal_ordered() const {
    for (const auto& t : product_terms()) {
      if (!is_in_normal_order(t)) return false;
    }
    return true;
  }

  bool all_terms_index_ordered() const {
    for (const auto& t : product_terms()) {
      if (!is_in_index_order(t)) return false;
    }
    return true;
  }

  LadderOperatorSumExpr operator+(const LadderOperatorSumExpr& other) const {
    return LadderOperatorSumExpr(expr_ + other.expr_);
  }

  LadderOperatorSumExpr operator*(const LadderOperatorSumExpr& other) const {
    return LadderOperatorSumExpr(expr_ * other.expr_);
  }

  bool operator==(const LadderOperatorSumExpr& other) const {
    return expr_ == other.expr_;
  }

  std::string to_string() const { return expr_.to_string(); }

  /**
   * @brief Rewrite a sum so that every product is normal ordered
   *
   * Every unit of every product is folded through the algebra's combine(),
   * recursing on any intermediate product that is not yet normal ordered.
   * Like terms are merged and vanishing terms dropped. An expression that is
   * already normal ordered is returned unchanged.
   *
   * @param candidate Expression to reorder
   * @return The normal-ordered expression, or std::nullopt if the recursion
   * cannot terminate
   */
  static std::optional<LadderOperatorSumExpr> construct_normal_ordered(
      const LadderOperatorSumExpression& candidate) {
    ENCODINGS_LOG_TRACE_ENTERING();
    return normal_order_(candidate, 0);
  }

  /**
   * @brief Rewrite a sum into normal order with sorted mode indices
   *
   * Normal orders first if needed, then sorts the Raise operators of each
   * product by ascending and the Lower operators by descending index,
   * accumulating the algebra's exchange phase. Fermionic products that repeat
   * a creation or annihilation mode vanish even if already sorted.
   *
   * @param candidate Expression to reorder
   * @return The index-ordered expression, or std::nullopt if normal ordering
   * failed
   */
  static std::optional<LadderOperatorSumExpr> construct_index_ordered(
      const LadderOperatorSumExpression& candidate) {
    ENCODINGS_LOG_TRACE_ENTERING();
    LadderOperatorSumExpr sum(candidate);
    if (sum.all_terms_normal_ordered()) {
      std::vector<LadderOperatorProductTerm> terms;
      terms.reserve(sum.product_terms().size());
      for (const auto& t : sum.product_terms()) {
        terms.push_back(to_index_order(t));
      }
      return LadderOperatorSumExpr(LadderOperatorSumExpression(terms));
    }
    auto normal = normal_order_(sum.expr_, 0);
    if (!normal) return std::nullopt;
    return construct_index_ordered(normal->expr_);
  }

  /**
   * @brief Sort the operators of one normal-ordered product by index
   *
   * @param term Normal-ordered product
   * @return The sorted product, scaled by the exchange phase; zero if the
   * algebra forbids the repeated mode it contains
   * @throws std::invalid_argument if the product is not normal ordered
   */
  static LadderOperatorProductTerm to_index_order(
      const LadderOperatorProductTerm& term) {
    ENCODINGS_VERIFY_INPUT(is_in_normal_order(term),
                           "index ordering requires a normal-ordered product: " +
                               term.to_string());
    auto reduced = strip_identity_padding(term.reduce());
    if (reduced.is_zero()) return LadderOperatorProductTerm::zero();

    std::vector<LadderOperator> raises;
    std::vector<LadderOperator> lowers;
    for (const auto& u : reduced.units()) {
      if (u.item().op == LadderOperatorUnit::Raise) raises.push_back(u.item());
      if (u.item().op == LadderOperatorUnit::Lower) lowers.push_back(u.item());
    }
    if (raises.empty() && lowers.empty()) return reduced;

    const auto track = [](std::size_t swaps, const Complex& phase) {
      return phase * algebra_().swap_phase(swaps);
    };
    SwapTrackingSort<LadderOperator, Complex> raise_sort(
        [](const LadderOperator& a, const LadderOperator& b) {
          return a.index <= b.index;
        },
        track);
    SwapTrackingSort<LadderOperator, Complex> lower_sort(
        [](const LadderOperator& a, const LadderOperator& b) {
          return a.index >= b.index;
        },
        track);

    auto [sorted_raises, raise_phase] =
        raise_sort.sort(Complex(1.0, 0.0), std::move(raises));
    auto [sorted_lowers, lower_phase] =
        lower_sort.sort(Complex(1.0, 0.0), std::move(lowers));

    if (algebra_().excludes_repeated_modes() &&
        (has_repeated_mode_(sorted_raises) ||
         has_repeated_mode_(sorted_lowers))) {
      return LadderOperatorProductTerm::zero();
    }

    std::vector<LadderOperator> items = std::move(sorted_raises);
    items.insert(items.end(), sorted_lowers.begin(), sorted_lowers.end());
    return LadderOperatorProductTerm::from_items(
        reduced.coefficient() * raise_phase * lower_phase, items);
  }

 private:
  /// Recursion bound for normal ordering; far above any term arity in use
  static constexpr std::size_t max_recursion_depth = 256;

  static const Algebra& algebra_() {
    static const Algebra instance{};
    return instance;
  }

  static LadderOperatorSumExpression canonicalize_(
      const LadderOperatorSumExpression& expr) {
    std::vector<LadderOperatorProductTerm> terms;
    terms.reserve(expr.size());
    for (const auto& t : expr.product_terms()) {
      terms.push_back(strip_identity_padding(t));
    }
    return LadderOperatorSumExpression(terms);
  }

  static bool has_repeated_mode_(const std::vector<LadderOperator>& sorted) {
    for (std::size_t i = 1; i < sorted.size(); ++i) {
      if (sorted[i - 1].index == sorted[i].index) return true;
    }
    return false;
  }

  static std::optional<LadderOperatorSumExpr> normal_order_(
      const LadderOperatorSumExpression& candidate, std::size_t depth) {
    if (depth > max_recursion_depth) {
      ENCODINGS_LOGGER().error(
          "Normal ordering under the {} algebra did not terminate for {}",
          algebra_().name(), candidate.to_string());
      return std::nullopt;
    }
    LadderOperatorSumExpr sum(candidate);
    if (sum.all_terms_normal_ordered()) return sum;

    std::vector<LadderOperatorProductTerm> collected;
    for (const auto& term : sum.product_terms()) {
      auto ordered = normal_order_product_(term, depth);
      if (!ordered) return std::nullopt;
      collected.insert(collected.end(), ordered->begin(), ordered->end());
    }
    return LadderOperatorSumExpr(LadderOperatorSumExpression(collected));
  }

  static std::optional<std::vector<LadderOperatorProductTerm>>
  normal_order_product_(const LadderOperatorProductTerm& term,
                        std::size_t depth) {
    auto reduced = term.reduce();
    std::vector<LadderOperatorProductTerm> result;
    if (reduced.is_zero()) return result;

    const auto& units = reduced.units();
    result.emplace_back(reduced.coefficient(),
                        std::vector<LadderOperatorProductTerm::unit_type>{
                            units.front()});
    for (std::size_t i = 1; i < units.size(); ++i) {
      std::vector<LadderOperatorProductTerm> next_result;
      for (const auto& partial : result) {
        auto combined = algebra_().combine(partial, units[i]);
        auto ordered = normal_order_(
            LadderOperatorSumExpression(std::vector<LadderOperatorProductTerm>(
                combined.begin(), combined.end())),
            depth + 1);
        if (!ordered) return std::nullopt;
        next_result.insert(next_result.end(), ordered->product_terms().begin(),
                           ordered->product_terms().end());
      }
      result = std::move(next_result);
    }
    return result;
  }

  LadderOperatorSumExpression expr_;
};

/// Sum of fermionic ladder-operator products
using FermionicLadderSum = LadderOperatorSumExpr<FermionicAlgebra>;

/// Sum of bosonic ladder-operator products
using BosonicLadderSum = LadderOperatorSumExpr<BosonicAlgebra>;

}  // namespace encodings::data
