// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/data/indexed_operator.hpp>
#include <encodings/data/terms.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace encodings::data {

/**
 * @brief Creation/annihilation operator on an implicit mode.
 *
 * Debug tokens are "I" (Identity), "u" (Raise, a†) and "d" (Lower, a).
 * Identity is the multiplicative unit used to pad otherwise empty products.
 */
enum class LadderOperatorUnit : std::uint8_t { Identity, Raise, Lower };

/// A ladder operator acting on a specific mode
using LadderOperator = IxOp<std::uint64_t, LadderOperatorUnit>;

/// Weighted ordered product of ladder operators
using LadderOperatorProductTerm = P<LadderOperator>;

/// Canonical sum of ladder-operator products
using LadderOperatorSumExpression = S<LadderOperator>;

/**
 * @brief Debug token of a ladder operator unit
 */
std::string to_string(LadderOperatorUnit unit);

std::ostream& operator<<(std::ostream& os, LadderOperatorUnit unit);

/**
 * @brief Parse a debug token ("I", "u" or "d")
 * @return The unit, or std::nullopt for any other token
 */
std::optional<LadderOperatorUnit> parse_ladder_operator_unit(
    std::string_view token);

/**
 * @brief Parse "(op, index)" into a ladder operator
 */
std::optional<LadderOperator> try_parse_ladder_operator(std::string_view s);

/**
 * @brief Construct a creation operator a†_index
 */
inline LadderOperator make_raise(std::uint64_t index) {
  return {index, LadderOperatorUnit::Raise};
}

/**
 * @brief Construct an annihilation operator a_index
 */
inline LadderOperator make_lower(std::uint64_t index) {
  return {index, LadderOperatorUnit::Lower};
}

/**
 * @brief Whether all creation operators precede all annihilation operators
 *
 * True iff no Lower is immediately followed by a Raise once Identity units,
 * which commute with everything, are skipped.
 */
bool is_in_normal_order(const LadderOperatorProductTerm& term);

/**
 * @brief Whether a product is normal ordered and sorted by index
 *
 * Additionally requires the Raise indices to be ascending and the Lower
 * indices descending.
 */
bool is_in_index_order(const LadderOperatorProductTerm& term);

/**
 * @brief Remove Identity units from a product that has ladder operators
 *
 * A product made only of Identity units collapses to the single unit
 * `(I, 0)` so that it keeps a canonical key.
 *
 * @param term Product to canonicalize
 * @return Equivalent product without redundant Identity padding
 */
LadderOperatorProductTerm strip_identity_padding(
    const LadderOperatorProductTerm& term);

}  // namespace encodings::data
