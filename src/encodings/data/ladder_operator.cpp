// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/data/ladder_operator.hpp>
#include <vector>

namespace encodings::data {

std::string to_string(LadderOperatorUnit unit) {
  switch (unit) {
    case LadderOperatorUnit::Identity:
      return "I";
    case LadderOperatorUnit::Raise:
      return "u";
    case LadderOperatorUnit::Lower:
      return "d";
  }
  return "?";
}

std::ostream& operator<<(std::ostream& os, LadderOperatorUnit unit) {
  return os << to_string(unit);
}

std::optional<LadderOperatorUnit> parse_ladder_operator_unit(
    std::string_view token) {
  if (token == "I") return LadderOperatorUnit::Identity;
  if (token == "u") return LadderOperatorUnit::Raise;
  if (token == "d") return LadderOperatorUnit::Lower;
  return std::nullopt;
}

std::optional<LadderOperator> try_parse_ladder_operator(std::string_view s) {
  return try_parse_ix_op<std::uint64_t, LadderOperatorUnit>(
      s, parse_ladder_operator_unit);
}

bool is_in_normal_order(const LadderOperatorProductTerm& term) {
  bool previous_is_lower = false;
  for (const auto& u : term.units()) {
    switch (u.item().op) {
      case LadderOperatorUnit::Identity:
        break;
      case LadderOperatorUnit::Raise:
        if (previous_is_lower) return false;
        break;
      case LadderOperatorUnit::Lower:
        previous_is_lower = true;
        break;
    }
  }
  return true;
}

bool is_in_index_order(const LadderOperatorProductTerm& term) {
  if (!is_in_normal_order(term)) return false;
  std::vector<LadderOperator> raises;
  std::vector<LadderOperator> lowers;
  for (const auto& u : term.units()) {
    if (u.item().op == LadderOperatorUnit::Raise) raises.push_back(u.item());
    if (u.item().op == LadderOperatorUnit::Lower) lowers.push_back(u.item());
  }
  return LadderOperator::indices_in_order(IndexOrder::Ascending, raises) &&
         LadderOperator::indices_in_order(IndexOrder::Descending, lowers);
}

LadderOperatorProductTerm strip_identity_padding(
    const LadderOperatorProductTerm& term) {
  std::vector<LadderOperatorProductTerm::unit_type> units;
  Complex coefficient = term.coefficient();
  for (const auto& u : term.units()) {
    if (u.item().op == LadderOperatorUnit::Identity) {
      coefficient *= u.coefficient();
    } else {
      units.push_back(u);
    }
  }
  if (units.empty()) {
    units.emplace_back(LadderOperator{0, LadderOperatorUnit::Identity});
  }
  return LadderOperatorProductTerm(coefficient, std::move(units));
}

}  // namespace encodings::data
