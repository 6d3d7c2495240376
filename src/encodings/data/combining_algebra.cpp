// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/data/combining_algebra.hpp>
#include <encodings/utils/macros.hpp>
#include <utility>
#include <vector>

namespace encodings::data {

void CombineResult::push_back(LadderOperatorProductTerm term) {
  ENCODINGS_VERIFY(size_ < terms_.size());
  terms_[size_++] = std::move(term);
}

CombineResult CombiningAlgebra::combine(
    const LadderOperatorProductTerm& product,
    const LadderOperatorProductTerm::unit_type& next) const {
  using unit_type = LadderOperatorProductTerm::unit_type;

  CombineResult raw;
  const auto& units = product.units();
  const auto& n = next.item();

  if (units.empty()) {
    raw.push_back(LadderOperatorProductTerm(product.coefficient(), {next}));
  } else {
    const auto& last = units.back();
    const auto& l = last.item();
    if (l.op == LadderOperatorUnit::Lower && n.op == LadderOperatorUnit::Raise) {
      std::vector<unit_type> prefix_units(units.begin(), units.end() - 1);
      if (prefix_units.empty()) {
        prefix_units.emplace_back(
            LadderOperator{0, LadderOperatorUnit::Identity});
      }
      raw = _exchange(
          LadderOperatorProductTerm(product.coefficient(), prefix_units), last,
          next);
      // Algebra limitation: exchanging operators on different modes must not
      // branch.
      if (l.index != n.index) {
        ENCODINGS_VERIFY(raw.size() == 1);
      }
    } else if (excludes_repeated_modes() && l.op == n.op &&
               l.op != LadderOperatorUnit::Identity && l.index == n.index) {
      return raw;
    } else {
      raw.push_back(product.append(next));
    }
  }

  CombineResult result;
  for (const auto& term : raw) {
    result.push_back(strip_identity_padding(term));
  }
  return result;
}

Complex FermionicAlgebra::swap_phase(std::size_t swaps) const {
  return utils::swap_sign_multiple(swaps, Complex(1.0, 0.0));
}

CombineResult FermionicAlgebra::_exchange(
    const LadderOperatorProductTerm& prefix,
    const LadderOperatorProductTerm::unit_type& last,
    const LadderOperatorProductTerm::unit_type& next) const {
  CombineResult result;
  result.push_back(prefix.append(next.scale(-1.0)).append(last));
  if (last.item().index == next.item().index) {
    result.push_back(prefix);
  }
  return result;
}

Complex BosonicAlgebra::swap_phase(std::size_t) const {
  return Complex(1.0, 0.0);
}

CombineResult BosonicAlgebra::_exchange(
    const LadderOperatorProductTerm& prefix,
    const LadderOperatorProductTerm::unit_type& last,
    const LadderOperatorProductTerm::unit_type& next) const {
  CombineResult result;
  result.push_back(prefix.append(next).append(last));
  if (last.item().index == next.item().index) {
    result.push_back(prefix);
  }
  return result;
}

}  // namespace encodings::data
