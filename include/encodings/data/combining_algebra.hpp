// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <array>
#include <cstddef>
#include <encodings/data/ladder_operator.hpp>
#include <string>

namespace encodings::data {

/**
 * @brief Result of inserting one unit into a normal-ordered product.
 *
 * Holds zero, one or two product terms without heap allocation of its own.
 */
class CombineResult {
 public:
  CombineResult() = default;

  /// Append a term; at most two terms fit
  void push_back(LadderOperatorProductTerm term);

  std::size_t size() const { return size_; }

  bool empty() const { return size_ == 0; }

  const LadderOperatorProductTerm& operator[](std::size_t i) const {
    return terms_[i];
  }

  const LadderOperatorProductTerm* begin() const { return terms_.data(); }

  const LadderOperatorProductTerm* end() const { return terms_.data() + size_; }

 private:
  std::array<LadderOperatorProductTerm, 2> terms_;
  std::size_t size_ = 0;
};

/**
 * @brief Statistics of a ladder-operator algebra.
 *
 * An algebra knows how to insert the next unit at the right end of a product
 * whose existing units are already normal ordered, resolving the single
 * adjacent transposition this may require through the algebra's
 * (anti)commutation relation.
 *
 * combine() enforces the algebra limitation shared by every implementation:
 * exchanging two operators on different modes yields exactly one term.
 */
class CombiningAlgebra {
 public:
  virtual ~CombiningAlgebra() = default;

  /**
   * @brief Insert a unit at the right end of a product
   *
   * Identity padding is stripped from every resulting term.
   *
   * @param product Product to extend; its coefficient carries through
   * @param next Unit to insert
   * @return Zero, one or two resulting product terms
   */
  CombineResult combine(const LadderOperatorProductTerm& product,
                        const LadderOperatorProductTerm::unit_type& next) const;

  /**
   * @brief Phase incurred by `swaps` adjacent transpositions of operators of
   * the same kind
   */
  virtual Complex swap_phase(std::size_t swaps) const = 0;

  /**
   * @brief Whether two equal operators on the same mode annihilate
   *
   * combine() only sees adjacent units, so a repeat separated by other
   * operators (a†_0 a†_1 a†_0) survives normal ordering and vanishes once
   * index ordering brings the pair together.
   */
  virtual bool excludes_repeated_modes() const = 0;

  /// Name of the algebra for diagnostics
  virtual std::string name() const = 0;

 protected:
  /**
   * @brief Exchange a trailing Lower with an incoming Raise
   *
   * @param prefix Units preceding the trailing Lower, padded with Identity
   * when empty
   * @param last The trailing Lower unit
   * @param next The incoming Raise unit
   * @return The reordered term(s)
   */
  virtual CombineResult _exchange(
      const LadderOperatorProductTerm& prefix,
      const LadderOperatorProductTerm::unit_type& last,
      const LadderOperatorProductTerm::unit_type& next) const = 0;
};

/**
 * @brief Canonical anti-commutation relations (fermions).
 *
 * a_k a†_j = -a†_j a_k + δ_jk, and a†_j a†_j = a_j a_j = 0.
 */
class FermionicAlgebra : public CombiningAlgebra {
 public:
  Complex swap_phase(std::size_t swaps) const override;
  bool excludes_repeated_modes() const override { return true; }
  std::string name() const override { return "fermionic"; }

 protected:
  CombineResult _exchange(
      const LadderOperatorProductTerm& prefix,
      const LadderOperatorProductTerm::unit_type& last,
      const LadderOperatorProductTerm::unit_type& next) const override;
};

/**
 * @brief Canonical commutation relations (bosons).
 *
 * a_k a†_j = a†_j a_k + δ_jk.
 */
class BosonicAlgebra : public CombiningAlgebra {
 public:
  Complex swap_phase(std::size_t swaps) const override;
  bool excludes_repeated_modes() const override { return false; }
  std::string name() const override { return "bosonic"; }

 protected:
  CombineResult _exchange(
      const LadderOperatorProductTerm& prefix,
      const LadderOperatorProductTerm::unit_type& last,
      const LadderOperatorProductTerm::unit_type& next) const override;
};

}  // namespace encodings::data
