// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <cstdint>
#include <encodings/algorithms/encoder.hpp>
#include <encodings/algorithms/hamiltonian.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/pauli_register.hpp>
#include <map>
#include <string>
#include <vector>

namespace testing {

/// @brief Tolerance for Pauli coefficients assembled from integrals
inline static constexpr double coefficient_tolerance = 1e-12;

/// @brief Tolerance for dense eigenvalues
inline static constexpr double eigenvalue_tolerance = 1e-8;

/// @brief Threshold below which assembled Pauli terms count as cancelled
inline static constexpr double cancellation_threshold = 1e-12;

/// @brief Tolerance for JSON comparisons
inline static constexpr double json_tolerance = 1e-10;

/**
 * @brief Anticommutator {a, b} = ab + ba of two encoded operators
 */
inline encodings::data::PauliRegisterSequence anticommutator(
    const encodings::data::PauliRegisterSequence& a,
    const encodings::data::PauliRegisterSequence& b) {
  return a * b + b * a;
}

/**
 * @brief Check the canonical anticommutation relations of an encoder on n
 * modes
 *
 * {a_i, a†_j} = δ_ij and {a_i, a_j} = {a†_i, a†_j} = 0, compared exactly.
 *
 * @return Empty string on success, otherwise the first failing relation
 */
inline std::string check_anticommutation(
    const encodings::algorithms::EncoderFn& encode, std::uint64_t n) {
  using encodings::data::LadderOperatorUnit;
  using encodings::data::PauliRegister;
  using encodings::data::PauliRegisterSequence;
  const PauliRegisterSequence identity(
      std::vector<PauliRegister>{PauliRegister(n)});
  const PauliRegisterSequence zero;
  for (std::uint64_t i = 0; i < n; ++i) {
    for (std::uint64_t j = 0; j < n; ++j) {
      const auto lower_i = encode(LadderOperatorUnit::Lower, i, n);
      const auto raise_j = encode(LadderOperatorUnit::Raise, j, n);
      const auto mixed = anticommutator(lower_i, raise_j);
      if (!(mixed == (i == j ? identity : zero))) {
        return "{a_" + std::to_string(i) + ", a+_" + std::to_string(j) +
               "} = " + mixed.to_string();
      }
      const auto lowers =
          anticommutator(lower_i, encode(LadderOperatorUnit::Lower, j, n));
      if (!lowers.empty()) {
        return "{a_" + std::to_string(i) + ", a_" + std::to_string(j) +
               "} = " + lowers.to_string();
      }
      const auto raises =
          anticommutator(encode(LadderOperatorUnit::Raise, i, n), raise_j);
      if (!raises.empty()) {
        return "{a+_" + std::to_string(i) + ", a+_" + std::to_string(j) +
               "} = " + raises.to_string();
      }
    }
  }
  return "";
}

/**
 * @brief Largest weight of any encoded raising operator on n modes
 */
inline std::size_t max_raise_weight(
    const encodings::algorithms::EncoderFn& encode, std::uint64_t n) {
  std::size_t w = 0;
  for (std::uint64_t j = 0; j < n; ++j) {
    w = std::max(
        w,
        encode(encodings::data::LadderOperatorUnit::Raise, j, n).max_weight());
  }
  return w;
}

/// @brief Number of spin orbitals of the minimal-basis H2 model
inline static constexpr std::uint64_t h2_num_modes = 4;

/// @brief Identity coefficient of the encoded H2 Hamiltonian
inline static constexpr double h2_identity_coefficient = -1.0704184940702044;

/// @brief Lowest eigenvalue of the encoded H2 Hamiltonian (all sectors)
inline static constexpr double h2_lowest_eigenvalue = -2.1006246097383783;

/**
 * @brief Two-electron integrals of the two H2 spatial orbitals, chemist
 * notation
 */
inline double h2_spatial_two_body(std::uint64_t p, std::uint64_t q,
                                  std::uint64_t r, std::uint64_t s) {
  const auto key = std::to_string(p) + std::to_string(q) + std::to_string(r) +
                   std::to_string(s);
  if (key == "0000") return 0.6744887663049631;
  if (key == "1111") return 0.6973979494693556;
  if (key == "0011" || key == "1100") return 0.6636340478615040;
  if (key == "0110" || key == "1001" || key == "0101" || key == "1010") {
    return 0.6975782468828187;
  }
  return 0.0;
}

/**
 * @brief Integral table of minimal-basis H2 over four spin orbitals
 *
 * Spin orbital p lives on spatial orbital p / 2 with spin p % 2. Two-body
 * entries are stored so that key "pqsr" multiplies a†_p a†_q a_s a_r.
 */
inline std::map<std::string, encodings::Complex> h2_coefficients() {
  using encodings::algorithms::one_body_key;
  using encodings::algorithms::two_body_key;
  const double h1[] = {-1.2563390730032498, -0.4718960244306283};

  std::map<std::string, encodings::Complex> table;
  for (std::uint64_t p = 0; p < h2_num_modes; ++p) {
    table[one_body_key(p, p)] = h1[p / 2];
  }
  for (std::uint64_t p = 0; p < h2_num_modes; ++p) {
    for (std::uint64_t q = 0; q < h2_num_modes; ++q) {
      for (std::uint64_t r = 0; r < h2_num_modes; ++r) {
        for (std::uint64_t s = 0; s < h2_num_modes; ++s) {
          if (p % 2 != r % 2 || q % 2 != s % 2) continue;
          const auto v = h2_spatial_two_body(p / 2, r / 2, q / 2, s / 2);
          if (v != 0.0) table[two_body_key(p, q, s, r)] = v;
        }
      }
    }
  }
  return table;
}

}  // namespace testing
