// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/algorithms/algorithm.hpp>
#include <encodings/algorithms/encoder.hpp>
#include <encodings/data/pauli_register.hpp>
#include <encodings/utils/complex.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace encodings::algorithms {

/**
 * @brief Source of integral coefficients keyed by concatenated mode indices
 *
 * One-body coefficients h_ij live under "ij" and two-body coefficients
 * <ij|kl> under "ijkl", each index printed in decimal without separators.
 * std::nullopt skips the term.
 */
using CoefficientFactory =
    std::function<std::optional<Complex>(const std::string&)>;

/// Key of the one-body term (i, j)
std::string one_body_key(std::uint64_t i, std::uint64_t j);

/// Key of the two-body term (i, j, k, l)
std::string two_body_key(std::uint64_t i, std::uint64_t j, std::uint64_t k,
                         std::uint64_t l);

/**
 * @brief Coefficient factory backed by a fixed table
 */
CoefficientFactory make_coefficient_factory(
    std::map<std::string, Complex> coefficients);

/**
 * @brief Encode a second-quantized Hamiltonian
 *
 * H = Σ h_ij a†_i a_j + s Σ <ij|kl> a†_i a†_j a_k a_l
 *
 * with every ladder operator replaced by its encoding. Index tuples run over
 * 0..n-1; the coefficient factory is queried once per tuple on the calling
 * thread. The operator products are computed in parallel when OpenMP is
 * enabled and merged in index order, so the term order of the result does
 * not depend on the thread count.
 *
 * @param encode Ladder-operator encoder
 * @param coefficients Coefficient source
 * @param n Number of modes and qubits
 * @param two_body_scale Prefactor s of the two-body sum
 * @return The encoded Hamiltonian
 */
data::PauliRegisterSequence compute_hamiltonian(
    const EncoderFn& encode, const CoefficientFactory& coefficients,
    std::uint64_t n, double two_body_scale = 0.5);

/**
 * @brief Fermionic Hamiltonian to Pauli sum under a named qubit mapping
 */
class HamiltonianEncoder
    : public Algorithm<HamiltonianEncoder, data::PauliRegisterSequence,
                       const CoefficientFactory&, std::uint64_t> {
 public:
  HamiltonianEncoder() = default;
  virtual ~HamiltonianEncoder() = default;

  using Algorithm::run;

  std::string type_name() const final { return "hamiltonian_encoder"; }
};

struct HamiltonianEncoderFactory
    : public AlgorithmFactory<HamiltonianEncoder, HamiltonianEncoderFactory> {
  static std::string algorithm_type_name() { return "hamiltonian_encoder"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "ladder"; }
};

}  // namespace encodings::algorithms
