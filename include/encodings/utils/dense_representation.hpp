// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <encodings/data/pauli_register.hpp>

namespace encodings::utils {

/// Largest qubit count accepted by the dense conversions
inline constexpr std::uint64_t max_dense_qubits = 14;

/**
 * @brief Dense 2^n x 2^n matrix of a Pauli register
 *
 * Qubit 0 is the leftmost tensor factor, i.e. the most significant bit of
 * the basis-state index. Registers shorter than n are padded with I.
 *
 * @param reg Register including its global coefficient
 * @param n Number of qubits
 * @throws std::invalid_argument if the register is longer than n or n
 * exceeds max_dense_qubits
 */
Eigen::MatrixXcd to_dense_matrix(const data::PauliRegister& reg,
                                 std::uint64_t n);

/**
 * @brief Dense matrix of a Pauli sum, the sum of its register matrices
 */
Eigen::MatrixXcd to_dense_matrix(const data::PauliRegisterSequence& seq,
                                 std::uint64_t n);

/**
 * @brief Ascending eigenvalues of a Hermitian Pauli sum
 *
 * Only the lower triangle of the dense matrix is read, so the result is
 * meaningful for Hermitian sums only.
 */
Eigen::VectorXd hermitian_spectrum(const data::PauliRegisterSequence& seq,
                                   std::uint64_t n);

}  // namespace encodings::utils
