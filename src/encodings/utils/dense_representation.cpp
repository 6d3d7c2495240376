// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <Eigen/Eigenvalues>
#include <encodings/utils/dense_representation.hpp>
#include <encodings/utils/logger.hpp>
#include <encodings/utils/macros.hpp>
#include <stdexcept>
#include <string>

namespace encodings::utils {

namespace {

void check_size(std::uint64_t n) {
  ENCODINGS_VERIFY_INPUT(n <= max_dense_qubits,
                         "dense representation of " + std::to_string(n) +
                             " qubits exceeds the limit of " +
                             std::to_string(max_dense_qubits));
}

// Adds coeff * reg into the dense matrix; every row has one nonzero entry
void accumulate(const data::PauliRegister& reg, std::uint64_t n,
                Eigen::MatrixXcd& out) {
  ENCODINGS_VERIFY_INPUT(reg.size() <= n,
                         "register " + reg.signature() + " has more than " +
                             std::to_string(n) + " qubits");
  const auto& ops = reg.operators();
  std::uint64_t flip = 0;
  for (std::size_t k = 0; k < ops.size(); ++k) {
    if (ops[k] == data::Pauli::X || ops[k] == data::Pauli::Y) {
      flip |= std::uint64_t{1} << (n - 1 - k);
    }
  }

  const std::uint64_t dim = std::uint64_t{1} << n;
  for (std::uint64_t row = 0; row < dim; ++row) {
    Complex value = reg.phase();
    for (std::size_t k = 0; k < ops.size(); ++k) {
      const bool bit = (row >> (n - 1 - k)) & 1;
      switch (ops[k]) {
        case data::Pauli::I:
        case data::Pauli::X:
          break;
        case data::Pauli::Y:
          value = bit ? times_i(value) : -times_i(value);
          break;
        case data::Pauli::Z:
          if (bit) value = -value;
          break;
      }
    }
    out(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(row ^ flip)) +=
        value;
  }
}

}  // namespace

Eigen::MatrixXcd to_dense_matrix(const data::PauliRegister& reg,
                                 std::uint64_t n) {
  check_size(n);
  const auto dim = static_cast<Eigen::Index>(std::uint64_t{1} << n);
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Zero(dim, dim);
  accumulate(reg, n, result);
  return result;
}

Eigen::MatrixXcd to_dense_matrix(const data::PauliRegisterSequence& seq,
                                 std::uint64_t n) {
  ENCODINGS_LOG_TRACE_ENTERING();
  check_size(n);
  const auto dim = static_cast<Eigen::Index>(std::uint64_t{1} << n);
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Zero(dim, dim);
  for (const auto& reg : seq.terms()) accumulate(reg, n, result);
  return result;
}

Eigen::VectorXd hermitian_spectrum(const data::PauliRegisterSequence& seq,
                                   std::uint64_t n) {
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(
      to_dense_matrix(seq, n), Eigen::EigenvaluesOnly);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("eigenvalue decomposition did not converge for " +
                             std::to_string(n) + "-qubit operator");
  }
  return solver.eigenvalues();
}

}  // namespace encodings::utils
