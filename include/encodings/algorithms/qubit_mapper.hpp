// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/algorithms/algorithm.hpp>
#include <encodings/algorithms/encoder.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/pauli_register.hpp>
#include <encodings/utils/macros.hpp>
#include <memory>
#include <string>
#include <utility>

namespace encodings::algorithms {

/**
 * @brief Fermion-to-qubit mapping of single ladder operators
 *
 * run(op, j, n) encodes the ladder operator op on mode j of an n-mode system
 * as a sum of Pauli strings on n qubits. Identity and j >= n give the empty
 * sum.
 */
class QubitMapper
    : public Algorithm<QubitMapper, data::PauliRegisterSequence,
                       data::LadderOperatorUnit, std::uint64_t,
                       std::uint64_t> {
 public:
  QubitMapper() = default;
  virtual ~QubitMapper() = default;

  using Algorithm::run;

  /**
   * @brief The mapping as a plain encoder function
   *
   * Locks the settings like run(). The returned function shares ownership
   * of the mapper, so it stays valid after the caller's handle is gone.
   *
   * @param mapper Mapper to wrap
   * @throws std::invalid_argument if mapper is null
   */
  static EncoderFn as_encoder(std::shared_ptr<const QubitMapper> mapper) {
    ENCODINGS_VERIFY_INPUT(mapper != nullptr, "as_encoder needs a mapper");
    mapper->lock_settings();
    return [mapper = std::move(mapper)](data::LadderOperatorUnit op,
                                        std::uint64_t j, std::uint64_t n) {
      return mapper->_run_impl(op, j, n);
    };
  }

  std::string type_name() const final { return "qubit_mapper"; }

  /// Whether the mapping keeps operator weight logarithmic in n
  virtual bool is_logarithmic() const = 0;
};

struct QubitMapperFactory
    : public AlgorithmFactory<QubitMapper, QubitMapperFactory> {
  static std::string algorithm_type_name() { return "qubit_mapper"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "jordan_wigner"; }
};

}  // namespace encodings::algorithms
