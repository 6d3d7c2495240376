// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/algorithms/majorana_encoding.hpp>
#include <encodings/data/index_set.hpp>
#include <utility>
#include <vector>

namespace encodings::algorithms {

namespace {

using data::IndexSet;
using data::Pauli;
using data::PauliRegister;

// Positions already assigned keep their operator
PauliRegister place(PauliRegister reg, const IndexSet& indices, Pauli op,
                    IndexSet& assigned) {
  for (auto k : indices) {
    if (assigned.insert(k).second) reg = reg.with_operator_at(k, op);
  }
  return reg;
}

// Coefficient of the d term: -i/2 for a raising operator, +i/2 for lowering
Complex d_coefficient(data::LadderOperatorUnit op) {
  return op == data::LadderOperatorUnit::Raise ? Complex(0.0, -0.5)
                                               : Complex(0.0, 0.5);
}

const data::EncodingScheme& jw() {
  static const auto scheme = data::jordan_wigner_scheme();
  return scheme;
}

const data::EncodingScheme& bk() {
  static const auto scheme = data::bravyi_kitaev_scheme();
  return scheme;
}

const data::EncodingScheme& par() {
  static const auto scheme = data::parity_scheme();
  return scheme;
}

}  // namespace

PauliRegister c_majorana(const data::EncodingScheme& scheme, std::uint64_t j,
                         std::uint64_t n) {
  IndexSet assigned;
  auto reg = place(PauliRegister(n), {j}, Pauli::X, assigned);
  reg = place(std::move(reg), scheme.update(j, n), Pauli::X, assigned);
  return place(std::move(reg), scheme.parity(j), Pauli::Z, assigned);
}

PauliRegister d_majorana(const data::EncodingScheme& scheme, std::uint64_t j,
                         std::uint64_t n) {
  IndexSet assigned;
  auto reg = place(PauliRegister(n), {j}, Pauli::Y, assigned);
  reg = place(std::move(reg), scheme.update(j, n), Pauli::X, assigned);
  auto z_indices = data::symmetric_difference(scheme.parity(j),
                                              scheme.occupation(j));
  z_indices.erase(j);
  return place(std::move(reg), z_indices, Pauli::Z, assigned);
}

data::PauliRegisterSequence encode_operator(const data::EncodingScheme& scheme,
                                            data::LadderOperatorUnit op,
                                            std::uint64_t j, std::uint64_t n) {
  if (op == data::LadderOperatorUnit::Identity || j >= n) {
    return data::PauliRegisterSequence();
  }
  return data::PauliRegisterSequence(std::vector<PauliRegister>{
      c_majorana(scheme, j, n).reset_phase({0.5, 0.0}),
      d_majorana(scheme, j, n).reset_phase(d_coefficient(op))});
}

data::PauliRegisterSequence jordan_wigner_terms(data::LadderOperatorUnit op,
                                                std::uint64_t j,
                                                std::uint64_t n) {
  return encode_operator(jw(), op, j, n);
}

data::PauliRegisterSequence bravyi_kitaev_terms(data::LadderOperatorUnit op,
                                                std::uint64_t j,
                                                std::uint64_t n) {
  return encode_operator(bk(), op, j, n);
}

data::PauliRegisterSequence parity_terms(data::LadderOperatorUnit op,
                                         std::uint64_t j, std::uint64_t n) {
  return encode_operator(par(), op, j, n);
}

}  // namespace encodings::algorithms
