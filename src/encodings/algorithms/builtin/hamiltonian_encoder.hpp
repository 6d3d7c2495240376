// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <encodings/algorithms/hamiltonian.hpp>
#include <encodings/algorithms/qubit_mapper.hpp>
#include <encodings/data/settings.hpp>
#include <limits>
#include <string>

namespace encodings::algorithms::builtin {

class LadderHamiltonianSettings : public data::Settings {
 public:
  LadderHamiltonianSettings() {
    set_default("encoding", QubitMapperFactory::default_algorithm_name(),
                "Name or alias of the qubit mapper",
                data::ListConstraint<std::string>{
                    QubitMapperFactory::available()});
    set_default("threshold", 0.0,
                "Drop Pauli terms whose coefficient magnitude is below this "
                "value; 0 keeps every nonzero term",
                data::BoundConstraint<double>{
                    0.0, std::numeric_limits<double>::max()});
    set_default("two_body_scale", 0.5, "Prefactor of the two-body sum");
  }
  ~LadderHamiltonianSettings() override = default;
};

/**
 * @brief Expands every integral into ladder-operator products and encodes
 * each operator with a registered qubit mapper
 */
class LadderHamiltonianEncoder : public HamiltonianEncoder {
 public:
  LadderHamiltonianEncoder() {
    _settings = std::make_unique<LadderHamiltonianSettings>();
  }
  ~LadderHamiltonianEncoder() override = default;

  std::string name() const final { return "ladder"; }

 protected:
  data::PauliRegisterSequence _run_impl(const CoefficientFactory& coefficients,
                                        std::uint64_t n) const override;
};

}  // namespace encodings::algorithms::builtin
