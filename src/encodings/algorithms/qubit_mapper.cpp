// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "builtin/qubit_mappers.hpp"

#include <encodings/algorithms/qubit_mapper.hpp>

namespace encodings::algorithms {

std::unique_ptr<QubitMapper> make_jordan_wigner_mapper() {
  return std::make_unique<builtin::JordanWignerMapper>();
}

std::unique_ptr<QubitMapper> make_bravyi_kitaev_mapper() {
  return std::make_unique<builtin::BravyiKitaevMapper>();
}

std::unique_ptr<QubitMapper> make_parity_mapper() {
  return std::make_unique<builtin::ParityMapper>();
}

std::unique_ptr<QubitMapper> make_balanced_binary_tree_mapper() {
  return std::make_unique<builtin::BalancedBinaryTreeMapper>();
}

std::unique_ptr<QubitMapper> make_balanced_ternary_tree_mapper() {
  return std::make_unique<builtin::BalancedTernaryTreeMapper>();
}

void QubitMapperFactory::register_default_instances() {
  QubitMapperFactory::register_instance(&make_jordan_wigner_mapper);
  QubitMapperFactory::register_instance(&make_bravyi_kitaev_mapper);
  QubitMapperFactory::register_instance(&make_parity_mapper);
  QubitMapperFactory::register_instance(&make_balanced_binary_tree_mapper);
  QubitMapperFactory::register_instance(&make_balanced_ternary_tree_mapper);
}

}  // namespace encodings::algorithms
