// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <encodings/algorithms/majorana_encoding.hpp>
#include <encodings/algorithms/qubit_mapper.hpp>
#include <encodings/algorithms/tree_encoding.hpp>
#include <string>
#include <vector>

namespace encodings::algorithms::builtin {

class JordanWignerMapper : public QubitMapper {
 public:
  std::string name() const final { return "jordan_wigner"; }
  std::vector<std::string> aliases() const final { return {name(), "jw"}; }
  bool is_logarithmic() const final { return false; }

 protected:
  data::PauliRegisterSequence _run_impl(data::LadderOperatorUnit op,
                                        std::uint64_t j,
                                        std::uint64_t n) const override {
    return jordan_wigner_terms(op, j, n);
  }
};

class BravyiKitaevMapper : public QubitMapper {
 public:
  std::string name() const final { return "bravyi_kitaev"; }
  std::vector<std::string> aliases() const final { return {name(), "bk"}; }
  bool is_logarithmic() const final { return true; }

 protected:
  data::PauliRegisterSequence _run_impl(data::LadderOperatorUnit op,
                                        std::uint64_t j,
                                        std::uint64_t n) const override {
    return bravyi_kitaev_terms(op, j, n);
  }
};

class ParityMapper : public QubitMapper {
 public:
  std::string name() const final { return "parity"; }
  bool is_logarithmic() const final { return false; }

 protected:
  data::PauliRegisterSequence _run_impl(data::LadderOperatorUnit op,
                                        std::uint64_t j,
                                        std::uint64_t n) const override {
    return parity_terms(op, j, n);
  }
};

class BalancedBinaryTreeMapper : public QubitMapper {
 public:
  std::string name() const final { return "balanced_binary_tree"; }
  std::vector<std::string> aliases() const final {
    return {name(), "binary_tree"};
  }
  bool is_logarithmic() const final { return true; }

 protected:
  data::PauliRegisterSequence _run_impl(data::LadderOperatorUnit op,
                                        std::uint64_t j,
                                        std::uint64_t n) const override {
    return balanced_binary_tree_terms(op, j, n);
  }
};

class BalancedTernaryTreeMapper : public QubitMapper {
 public:
  std::string name() const final { return "balanced_ternary_tree"; }
  std::vector<std::string> aliases() const final {
    return {name(), "ternary_tree"};
  }
  bool is_logarithmic() const final { return true; }

 protected:
  data::PauliRegisterSequence _run_impl(data::LadderOperatorUnit op,
                                        std::uint64_t j,
                                        std::uint64_t n) const override {
    return ternary_tree_terms(op, j, n);
  }
};

}  // namespace encodings::algorithms::builtin
