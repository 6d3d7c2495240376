// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/data/encoding_scheme.hpp>
#include <encodings/data/fenwick_tree.hpp>

namespace encodings::data {

EncodingScheme jordan_wigner_scheme() {
  EncodingScheme scheme;
  scheme.update = [](std::uint64_t, std::uint64_t) { return IndexSet{}; };
  scheme.parity = [](std::uint64_t j) {
    IndexSet result;
    for (std::uint64_t k = 0; k < j; ++k) result.insert(result.end(), k);
    return result;
  };
  scheme.occupation = [](std::uint64_t j) { return IndexSet{j}; };
  return scheme;
}

EncodingScheme bravyi_kitaev_scheme() {
  EncodingScheme scheme;
  scheme.update = fenwick::update_set;
  scheme.parity = fenwick::parity_set;
  scheme.occupation = fenwick::occupation_set;
  return scheme;
}

EncodingScheme parity_scheme() {
  EncodingScheme scheme;
  scheme.update = [](std::uint64_t j, std::uint64_t n) {
    IndexSet result;
    for (std::uint64_t k = j + 1; k < n; ++k) result.insert(result.end(), k);
    return result;
  };
  scheme.parity = [](std::uint64_t j) {
    return j > 0 ? IndexSet{j - 1} : IndexSet{};
  };
  scheme.occupation = [](std::uint64_t j) {
    return j > 0 ? IndexSet{j - 1, j} : IndexSet{j};
  };
  return scheme;
}

}  // namespace encodings::data
