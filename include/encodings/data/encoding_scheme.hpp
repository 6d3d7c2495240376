// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/data/index_set.hpp>
#include <functional>

namespace encodings::data {

/**
 * @brief Index-set description of a Majorana-based fermion-to-qubit encoding.
 *
 * For mode j out of n:
 * - update(j, n): qubits that store a partial sum including mode j and get an
 *   X when the occupation of j flips;
 * - parity(j): qubits whose joint parity equals that of modes [0, j);
 * - occupation(j): qubits whose joint parity equals the occupation of j.
 *
 * Jordan-Wigner, Bravyi-Kitaev and Parity differ only in these three maps.
 */
struct EncodingScheme {
  std::function<IndexSet(std::uint64_t j, std::uint64_t n)> update;
  std::function<IndexSet(std::uint64_t j)> parity;
  std::function<IndexSet(std::uint64_t j)> occupation;
};

/**
 * @brief Jordan-Wigner: qubit j stores the occupation of mode j
 *
 * update = {}, parity = {0, ..., j-1}, occupation = {j}.
 */
EncodingScheme jordan_wigner_scheme();

/**
 * @brief Bravyi-Kitaev: qubits store Fenwick-tree partial parities
 */
EncodingScheme bravyi_kitaev_scheme();

/**
 * @brief Parity: qubit j stores the parity of modes [0, j]
 *
 * update = {j+1, ..., n-1}, parity = {j-1}, occupation = {j-1, j}; the j-1
 * entries are omitted for j = 0.
 */
EncodingScheme parity_scheme();

}  // namespace encodings::data
