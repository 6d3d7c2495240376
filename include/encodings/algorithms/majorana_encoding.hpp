// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/algorithms/encoder.hpp>
#include <encodings/data/encoding_scheme.hpp>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/pauli_register.hpp>

namespace encodings::algorithms {

/**
 * @brief Majorana operator c_j = a†_j + a_j under a scheme
 *
 * X on j and on update(j, n), Z on parity(j). Indices >= n are ignored.
 * Where the sets of a custom scheme overlap, the first assignment in this
 * order wins.
 *
 * @param scheme Index-set description of the encoding
 * @param j Mode index
 * @param n Number of qubits
 * @return Register with unit coefficient
 */
data::PauliRegister c_majorana(const data::EncodingScheme& scheme,
                               std::uint64_t j, std::uint64_t n);

/**
 * @brief Majorana operator d_j = i(a†_j - a_j) under a scheme
 *
 * Y on j, X on update(j, n), Z on (parity(j) Δ occupation(j)) \ {j}. Indices
 * >= n are ignored. Overlaps resolve to the first assignment, as for
 * c_majorana.
 */
data::PauliRegister d_majorana(const data::EncodingScheme& scheme,
                               std::uint64_t j, std::uint64_t n);

/**
 * @brief Encode a single ladder operator
 *
 * a†_j = ½(c_j - i d_j) and a_j = ½(c_j + i d_j).
 *
 * @return Two-term sequence, or the empty sequence for Identity or j >= n
 */
data::PauliRegisterSequence encode_operator(const data::EncodingScheme& scheme,
                                            data::LadderOperatorUnit op,
                                            std::uint64_t j, std::uint64_t n);

/// Jordan-Wigner encoder, weight O(n)
data::PauliRegisterSequence jordan_wigner_terms(data::LadderOperatorUnit op,
                                                std::uint64_t j,
                                                std::uint64_t n);

/// Bravyi-Kitaev encoder, weight O(log n)
data::PauliRegisterSequence bravyi_kitaev_terms(data::LadderOperatorUnit op,
                                                std::uint64_t j,
                                                std::uint64_t n);

/// Parity encoder
data::PauliRegisterSequence parity_terms(data::LadderOperatorUnit op,
                                         std::uint64_t j, std::uint64_t n);

}  // namespace encodings::algorithms
