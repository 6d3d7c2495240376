// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/data/ladder_operator.hpp>
#include <encodings/data/pauli_register.hpp>
#include <functional>

namespace encodings::algorithms {

/**
 * @brief Maps a ladder operator on mode j of an n-mode system to qubits.
 *
 * Arguments are (operator, mode index j, number of modes n). Identity and
 * j >= n yield the empty sequence.
 */
using EncoderFn = std::function<data::PauliRegisterSequence(
    data::LadderOperatorUnit, std::uint64_t, std::uint64_t)>;

}  // namespace encodings::algorithms
