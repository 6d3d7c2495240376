// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file h2_encoding.cpp
 * @brief End-to-end example mapping the electronic Hamiltonian of H2 onto
 * qubits
 *
 * This example demonstrates the complete encoding workflow:
 * 1. Tabulating one- and two-electron integrals over spin orbitals
 * 2. Encoding the Hamiltonian with a chosen fermion-to-qubit mapping
 * 3. Inspecting and serializing the resulting Pauli sum
 * 4. Checking that every available mapping yields the same spectrum
 *
 * Usage:
 *   ./h2_encoding                     # Jordan-Wigner
 *   ./h2_encoding bravyi_kitaev       # Any registered mapper name or alias
 *   ./h2_encoding ternary_tree 1e-3   # Drop terms with |c| < 1e-3
 *
 * The integrals are those of H2 in the STO-3G basis at a bond length of
 * 0.7414 Angstrom, in Hartree.
 */

// Encodings Header Files
#include <encodings/algorithms/hamiltonian.hpp>
#include <encodings/algorithms/qubit_mapper.hpp>
#include <encodings/utils/dense_representation.hpp>
#include <encodings/utils/logger.hpp>

// Standard Library Header Files
#include <cstdint>    // for std::uint64_t
#include <exception>  // for std::exception
#include <iomanip>    // for std::setprecision
#include <iostream>   // for std::cout, std::endl
#include <map>
#include <memory>
#include <string>  // for std::stod, std::to_string

namespace algorithms = encodings::algorithms;
namespace utils = encodings::utils;

namespace {

constexpr std::uint64_t num_spin_orbitals = 4;

// Chemist-notation integrals (pq|rs) over the two spatial orbitals
double spatial_two_body(std::uint64_t p, std::uint64_t q, std::uint64_t r,
                        std::uint64_t s) {
  const auto key = std::to_string(p) + std::to_string(q) + std::to_string(r) +
                   std::to_string(s);
  if (key == "0000") return 0.6744887663049631;
  if (key == "1111") return 0.6973979494693556;
  if (key == "0011" || key == "1100") return 0.6636340478615040;
  if (key == "0110" || key == "1001" || key == "0101" || key == "1010") {
    return 0.6975782468828187;
  }
  return 0.0;
}

// Spin orbital p is spatial orbital p / 2 with spin p % 2
std::map<std::string, encodings::Complex> h2_integrals() {
  const double one_body[] = {-1.2563390730032498, -0.4718960244306283};

  std::map<std::string, encodings::Complex> table;
  for (std::uint64_t p = 0; p < num_spin_orbitals; ++p) {
    table[algorithms::one_body_key(p, p)] = one_body[p / 2];
  }
  for (std::uint64_t p = 0; p < num_spin_orbitals; ++p) {
    for (std::uint64_t q = 0; q < num_spin_orbitals; ++q) {
      for (std::uint64_t r = 0; r < num_spin_orbitals; ++r) {
        for (std::uint64_t s = 0; s < num_spin_orbitals; ++s) {
          if (p % 2 != r % 2 || q % 2 != s % 2) continue;
          const auto value = spatial_two_body(p / 2, r / 2, q / 2, s / 2);
          // <pq|rs> multiplies a†_p a†_q a_s a_r
          if (value != 0.0) table[algorithms::two_body_key(p, q, s, r)] = value;
        }
      }
    }
  }
  return table;
}

}  // namespace

int main(int argc, char** argv) {
  // ==========================================================================
  // STEP 1: INPUT PARSING
  // ==========================================================================

  const std::string encoding =
      (argc > 1) ? argv[1]
                 : algorithms::QubitMapperFactory::default_algorithm_name();
  const double threshold = (argc > 2) ? std::stod(argv[2]) : 1e-12;

  utils::Logger::set_global_level("info");

  std::cout << "\n";
  std::cout << "========================================\n";
  std::cout << "          H2 QUBIT HAMILTONIAN          \n";
  std::cout << "========================================\n\n";

  std::cout << "Spin orbitals: " << num_spin_orbitals << "\n";
  std::cout << "Encoding: " << encoding << "\n";
  std::cout << "Pruning threshold: " << threshold << "\n\n";

  try {
    // ========================================================================
    // STEP 2: HAMILTONIAN ENCODING
    //
    // The coefficient factory serves integrals by concatenated mode indices;
    // the encoder expands each one into ladder operators and maps them with
    // the selected qubit mapper.
    // ========================================================================

    const auto coefficients =
        algorithms::make_coefficient_factory(h2_integrals());

    auto encoder = algorithms::HamiltonianEncoderFactory::create();
    encoder->settings().set("encoding", encoding);
    encoder->settings().set("threshold", threshold);

    const auto hamiltonian = encoder->run(coefficients, num_spin_orbitals);

    // ========================================================================
    // STEP 3: INSPECTION
    // ========================================================================

    std::cout << hamiltonian.get_summary() << "\n\n";
    std::cout << std::setprecision(10);
    for (const auto& [coefficient, signature] :
         hamiltonian.to_canonical_terms()) {
      std::cout << "  " << signature << "  " << std::setw(16)
                << coefficient.real() << "\n";
    }
    std::cout << "\nJSON:\n" << hamiltonian.to_json().dump(2) << "\n\n";

    // ========================================================================
    // STEP 4: SPECTRA OF ALL MAPPINGS
    //
    // Every valid encoding is a unitary change of basis, so the lowest
    // eigenvalue of the qubit Hamiltonian does not depend on the mapping.
    // ========================================================================

    std::cout << "========================================\n";
    std::cout << "        LOWEST EIGENVALUE BY MAPPING    \n";
    std::cout << "========================================\n\n";

    std::cout << std::fixed << std::setprecision(10);
    for (const auto& name : algorithms::QubitMapperFactory::available()) {
      std::shared_ptr<const algorithms::QubitMapper> mapper =
          algorithms::QubitMapperFactory::create(name);
      if (mapper->name() != name) continue;  // skip aliases
      const auto h = algorithms::compute_hamiltonian(
          algorithms::QubitMapper::as_encoder(mapper), coefficients,
          num_spin_orbitals);
      const auto spectrum = utils::hermitian_spectrum(h, num_spin_orbitals);
      std::cout << std::left << std::setw(24) << name << std::right
                << std::setw(16) << spectrum(0) << " Eh  (max weight "
                << h.max_weight() << ")\n";
    }
    std::cout << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Encoding completed successfully!\n\n";
  return 0;
}
