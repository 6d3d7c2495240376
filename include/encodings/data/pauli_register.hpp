// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <cstdint>
#include <encodings/data/data_class.hpp>
#include <encodings/utils/complex.hpp>
#include <encodings/utils/hash.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace encodings::data {

/**
 * @brief Single-qubit Pauli operator.
 *
 * The numeric codes (I=0, X=1, Y=2, Z=3) make the product of two distinct
 * non-identity operators the third one, `6 - a - b`.
 */
enum class Pauli : std::uint8_t { I = 0, X = 1, Y = 2, Z = 3 };

/**
 * @brief The four phases the Pauli group can produce: +1, -1, +i, -i
 */
enum class Phase : std::uint8_t { P1, M1, Pi, Mi };

/// Character form of a Pauli operator ('I', 'X', 'Y', 'Z')
char to_char(Pauli p);

/// Parse 'I', 'X', 'Y' or 'Z'
std::optional<Pauli> pauli_from_char(char c);

std::ostream& operator<<(std::ostream& os, Pauli p);

/// The phase as a complex number
Complex to_complex(Phase phase);

/// Product of two phases
Phase operator*(Phase a, Phase b);

/**
 * @brief Fold a phase into a running complex coefficient
 * @return `global * phase`, computed exactly
 */
Complex fold_into_global_phase(Phase phase, const Complex& global);

/**
 * @brief Exact product of two single-qubit Paulis
 *
 * I·s = s, s·s = I, XY = iZ, YZ = iX, ZX = iY and the reversed products carry
 * -i.
 *
 * @return The resulting operator and the phase it produces
 */
std::pair<Pauli, Phase> multiply(Pauli a, Pauli b);

/**
 * @brief A tensor product of single-qubit Paulis with a global phase.
 *
 * Qubit 0 is the leftmost character of the signature.
 */
class PauliRegister {
 public:
  /**
   * @brief Construct the identity on n qubits
   * @param n Number of qubits
   * @param phase Global coefficient
   */
  explicit PauliRegister(std::size_t n, Complex phase = {1.0, 0.0});

  /**
   * @brief Construct from a signature such as "XIZY"
   * @param signature One character per qubit
   * @param phase Global coefficient
   * @throws std::invalid_argument if a character is not I, X, Y or Z
   */
  explicit PauliRegister(std::string_view signature,
                         Complex phase = {1.0, 0.0});

  /**
   * @brief Construct from explicit operators
   */
  explicit PauliRegister(std::vector<Pauli> operators,
                         Complex phase = {1.0, 0.0});

  const std::vector<Pauli>& operators() const { return operators_; }

  std::size_t size() const { return operators_.size(); }

  /// The global coefficient
  const Complex& phase() const { return phase_; }

  /**
   * @brief Same operators with a different global coefficient
   */
  PauliRegister reset_phase(const Complex& phase) const;

  /**
   * @brief Operator on qubit i
   * @return The operator, or std::nullopt if i is out of range
   */
  std::optional<Pauli> at(std::size_t i) const;

  /**
   * @brief Replace the operator on qubit i
   *
   * An out-of-range index leaves the register unchanged.
   */
  PauliRegister with_operator_at(std::size_t i, Pauli op) const;

  /// Operator string, e.g. "XIZI"
  std::string signature() const;

  /// Number of non-identity operators
  std::size_t weight() const;

  /**
   * @brief Positionwise product; the shorter register is padded with I
   */
  PauliRegister operator*(const PauliRegister& other) const;

  bool operator==(const PauliRegister& other) const = default;

  /// Coefficient followed by the signature, e.g. "-XIZI" or "0.5 XIZI"
  std::string to_string() const;

 private:
  std::vector<Pauli> operators_;
  Complex phase_;
};

/**
 * @brief A canonical sum of Pauli registers.
 *
 * Registers are keyed by their operator string. Adding a register whose
 * operators are already present sums the coefficients; entries whose
 * coefficient becomes exactly zero are dropped, and zero registers are never
 * inserted. Terms keep first-insertion order; to_string() sorts by
 * signature.
 */
class PauliRegisterSequence : public DataClass {
 public:
  /// Term list as (coefficient, signature) pairs
  using canonical_terms_type = std::vector<std::pair<Complex, std::string>>;

  /**
   * @brief Construct the empty sum
   */
  PauliRegisterSequence() = default;

  /**
   * @brief Construct a canonical sum of registers
   */
  explicit PauliRegisterSequence(const std::vector<PauliRegister>& registers);

  /**
   * @brief Construct the sum of several sequences
   */
  explicit PauliRegisterSequence(
      const std::vector<PauliRegisterSequence>& sequences);

  PauliRegisterSequence(const PauliRegisterSequence& other) = default;
  PauliRegisterSequence(PauliRegisterSequence&& other) noexcept = default;
  PauliRegisterSequence& operator=(const PauliRegisterSequence& other) =
      default;
  PauliRegisterSequence& operator=(PauliRegisterSequence&& other) noexcept =
      default;

  /// Registers in first-insertion order
  const std::vector<PauliRegister>& terms() const { return terms_; }

  std::size_t size() const { return terms_.size(); }

  bool empty() const { return terms_.empty(); }

  /**
   * @brief Look up the register with the given operator string
   * @return The register, or std::nullopt if absent
   */
  std::optional<PauliRegister> find(std::string_view signature) const;

  /// Largest register size
  std::size_t num_qubits() const;

  /// Largest weight of any register
  std::size_t max_weight() const;

  /**
   * @brief Multiply every coefficient by a scalar
   */
  PauliRegisterSequence scale(const Complex& factor) const;

  /**
   * @brief Sum of two sequences
   */
  PauliRegisterSequence operator+(const PauliRegisterSequence& other) const;

  /**
   * @brief Product distributed over the Cartesian product of the terms
   */
  PauliRegisterSequence operator*(const PauliRegisterSequence& other) const;

  /**
   * @brief Order-independent equality
   */
  bool operator==(const PauliRegisterSequence& other) const;

  /**
   * @brief Drop terms whose coefficient magnitude is below a threshold
   * @param epsilon Terms with |coefficient| < epsilon are removed
   */
  PauliRegisterSequence prune_threshold(double epsilon) const;

  /**
   * @brief Terms sorted by signature as (coefficient, signature) pairs
   */
  canonical_terms_type to_canonical_terms() const;

  /**
   * @brief Human-readable sum sorted by signature
   *
   * Example: "-1.07042 IIII + 0.180931 IIIZ - 0.2427 IIZI"
   */
  std::string to_string() const;

  std::string get_data_type_name() const override {
    return "pauli_register_sequence";
  }

  std::string get_summary() const override;

  /**
   * @brief Convert to {"version", "terms": [{"pauli", "coefficient"}]}
   */
  nlohmann::json to_json() const override;

  /**
   * @brief Rebuild a sequence from to_json() output
   * @throws std::runtime_error on a version mismatch
   * @throws std::invalid_argument on malformed terms
   */
  static PauliRegisterSequence from_json(const nlohmann::json& json_obj);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void add_(const PauliRegister& reg);
  void compact_();

  std::vector<PauliRegister> terms_;
  std::unordered_map<std::vector<Pauli>, std::size_t, utils::RangeHash>
      index_;
};

}  // namespace encodings::data
