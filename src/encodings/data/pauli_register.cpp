// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cmath>
#include <encodings/data/pauli_register.hpp>
#include <encodings/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

#include "json_serialization.hpp"

namespace encodings::data {

char to_char(Pauli p) {
  switch (p) {
    case Pauli::I:
      return 'I';
    case Pauli::X:
      return 'X';
    case Pauli::Y:
      return 'Y';
    case Pauli::Z:
      return 'Z';
  }
  return '?';
}

std::optional<Pauli> pauli_from_char(char c) {
  switch (c) {
    case 'I':
      return Pauli::I;
    case 'X':
      return Pauli::X;
    case 'Y':
      return Pauli::Y;
    case 'Z':
      return Pauli::Z;
    default:
      return std::nullopt;
  }
}

std::ostream& operator<<(std::ostream& os, Pauli p) { return os << to_char(p); }

Complex to_complex(Phase phase) {
  switch (phase) {
    case Phase::P1:
      return {1.0, 0.0};
    case Phase::M1:
      return {-1.0, 0.0};
    case Phase::Pi:
      return {0.0, 1.0};
    case Phase::Mi:
      return {0.0, -1.0};
  }
  return {0.0, 0.0};
}

Phase operator*(Phase a, Phase b) {
  // Phases as powers of i: P1 = 0, Pi = 1, M1 = 2, Mi = 3
  const auto exponent = [](Phase p) -> int {
    switch (p) {
      case Phase::P1:
        return 0;
      case Phase::Pi:
        return 1;
      case Phase::M1:
        return 2;
      case Phase::Mi:
        return 3;
    }
    return 0;
  };
  constexpr Phase by_exponent[] = {Phase::P1, Phase::Pi, Phase::M1, Phase::Mi};
  return by_exponent[(exponent(a) + exponent(b)) % 4];
}

Complex fold_into_global_phase(Phase phase, const Complex& global) {
  switch (phase) {
    case Phase::P1:
      return global;
    case Phase::M1:
      return -global;
    case Phase::Pi:
      return utils::times_i(global);
    case Phase::Mi:
      return -utils::times_i(global);
  }
  return global;
}

std::pair<Pauli, Phase> multiply(Pauli a, Pauli b) {
  if (a == Pauli::I) return {b, Phase::P1};
  if (b == Pauli::I) return {a, Phase::P1};
  if (a == b) return {Pauli::I, Phase::P1};

  // Different non-identity Paulis: Levi-Civita
  const int x = static_cast<int>(a);
  const int y = static_cast<int>(b);
  const auto c = static_cast<Pauli>(6 - x - y);
  const bool cyclic = (x == 1 && y == 2) || (x == 2 && y == 3) ||
                      (x == 3 && y == 1);
  return {c, cyclic ? Phase::Pi : Phase::Mi};
}

// PauliRegister

PauliRegister::PauliRegister(std::size_t n, Complex phase)
    : operators_(n, Pauli::I), phase_(utils::reduce(phase)) {}

PauliRegister::PauliRegister(std::string_view signature, Complex phase)
    : phase_(utils::reduce(phase)) {
  operators_.reserve(signature.size());
  for (char c : signature) {
    auto p = pauli_from_char(c);
    if (!p) {
      throw std::invalid_argument("Invalid Pauli character '" +
                                  std::string(1, c) + "' in signature '" +
                                  std::string(signature) + "'");
    }
    operators_.push_back(*p);
  }
}

PauliRegister::PauliRegister(std::vector<Pauli> operators, Complex phase)
    : operators_(std::move(operators)), phase_(utils::reduce(phase)) {}

PauliRegister PauliRegister::reset_phase(const Complex& phase) const {
  return PauliRegister(operators_, phase);
}

std::optional<Pauli> PauliRegister::at(std::size_t i) const {
  if (i >= operators_.size()) return std::nullopt;
  return operators_[i];
}

PauliRegister PauliRegister::with_operator_at(std::size_t i, Pauli op) const {
  auto ops = operators_;
  if (i < ops.size()) ops[i] = op;
  return PauliRegister(std::move(ops), phase_);
}

std::string PauliRegister::signature() const {
  std::string s;
  s.reserve(operators_.size());
  for (auto p : operators_) s.push_back(to_char(p));
  return s;
}

std::size_t PauliRegister::weight() const {
  return static_cast<std::size_t>(
      std::count_if(operators_.begin(), operators_.end(),
                    [](Pauli p) { return p != Pauli::I; }));
}

PauliRegister PauliRegister::operator*(const PauliRegister& other) const {
  const std::size_t n = std::max(size(), other.size());
  std::vector<Pauli> ops;
  ops.reserve(n);
  Phase positional = Phase::P1;
  for (std::size_t i = 0; i < n; ++i) {
    auto [op, phase] = multiply(at(i).value_or(Pauli::I),
                                other.at(i).value_or(Pauli::I));
    ops.push_back(op);
    positional = positional * phase;
  }
  return PauliRegister(std::move(ops), fold_into_global_phase(
                                           positional, phase_ * other.phase_));
}

std::string PauliRegister::to_string() const {
  auto prefix = utils::scalar_to_string(phase_);
  if (prefix.empty() || prefix == "-") return prefix + signature();
  return prefix + " " + signature();
}

// PauliRegisterSequence

PauliRegisterSequence::PauliRegisterSequence(
    const std::vector<PauliRegister>& registers) {
  for (const auto& r : registers) add_(r);
  compact_();
}

PauliRegisterSequence::PauliRegisterSequence(
    const std::vector<PauliRegisterSequence>& sequences) {
  for (const auto& s : sequences) {
    for (const auto& r : s.terms_) add_(r);
  }
  compact_();
}

void PauliRegisterSequence::add_(const PauliRegister& reg) {
  if (utils::is_zero(reg.phase())) return;
  auto it = index_.find(reg.operators());
  if (it == index_.end()) {
    index_.emplace(reg.operators(), terms_.size());
    terms_.push_back(reg);
  } else {
    auto& existing = terms_[it->second];
    existing = existing.reset_phase(existing.phase() + reg.phase());
  }
}

void PauliRegisterSequence::compact_() {
  const auto zero = Complex(0.0, 0.0);
  if (std::none_of(terms_.begin(), terms_.end(),
                   [&](const PauliRegister& r) { return r.phase() == zero; })) {
    return;
  }
  std::vector<PauliRegister> kept;
  kept.reserve(terms_.size());
  for (auto& r : terms_) {
    if (r.phase() != zero) kept.push_back(std::move(r));
  }
  terms_ = std::move(kept);
  index_.clear();
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    index_.emplace(terms_[i].operators(), i);
  }
}

std::optional<PauliRegister> PauliRegisterSequence::find(
    std::string_view signature) const {
  std::vector<Pauli> key;
  key.reserve(signature.size());
  for (char c : signature) {
    auto p = pauli_from_char(c);
    if (!p) return std::nullopt;
    key.push_back(*p);
  }
  auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;
  return terms_[it->second];
}

std::size_t PauliRegisterSequence::num_qubits() const {
  std::size_t n = 0;
  for (const auto& r : terms_) n = std::max(n, r.size());
  return n;
}

std::size_t PauliRegisterSequence::max_weight() const {
  std::size_t w = 0;
  for (const auto& r : terms_) w = std::max(w, r.weight());
  return w;
}

PauliRegisterSequence PauliRegisterSequence::scale(
    const Complex& factor) const {
  std::vector<PauliRegister> scaled;
  scaled.reserve(terms_.size());
  for (const auto& r : terms_) scaled.push_back(r.reset_phase(r.phase() * factor));
  return PauliRegisterSequence(scaled);
}

PauliRegisterSequence PauliRegisterSequence::operator+(
    const PauliRegisterSequence& other) const {
  PauliRegisterSequence result = *this;
  for (const auto& r : other.terms_) result.add_(r);
  result.compact_();
  return result;
}

PauliRegisterSequence PauliRegisterSequence::operator*(
    const PauliRegisterSequence& other) const {
  PauliRegisterSequence result;
  for (const auto& l : terms_) {
    for (const auto& r : other.terms_) {
      result.add_(l * r);
    }
  }
  result.compact_();
  return result;
}

bool PauliRegisterSequence::operator==(
    const PauliRegisterSequence& other) const {
  if (terms_.size() != other.terms_.size()) return false;
  for (const auto& r : terms_) {
    auto it = other.index_.find(r.operators());
    if (it == other.index_.end() ||
        other.terms_[it->second].phase() != r.phase()) {
      return false;
    }
  }
  return true;
}

PauliRegisterSequence PauliRegisterSequence::prune_threshold(
    double epsilon) const {
  std::vector<PauliRegister> kept;
  for (const auto& r : terms_) {
    if (std::abs(r.phase()) >= epsilon) kept.push_back(r);
  }
  return PauliRegisterSequence(kept);
}

PauliRegisterSequence::canonical_terms_type
PauliRegisterSequence::to_canonical_terms() const {
  canonical_terms_type result;
  result.reserve(terms_.size());
  for (const auto& r : terms_) result.emplace_back(r.phase(), r.signature());
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
  return result;
}

namespace {

// Magnitude part of a coefficient once its sign has been pulled out into
// the joining operator.
std::string unsigned_scalar(const Complex& c) {
  std::ostringstream oss;
  if (c.imag() == 0.0) {
    oss << std::abs(c.real()) << " ";
  } else if (c.real() == 0.0) {
    if (std::abs(c.imag()) == 1.0) return "i ";
    oss << std::abs(c.imag()) << "i ";
  } else {
    return utils::scalar_to_string(c) + " ";
  }
  auto s = oss.str();
  return s == "1 " ? "" : s;
}

bool is_negative(const Complex& c) {
  if (c.imag() == 0.0) return c.real() < 0.0;
  if (c.real() == 0.0) return c.imag() < 0.0;
  return false;
}

}  // namespace

std::string PauliRegisterSequence::to_string() const {
  std::string result;
  bool first = true;
  for (const auto& [coefficient, signature] : to_canonical_terms()) {
    const bool negative = is_negative(coefficient);
    if (first) {
      result += negative ? "-" : "";
      first = false;
    } else {
      result += negative ? " - " : " + ";
    }
    result += unsigned_scalar(coefficient) + signature;
  }
  return result;
}

std::string PauliRegisterSequence::get_summary() const {
  std::ostringstream oss;
  oss << "Pauli register sequence: " << size() << " terms on " << num_qubits()
      << " qubits, max weight " << max_weight();
  return oss.str();
}

nlohmann::json PauliRegisterSequence::to_json() const {
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;
  json_obj["type"] = get_data_type_name();
  nlohmann::json terms = nlohmann::json::array();
  for (const auto& [coefficient, signature] : to_canonical_terms()) {
    terms.push_back({{"pauli", signature},
                     {"coefficient", complex_to_json(coefficient)}});
  }
  json_obj["terms"] = terms;
  return json_obj;
}

PauliRegisterSequence PauliRegisterSequence::from_json(
    const nlohmann::json& json_obj) {
  ENCODINGS_LOG_TRACE_ENTERING();
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  if (json_obj.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj["version"].get<std::string>());
  }
  if (!json_obj.contains("terms") || !json_obj["terms"].is_array()) {
    throw std::invalid_argument(
        "Pauli register sequence JSON requires a 'terms' array");
  }
  std::vector<PauliRegister> registers;
  registers.reserve(json_obj["terms"].size());
  for (const auto& term : json_obj["terms"]) {
    if (!term.contains("pauli") || !term.contains("coefficient")) {
      throw std::invalid_argument(
          "Each term requires 'pauli' and 'coefficient' entries");
    }
    registers.emplace_back(term["pauli"].get<std::string>(),
                           json_to_complex(term["coefficient"]));
  }
  return PauliRegisterSequence(registers);
}

}  // namespace encodings::data
