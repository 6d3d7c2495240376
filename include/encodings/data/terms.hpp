// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <concepts>
#include <cstddef>
#include <encodings/utils/complex.hpp>
#include <encodings/utils/hash.hpp>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace encodings::data {

/**
 * @brief Requirements on an operator unit carried by the term algebra.
 *
 * Units are compared structurally and hashed to build the canonical key of a
 * product term.
 */
template <typename T>
concept TermUnit = std::equality_comparable<T> && std::copyable<T> &&
                   requires(const T& t) {
                     { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
                   };

namespace detail {

/// Trim leading and trailing whitespace from a view
inline std::string_view trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

/// Split a view on a separator character, keeping empty fields
inline std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace detail

/**
 * @brief A scalar multiple of a single operator unit.
 *
 * The coefficient is reduced on construction: non-finite values become zero.
 *
 * @tparam Unit The operator unit type
 */
template <TermUnit Unit>
class C {
 public:
  /**
   * @brief Construct a unit with coefficient one
   * @param item The operator unit
   */
  explicit C(Unit item) : coefficient_(1.0, 0.0), item_(std::move(item)) {}

  /**
   * @brief Construct a weighted unit
   * @param coefficient Scalar weight, reduced on construction
   * @param item The operator unit
   */
  C(Complex coefficient, Unit item)
      : coefficient_(utils::reduce(coefficient)), item_(std::move(item)) {}

  const Complex& coefficient() const { return coefficient_; }

  const Unit& item() const { return item_; }

  bool is_zero() const { return utils::is_zero(coefficient_); }

  /**
   * @brief Multiply the coefficient by a scalar
   * @param factor Scalar factor
   * @return New weighted unit
   */
  C scale(const Complex& factor) const { return C(coefficient_ * factor, item_); }

  bool operator==(const C& other) const = default;

  /**
   * @brief Debug form: the unit alone for coefficient one, "(coeff unit)"
   * otherwise
   */
  std::string to_string() const {
    std::ostringstream oss;
    if (coefficient_ == Complex(1.0, 0.0)) {
      oss << item_;
    } else {
      oss << "(" << utils::scalar_to_string(coefficient_) << " " << item_
          << ")";
    }
    return oss.str();
  }

 private:
  Complex coefficient_;
  Unit item_;
};

/**
 * @brief An ordered product of weighted operator units.
 *
 * The product carries its own overall coefficient in addition to the unit
 * coefficients; reduce() folds the latter into the former. Products do not
 * commute: multiplication concatenates the unit sequences in order.
 *
 * @tparam Unit The operator unit type
 */
template <TermUnit Unit>
class P {
 public:
  using unit_type = C<Unit>;
  using key_type = std::vector<Unit>;

  /**
   * @brief Construct the canonical zero product
   */
  P() : coefficient_(0.0, 0.0) {}

  /**
   * @brief Construct a product with coefficient one
   * @param units Ordered weighted units
   */
  explicit P(std::vector<unit_type> units)
      : coefficient_(1.0, 0.0), units_(std::move(units)) {}

  /**
   * @brief Construct a weighted product
   * @param coefficient Overall coefficient, reduced on construction
   * @param units Ordered weighted units
   */
  P(Complex coefficient, std::vector<unit_type> units)
      : coefficient_(utils::reduce(coefficient)), units_(std::move(units)) {}

  /**
   * @brief Construct a weighted product of unit-coefficient operators
   * @param coefficient Overall coefficient
   * @param items Ordered operator units
   */
  static P from_items(Complex coefficient, const std::vector<Unit>& items) {
    std::vector<unit_type> units;
    units.reserve(items.size());
    for (const auto& item : items) {
      units.emplace_back(item);
    }
    return P(coefficient, std::move(units));
  }

  /// The canonical zero product: coefficient 0 and no units
  static P zero() { return P(); }

  const Complex& coefficient() const { return coefficient_; }

  const std::vector<unit_type>& units() const { return units_; }

  std::size_t size() const { return units_.size(); }

  /**
   * @brief Whether the product vanishes
   *
   * True if the overall coefficient is zero or any unit coefficient is zero.
   */
  bool is_zero() const {
    if (utils::is_zero(coefficient_)) return true;
    for (const auto& u : units_) {
      if (u.is_zero()) return true;
    }
    return false;
  }

  /**
   * @brief Fold every unit coefficient into the overall coefficient
   *
   * @return An equivalent product whose units all have coefficient one, or
   * the canonical zero product if this product vanishes or has no units
   */
  P reduce() const {
    if (units_.empty() || is_zero()) return zero();
    Complex c = coefficient_;
    std::vector<unit_type> units;
    units.reserve(units_.size());
    for (const auto& u : units_) {
      c *= u.coefficient();
      units.emplace_back(u.item());
    }
    return P(c, std::move(units));
  }

  /**
   * @brief The operator content of the product, ignoring coefficients
   *
   * Two reduced products with equal keys differ at most by their
   * coefficient; this is the canonical key used by S.
   */
  key_type key() const {
    key_type k;
    k.reserve(units_.size());
    for (const auto& u : units_) {
      k.push_back(u.item());
    }
    return k;
  }

  /**
   * @brief Multiply the overall coefficient by a scalar
   */
  P scale(const Complex& factor) const {
    return P(coefficient_ * factor, units_);
  }

  /**
   * @brief Append a unit at the right end of the product
   */
  P append(const unit_type& unit) const {
    auto units = units_;
    units.push_back(unit);
    return P(coefficient_, std::move(units));
  }

  /**
   * @brief Tensor product: concatenate units, multiply coefficients
   */
  P operator*(const P& other) const {
    std::vector<unit_type> units;
    units.reserve(units_.size() + other.units_.size());
    units.insert(units.end(), units_.begin(), units_.end());
    units.insert(units.end(), other.units_.begin(), other.units_.end());
    return P(coefficient_ * other.coefficient_, std::move(units));
  }

  bool operator==(const P& other) const = default;

  /**
   * @brief Debug form "[u1 | u2 | ...]", prefixed by the coefficient unless
   * it is one
   */
  std::string to_string() const {
    std::string body = "[";
    for (std::size_t i = 0; i < units_.size(); ++i) {
      if (i > 0) body += " | ";
      body += units_[i].to_string();
    }
    body += "]";
    if (coefficient_ == Complex(1.0, 0.0)) return body;
    auto prefix = utils::scalar_to_string(coefficient_);
    if (prefix == "-") return "-" + body;
    return prefix + " " + body;
  }

  /**
   * @brief Parse the debug form of a unit-coefficient product
   *
   * @param s Text of the form "[u1 | u2 | ...]"
   * @param parse_unit Parser for a single unit, returning std::nullopt on
   * failure
   * @return The parsed product, or std::nullopt if the text or any unit is
   * malformed
   */
  template <typename UnitParser>
  static std::optional<P> try_parse(std::string_view s, UnitParser&& parse_unit) {
    s = detail::trim(s);
    if (s.size() < 2 || s.front() != '[' || s.back() != ']') {
      return std::nullopt;
    }
    auto body = detail::trim(s.substr(1, s.size() - 2));
    std::vector<unit_type> units;
    if (!body.empty()) {
      for (auto field : detail::split(body, '|')) {
        std::optional<Unit> unit = parse_unit(detail::trim(field));
        if (!unit) return std::nullopt;
        units.emplace_back(*unit);
      }
    }
    return P(std::move(units));
  }

 private:
  Complex coefficient_;
  std::vector<unit_type> units_;
};

/**
 * @brief A canonical sum of product terms.
 *
 * Every product term is reduced on insertion and keyed by its ordered unit
 * sequence. Terms with equal keys are merged by adding coefficients; merged
 * terms whose coefficient is exactly zero, and zero products, are dropped.
 * Terms keep the order in which their key was first inserted.
 *
 * @tparam Unit The operator unit type
 */
template <TermUnit Unit>
class S {
 public:
  using product_type = P<Unit>;
  using key_type = typename product_type::key_type;

  /**
   * @brief Construct the empty (zero) sum
   */
  S() = default;

  /**
   * @brief Construct a single-term sum
   */
  explicit S(const product_type& term) { add_(term); }

  /**
   * @brief Construct a canonical sum
   * @param terms Product terms, merged by key
   */
  explicit S(const std::vector<product_type>& terms) {
    for (const auto& t : terms) add_(t);
    compact_();
  }

  /**
   * @brief Construct a weighted canonical sum
   *
   * The overall coefficient is distributed into every product term.
   *
   * @param coefficient Overall coefficient, reduced on construction
   * @param terms Product terms, merged by key
   */
  S(Complex coefficient, const std::vector<product_type>& terms) {
    const auto c = utils::reduce(coefficient);
    for (const auto& t : terms) add_(t.scale(c));
    compact_();
  }

  /// Reduced product terms in first-insertion order
  const std::vector<product_type>& product_terms() const { return terms_; }

  std::size_t size() const { return terms_.size(); }

  bool is_zero() const { return terms_.empty(); }

  /**
   * @brief Look up the coefficient of an operator sequence
   * @param key Ordered operator units
   * @return The coefficient if the sequence is present
   */
  std::optional<Complex> coefficient_of(const key_type& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return terms_[it->second].coefficient();
  }

  /**
   * @brief Multiply every product term by a scalar
   */
  S scale(const Complex& factor) const { return S(factor, terms_); }

  /**
   * @brief Sum of two canonical sums
   */
  S operator+(const S& other) const {
    S result = *this;
    for (const auto& t : other.terms_) result.add_(t);
    result.compact_();
    return result;
  }

  /**
   * @brief Distribute the product over every pair of product terms
   */
  S operator*(const S& other) const {
    S result;
    for (const auto& l : terms_) {
      for (const auto& r : other.terms_) {
        result.add_(l * r);
      }
    }
    result.compact_();
    return result;
  }

  /**
   * @brief Order-independent equality of canonical sums
   */
  bool operator==(const S& other) const {
    if (terms_.size() != other.terms_.size()) return false;
    for (const auto& t : terms_) {
      auto c = other.coefficient_of(t.key());
      if (!c || *c != t.coefficient()) return false;
    }
    return true;
  }

  /**
   * @brief Debug form "{p1; p2; ...}"
   */
  std::string to_string() const {
    std::string s = "{";
    for (std::size_t i = 0; i < terms_.size(); ++i) {
      if (i > 0) s += "; ";
      s += terms_[i].to_string();
    }
    s += "}";
    return s;
  }

  /**
   * @brief Parse the debug form of a sum of unit-coefficient products
   *
   * @param s Text of the form "{[...]; [...]}"
   * @param parse_unit Parser for a single unit
   * @return The parsed sum, or std::nullopt if any part is malformed
   */
  template <typename UnitParser>
  static std::optional<S> try_parse(std::string_view s, UnitParser&& parse_unit) {
    s = detail::trim(s);
    if (s.size() < 2 || s.front() != '{' || s.back() != '}') {
      return std::nullopt;
    }
    auto body = detail::trim(s.substr(1, s.size() - 2));
    std::vector<product_type> terms;
    if (!body.empty()) {
      for (auto field : detail::split(body, ';')) {
        auto term = product_type::try_parse(field, parse_unit);
        if (!term) return std::nullopt;
        terms.push_back(std::move(*term));
      }
    }
    return S(terms);
  }

 private:
  void add_(const product_type& term) {
    auto reduced = term.reduce();
    if (reduced.is_zero()) return;
    auto key = reduced.key();
    auto it = index_.find(key);
    if (it == index_.end()) {
      index_.emplace(std::move(key), terms_.size());
      terms_.push_back(std::move(reduced));
    } else {
      auto& existing = terms_[it->second];
      existing = product_type(existing.coefficient() + reduced.coefficient(),
                              existing.units());
    }
  }

  // Drop entries whose merged coefficient is exactly zero.
  void compact_() {
    std::vector<product_type> kept;
    kept.reserve(terms_.size());
    for (auto& t : terms_) {
      if (t.coefficient() != Complex(0.0, 0.0)) kept.push_back(std::move(t));
    }
    if (kept.size() == terms_.size()) {
      terms_ = std::move(kept);
      return;
    }
    terms_ = std::move(kept);
    index_.clear();
    for (std::size_t i = 0; i < terms_.size(); ++i) {
      index_.emplace(terms_[i].key(), i);
    }
  }

  std::vector<product_type> terms_;
  std::unordered_map<key_type, std::size_t, utils::RangeHash> index_;
};

}  // namespace encodings::data
