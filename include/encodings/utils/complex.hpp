// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cmath>
#include <complex>
#include <cstdint>
#include <string>

namespace encodings {

/// Coefficient type used throughout the term algebra
using Complex = std::complex<double>;

namespace utils {

/// The imaginary unit
inline constexpr Complex imaginary_unit{0.0, 1.0};

/**
 * @brief Whether both parts of a complex number are finite.
 */
inline bool is_finite(const Complex& c) {
  return std::isfinite(c.real()) && std::isfinite(c.imag());
}

/**
 * @brief Clamp a coefficient to a well-defined value.
 *
 * NaN or infinite values in either component make the whole coefficient
 * zero; every constructor in the term algebra runs its coefficient through
 * this function so that non-finite numbers never propagate.
 *
 * @param c Coefficient to reduce
 * @return c if finite, 0 otherwise
 */
inline Complex reduce(const Complex& c) {
  return is_finite(c) ? c : Complex{0.0, 0.0};
}

/**
 * @brief Whether a coefficient is zero after reduction.
 *
 * Non-finite coefficients count as zero.
 */
inline bool is_zero(const Complex& c) {
  auto r = reduce(c);
  return r.real() == 0.0 && r.imag() == 0.0;
}

/// Negation of is_zero
inline bool is_nonzero(const Complex& c) { return !is_zero(c); }

/**
 * @brief Multiply by (-1)^n.
 */
inline Complex swap_sign_multiple(std::uint64_t n, const Complex& c) {
  return (n % 2 == 0) ? c : -c;
}

/// Multiply by the imaginary unit
inline Complex times_i(const Complex& c) { return {-c.imag(), c.real()}; }

/**
 * @brief Compact string form of a coefficient.
 *
 * Unit coefficients are abbreviated: 1 prints as "", -1 as "-", i as "i" and
 * -i as "-i". Purely real or imaginary values print a single number; general
 * values print as "(re+imi)".
 *
 * @param coefficient Coefficient to format
 * @return Formatted coefficient
 */
std::string scalar_to_string(const Complex& coefficient);

}  // namespace utils
}  // namespace encodings
