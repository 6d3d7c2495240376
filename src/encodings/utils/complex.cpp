// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <encodings/utils/complex.hpp>
#include <limits>
#include <sstream>

namespace encodings::utils {

std::string scalar_to_string(const Complex& coefficient) {
  constexpr double zero_tolerance = std::numeric_limits<double>::epsilon();
  std::ostringstream oss;
  if (coefficient.imag() == 0.0) {
    if (std::abs(coefficient.real() - 1.0) < zero_tolerance) {
      return "";
    } else if (std::abs(coefficient.real() + 1.0) < zero_tolerance) {
      return "-";
    }
    oss << coefficient.real();
  } else if (coefficient.real() == 0.0) {
    if (std::abs(coefficient.imag() - 1.0) < zero_tolerance) {
      return "i";
    } else if (std::abs(coefficient.imag() + 1.0) < zero_tolerance) {
      return "-i";
    }
    oss << coefficient.imag() << "i";
  } else {
    oss << "(" << coefficient.real();
    if (coefficient.imag() >= 0) oss << "+";
    oss << coefficient.imag() << "i)";
  }
  return oss.str();
}

}  // namespace encodings::utils
