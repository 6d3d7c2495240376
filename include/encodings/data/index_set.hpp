// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <set>
#include <string>

namespace encodings::data {

/// Ordered set of mode or qubit indices
using IndexSet = std::set<std::uint64_t>;

/**
 * @brief Elements of a not in b
 */
inline IndexSet set_difference(const IndexSet& a, const IndexSet& b) {
  IndexSet result;
  std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                      std::inserter(result, result.end()));
  return result;
}

/**
 * @brief Elements in exactly one of a and b
 */
inline IndexSet symmetric_difference(const IndexSet& a, const IndexSet& b) {
  IndexSet result;
  std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(),
                                std::inserter(result, result.end()));
  return result;
}

/**
 * @brief Elements in a or b
 */
inline IndexSet set_union(const IndexSet& a, const IndexSet& b) {
  IndexSet result = a;
  result.insert(b.begin(), b.end());
  return result;
}

/**
 * @brief Debug form "{0, 2, 3}"
 */
inline std::string to_string(const IndexSet& s) {
  std::string result = "{";
  for (auto it = s.begin(); it != s.end(); ++it) {
    if (it != s.begin()) result += ", ";
    result += std::to_string(*it);
  }
  return result + "}";
}

}  // namespace encodings::data
