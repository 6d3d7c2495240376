// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <utility>

namespace encodings::utils {

/**
 * @brief Combines a hash value with the hash of another value.
 *
 * Modified boost::hash_combine using the golden ratio constant.
 *
 * @tparam T The type of value to hash.
 * @tparam Hasher The hash function type (defaults to std::hash<T>).
 * @param seed The existing hash value to combine with.
 * @param v The value to hash and combine.
 * @return The combined hash value.
 */
template <typename T, typename Hasher = std::hash<T>>
inline std::size_t hash_combine(std::size_t seed, const T& v) {
  Hasher h;
  return seed ^ (h(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * @brief Variadic overload that folds several values into a hash seed,
 * left-to-right.
 */
template <typename T, typename... Args>
inline std::size_t hash_combine(std::size_t seed, const T& v, Args&&... args) {
  return hash_combine(hash_combine(seed, v), std::forward<Args>(args)...);
}

/**
 * @brief Hash an ordered range element by element.
 *
 * The length is folded in first so that a prefix never collides trivially
 * with the full sequence.
 *
 * @param first Iterator to the first element
 * @param last Past-the-end iterator
 * @return The combined hash of the range
 */
template <typename Iterator>
inline std::size_t hash_range(Iterator first, Iterator last) {
  std::size_t seed = hash_combine(0, static_cast<std::size_t>(
                                         std::distance(first, last)));
  for (; first != last; ++first) {
    seed = hash_combine(seed, *first);
  }
  return seed;
}

/**
 * @brief Hasher for ordered containers, usable as an unordered_map key hash.
 */
struct RangeHash {
  template <typename Range>
  std::size_t operator()(const Range& range) const {
    return hash_range(std::begin(range), std::end(range));
  }
};

}  // namespace encodings::utils
