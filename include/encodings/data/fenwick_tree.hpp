// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <encodings/data/index_set.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace encodings::data {

namespace fenwick {

/**
 * @brief Lowest set bit of k
 */
inline constexpr std::uint64_t lsb(std::uint64_t k) { return k & (~k + 1); }

/**
 * @brief 1-based ancestors of node k in a tree of size n
 *
 * Walks k + lsb(k), ... while the index stays within n. Excludes k itself.
 */
inline std::vector<std::uint64_t> ancestors(std::uint64_t n, std::uint64_t k) {
  std::vector<std::uint64_t> result;
  if (k == 0) return result;
  for (std::uint64_t i = k + lsb(k); i <= n; i += lsb(i)) {
    result.push_back(i);
  }
  return result;
}

/**
 * @brief 1-based nodes whose ranges are merged into node k
 *
 * Walks k - 1, then repeatedly clears the lowest set bit, while staying
 * above k - lsb(k).
 */
inline std::vector<std::uint64_t> descendants(std::uint64_t k) {
  std::vector<std::uint64_t> result;
  if (k == 0) return result;
  const std::uint64_t wall = k - lsb(k);
  for (std::uint64_t i = k - 1; i > wall; i &= i - 1) {
    result.push_back(i);
  }
  return result;
}

/**
 * @brief 1-based nodes that cover the prefix [1, k]
 *
 * Repeatedly clears the lowest set bit of k down to zero.
 */
inline std::vector<std::uint64_t> prefix_indices(std::uint64_t k) {
  std::vector<std::uint64_t> result;
  for (std::uint64_t i = k; i > 0; i &= i - 1) {
    result.push_back(i);
  }
  return result;
}

/**
 * @brief Bravyi-Kitaev update set: 0-based ancestors of mode j
 */
inline IndexSet update_set(std::uint64_t j, std::uint64_t n) {
  IndexSet result;
  for (auto i : ancestors(n, j + 1)) result.insert(i - 1);
  return result;
}

/**
 * @brief Bravyi-Kitaev parity set: 0-based nodes covering modes [0, j)
 */
inline IndexSet parity_set(std::uint64_t j) {
  IndexSet result;
  for (auto i : prefix_indices(j)) result.insert(i - 1);
  return result;
}

/**
 * @brief Bravyi-Kitaev occupation set: j and its 0-based descendants
 */
inline IndexSet occupation_set(std::uint64_t j) {
  IndexSet result{j};
  for (auto i : descendants(j + 1)) result.insert(i - 1);
  return result;
}

/**
 * @brief Parity set minus occupation set
 */
inline IndexSet remainder_set(std::uint64_t j) {
  return set_difference(parity_set(j), occupation_set(j));
}

}  // namespace fenwick

/**
 * @brief Immutable binary indexed tree over an associative operation.
 *
 * The combine operation need not be invertible; point_query() is only
 * meaningful for self-inverse operations such as XOR. Storage is 1-indexed
 * with slot 0 holding the identity. Public indices are 0-based.
 *
 * @tparam T Value type
 */
template <typename T>
class FenwickTree {
 public:
  using combine_type = std::function<T(const T&, const T&)>;

  /**
   * @brief Build a tree of n values produced by a generator
   * @param combine Associative operation
   * @param identity Neutral element of combine
   * @param n Number of values
   * @param value Generator for the value at each 0-based index
   */
  static FenwickTree build(combine_type combine, T identity, std::uint64_t n,
                           const std::function<T(std::uint64_t)>& value) {
    std::vector<T> data(n + 1, identity);
    for (std::uint64_t i = 1; i <= n; ++i) data[i] = value(i - 1);
    for (std::uint64_t i = 1; i <= n; ++i) {
      const auto parent = i + fenwick::lsb(i);
      if (parent <= n) data[parent] = combine(data[parent], data[i]);
    }
    return FenwickTree(std::move(data), std::move(combine),
                       std::move(identity));
  }

  /// Build a tree over the given values
  static FenwickTree of_array(combine_type combine, T identity,
                              const std::vector<T>& values) {
    return build(std::move(combine), identity, values.size(),
                 [&values](std::uint64_t i) { return values[i]; });
  }

  /// Build a tree of n identity values
  static FenwickTree empty(combine_type combine, T identity, std::uint64_t n) {
    return build(std::move(combine), identity, n,
                 [&identity](std::uint64_t) { return identity; });
  }

  std::uint64_t size() const { return data_.size() - 1; }

  /**
   * @brief Fold combine over the values at indices [0, j]
   * @throws std::out_of_range if j >= size()
   */
  T prefix_query(std::uint64_t j) const {
    check_index_(j);
    T acc = identity_;
    for (auto i : fenwick::prefix_indices(j + 1)) acc = combine_(acc, data_[i]);
    return acc;
  }

  /**
   * @brief Recover the value at index j under a self-inverse combine
   * @throws std::out_of_range if j >= size()
   */
  T point_query(std::uint64_t j) const {
    check_index_(j);
    const auto k = j + 1;
    T acc = data_[k];
    for (auto i : fenwick::descendants(k)) acc = combine_(acc, data_[i]);
    return acc;
  }

  /**
   * @brief Combine a delta into the value at index j
   * @return A new tree; this tree is unchanged
   * @throws std::out_of_range if j >= size()
   */
  FenwickTree update(std::uint64_t j, const T& delta) const {
    check_index_(j);
    auto data = data_;
    const auto k = j + 1;
    data[k] = combine_(data[k], delta);
    for (auto a : fenwick::ancestors(size(), k)) data[a] = combine_(data[a], delta);
    return FenwickTree(std::move(data), combine_, identity_);
  }

  /// Raw 1-indexed storage
  const std::vector<T>& data() const { return data_; }

 private:
  FenwickTree(std::vector<T> data, combine_type combine, T identity)
      : data_(std::move(data)),
        combine_(std::move(combine)),
        identity_(std::move(identity)) {}

  void check_index_(std::uint64_t j) const {
    if (j >= size()) {
      throw std::out_of_range("Fenwick tree index " + std::to_string(j) +
                              " out of range for size " +
                              std::to_string(size()));
    }
  }

  std::vector<T> data_;
  combine_type combine_;
  T identity_;
};

}  // namespace encodings::data
