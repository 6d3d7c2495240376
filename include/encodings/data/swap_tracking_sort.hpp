// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace encodings::data {

/**
 * @brief Selection sort that accumulates a value per positional move.
 *
 * Each step selects the first minimum of the remaining unsorted slice under a
 * `<=`-style comparator. When the minimum is found at offset `i` from the
 * front of that slice, moving it to the front is `i` adjacent transpositions,
 * and `tracking(i, value)` is folded into the running value. With
 * `tracking = (-1)^i` the result is the sign of the permutation, which is how
 * fermionic reordering phases are computed.
 *
 * Ties keep their original relative order. The sort is quadratic; it is only
 * applied to the operators of a single product term.
 *
 * @tparam T Element type
 * @tparam Tracked Type of the accumulated value
 */
template <typename T, typename Tracked>
class SwapTrackingSort {
 public:
  using compare_type = std::function<bool(const T&, const T&)>;
  using tracking_type = std::function<Tracked(std::size_t, const Tracked&)>;

  /**
   * @param compare `<=`-style comparator: true if the first argument may
   * precede the second
   * @param tracking Folds a displacement into the running value
   */
  SwapTrackingSort(compare_type compare, tracking_type tracking)
      : compare_(std::move(compare)), tracking_(std::move(tracking)) {}

  /**
   * @brief Sort a sequence and accumulate the tracked value
   * @param initial Starting value of the accumulation
   * @param input Sequence to sort
   * @return The sorted sequence and the accumulated value
   */
  std::pair<std::vector<T>, Tracked> sort(const Tracked& initial,
                                          std::vector<T> input) const {
    std::vector<T> sorted;
    sorted.reserve(input.size());
    Tracked value = initial;
    while (!input.empty()) {
      std::size_t i_min = 0;
      for (std::size_t i = 1; i < input.size(); ++i) {
        if (!compare_(input[i_min], input[i])) i_min = i;
      }
      value = tracking_(i_min, value);
      sorted.push_back(std::move(input[i_min]));
      input.erase(input.begin() + static_cast<std::ptrdiff_t>(i_min));
    }
    return {std::move(sorted), value};
  }

  /**
   * @brief Whether every neighbouring pair satisfies the comparator
   */
  bool is_sorted(const std::vector<T>& candidate) const {
    for (std::size_t i = 1; i < candidate.size(); ++i) {
      if (!compare_(candidate[i - 1], candidate[i])) return false;
    }
    return true;
  }

 private:
  compare_type compare_;
  tracking_type tracking_;
};

}  // namespace encodings::data
