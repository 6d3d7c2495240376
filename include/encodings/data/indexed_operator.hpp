// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <charconv>
#include <cstddef>
#include <encodings/data/terms.hpp>
#include <encodings/utils/hash.hpp>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace encodings::data {

/**
 * @brief Direction of an index ordering check
 */
enum class IndexOrder { Ascending, Descending };

/**
 * @brief An operator unit attached to a mode or qubit index.
 *
 * @tparam Index Index type (an unsigned integer in all concrete uses)
 * @tparam Op Operator unit type
 */
template <typename Index, typename Op>
struct IxOp {
  Index index;
  Op op;

  bool operator==(const IxOp& other) const = default;

  /**
   * @brief Whether a sequence of indexed operators is ordered by index
   *
   * Equal neighbouring indices are accepted in both directions.
   *
   * @param order Required direction
   * @param ops Sequence to check
   * @return true if every neighbouring pair respects the order
   */
  static bool indices_in_order(IndexOrder order, const std::vector<IxOp>& ops) {
    for (std::size_t i = 1; i < ops.size(); ++i) {
      const auto& prev = ops[i - 1].index;
      const auto& curr = ops[i].index;
      const bool ok = order == IndexOrder::Ascending ? prev <= curr
                                                     : prev >= curr;
      if (!ok) return false;
    }
    return true;
  }
};

/**
 * @brief Debug form "(op, index)"
 */
template <typename Index, typename Op>
std::ostream& operator<<(std::ostream& os, const IxOp<Index, Op>& ix) {
  return os << "(" << ix.op << ", " << ix.index << ")";
}

/**
 * @brief Parse the debug form "(op, index)" of an indexed operator
 *
 * @param s Text to parse
 * @param parse_op Parser for the operator token
 * @return The parsed operator, or std::nullopt if the text, the operator
 * token or the (unsigned, base 10) index is malformed
 */
template <typename Index, typename Op, typename OpParser>
std::optional<IxOp<Index, Op>> try_parse_ix_op(std::string_view s,
                                               OpParser&& parse_op) {
  s = detail::trim(s);
  if (s.size() < 2 || s.front() != '(' || s.back() != ')') return std::nullopt;
  auto fields = detail::split(s.substr(1, s.size() - 2), ',');
  if (fields.size() != 2) return std::nullopt;

  std::optional<Op> op = parse_op(detail::trim(fields[0]));
  if (!op) return std::nullopt;

  auto digits = detail::trim(fields[1]);
  Index index{};
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (digits.empty() || ec != std::errc() ||
      ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return IxOp<Index, Op>{index, *op};
}

}  // namespace encodings::data

template <typename Index, typename Op>
struct std::hash<encodings::data::IxOp<Index, Op>> {
  std::size_t operator()(const encodings::data::IxOp<Index, Op>& ix) const {
    return encodings::utils::hash_combine(0, ix.index, ix.op);
  }
};
