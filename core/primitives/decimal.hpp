/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "primitives/common.hpp"

namespace nexus::primitives {

  /**
   * Fixed-point decimal used for confidences, weights and percentages.
   * Construct literals from strings ("0.66") to keep them exact, and keep
   * intermediate results in named Decimal values: the arithmetic operators
   * return expression templates.
   */
  using Decimal = boost::multiprecision::cpp_dec_float_50;

  inline Decimal toDecimal(const Balance &amount) {
    return Decimal(amount);
  }

  /// Rounds down to the whole smallest unit; negative values give zero
  inline Balance floorToBalance(const Decimal &value) {
    if (value <= 0) {
      return Balance{0};
    }
    const Decimal floored = boost::multiprecision::floor(value);
    return Balance(floored);
  }

  /// Truncates toward zero, the way the scoring rules round points
  inline int64_t truncToInt(const Decimal &value) {
    const Decimal truncated = boost::multiprecision::trunc(value);
    return truncated.convert_to<int64_t>();
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::Decimal>
    : fmt::formatter<std::string_view> {
  // Presentation: '{}' prints with 6 significant fractional digits
  template <typename FormatContext>
  auto format(const nexus::primitives::Decimal &value,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        value.str(6, std::ios_base::fixed), ctx);
  }
};
