/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

namespace nexus::primitives {

  using BountyId = std::string;
  using SubmissionId = std::string;
  using DisputeId = std::string;
  using PayoutId = std::string;

  /// Identity of an analysis engine, also the account it is paid to
  using EngineId = std::string;
  using AccountId = std::string;

  using Timestamp = std::chrono::system_clock::time_point;

  /// Amount in the smallest currency unit
  using Balance = boost::multiprecision::uint128_t;

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::Balance>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const nexus::primitives::Balance &balance,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(balance.str(), ctx);
  }
};
