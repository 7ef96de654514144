/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace nexus::primitives {

  /// Classification of an analysed artifact
  enum class Verdict : uint8_t {
    Malicious = 0,
    Benign,
    Suspicious,
    /// No signal; never wins by reaching a threshold
    Unknown,
  };

  constexpr size_t kVerdictCount = 4;

  /// Canonical order; also the priority order of tie-breaks
  constexpr std::array<Verdict, kVerdictCount> kVerdicts{
      Verdict::Malicious,
      Verdict::Benign,
      Verdict::Suspicious,
      Verdict::Unknown,
  };

  constexpr size_t index(Verdict verdict) {
    return static_cast<size_t>(verdict);
  }

  std::string_view toString(Verdict verdict);

  std::optional<Verdict> verdictFromString(std::string_view str);

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::Verdict>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::Verdict verdict, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(verdict), ctx);
  }
};
