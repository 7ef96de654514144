/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "primitives/common.hpp"
#include "primitives/consensus_result.hpp"
#include "primitives/decimal.hpp"

namespace nexus::primitives {

  enum class BountyStatus : uint8_t {
    Open,
    Completed,
    Expired,
    Cancelled,
    UnderReview,
  };

  struct Bounty {
    BountyId id;
    AccountId creator;
    Balance reward;
    Balance min_stake;
    uint32_t min_submissions = 0;
    /// Fraction 0..1 of the total weight the winner must reach
    Decimal consensus_threshold;
    Timestamp created_at;
    /// End of the voting window
    Timestamp deadline;
    BountyStatus status = BountyStatus::Open;

    /// Incremented by every committed resolution, expiry included
    uint32_t resolution_round = 0;
    /// Last round whose settlement has been fully recorded
    uint32_t settled_round = 0;

    std::optional<ConsensusResult> consensus;

    /// Owner of an UnderReview bounty, the only one allowed to re-resolve it
    std::optional<std::string> reviewer;

    bool operator==(const Bounty &) const = default;
  };

  inline std::string_view toString(BountyStatus status) {
    switch (status) {
      case BountyStatus::Open:
        return "open";
      case BountyStatus::Completed:
        return "completed";
      case BountyStatus::Expired:
        return "expired";
      case BountyStatus::Cancelled:
        return "cancelled";
      case BountyStatus::UnderReview:
        return "under_review";
    }
    return "unknown";
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::BountyStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::BountyStatus status, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(status), ctx);
  }
};
