/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "primitives/common.hpp"
#include "primitives/decimal.hpp"
#include "primitives/dispute.hpp"
#include "primitives/verdict.hpp"

namespace nexus::notification {

  enum class EventType : uint8_t {
    BountyCompleted,
    BountyExpired,
    DisputeResolved,
    PayoutFailed,
  };

  struct BountyCompleted {
    primitives::BountyId bounty_id;
    primitives::Verdict verdict = primitives::Verdict::Unknown;
    primitives::Decimal confidence;
    /// Engines whose submissions were counted
    std::vector<primitives::EngineId> participants;
    uint32_t round = 0;
  };

  struct BountyExpired {
    primitives::BountyId bounty_id;
    /// Engines getting their stake back
    std::vector<primitives::EngineId> participants;
  };

  struct DisputeResolved {
    primitives::DisputeId dispute_id;
    primitives::BountyId bounty_id;
    primitives::DisputeResolution resolution =
        primitives::DisputeResolution::Rejected;
    /// Verdict after re-resolution, none when the dispute was rejected
    std::optional<primitives::Verdict> verdict;
  };

  struct PayoutFailed {
    primitives::PayoutId payout_id;
    primitives::BountyId bounty_id;
    std::string reason;
  };

  using Event =
      std::variant<BountyCompleted, BountyExpired, DisputeResolved, PayoutFailed>;

  inline EventType eventType(const Event &event) {
    return static_cast<EventType>(event.index());
  }

  inline std::string_view toString(EventType type) {
    switch (type) {
      case EventType::BountyCompleted:
        return "bounty.completed";
      case EventType::BountyExpired:
        return "bounty.expired";
      case EventType::DisputeResolved:
        return "dispute.resolved";
      case EventType::PayoutFailed:
        return "payout.failed";
    }
    return "unknown";
  }

}  // namespace nexus::notification

template <>
struct fmt::formatter<nexus::notification::EventType>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::notification::EventType type, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::notification::toString(type), ctx);
  }
};
