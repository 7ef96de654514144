/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "primitives/common.hpp"

namespace nexus::primitives {

  enum class PayoutType : uint8_t {
    BountyReward,
    StakeReturn,
    /// Forfeited stake, paid to the treasury
    StakeSlash,
    Fee,
    /// Reward or dispute stake returned to its owner
    Refund,
  };

  enum class PayoutStatus : uint8_t {
    Pending,
    Processing,
    Completed,
    Failed,
  };

  /**
   * Intended movement of funds. The id is derived from the bounty, the plan
   * it belongs to, the subject and the type, so a regenerated plan carries
   * the same ids.
   */
  struct PayoutAction {
    PayoutId id;
    BountyId bounty_id;
    std::optional<SubmissionId> submission_id;
    AccountId recipient;
    Balance amount;
    PayoutType type = PayoutType::BountyReward;
    uint32_t round = 0;

    bool operator==(const PayoutAction &) const = default;
  };

  /// Execution state of a planned action
  struct Payout {
    PayoutAction action;
    PayoutStatus status = PayoutStatus::Pending;
    std::optional<std::string> transaction_hash;
    uint32_t attempts = 0;
    std::optional<Timestamp> next_attempt_at;
    std::optional<std::string> last_error;
    Timestamp created_at;
    std::optional<Timestamp> processed_at;

    bool operator==(const Payout &) const = default;
  };

  inline std::string_view toString(PayoutType type) {
    switch (type) {
      case PayoutType::BountyReward:
        return "bounty_reward";
      case PayoutType::StakeReturn:
        return "stake_return";
      case PayoutType::StakeSlash:
        return "stake_slash";
      case PayoutType::Fee:
        return "fee";
      case PayoutType::Refund:
        return "refund";
    }
    return "unknown";
  }

  inline std::string_view toString(PayoutStatus status) {
    switch (status) {
      case PayoutStatus::Pending:
        return "pending";
      case PayoutStatus::Processing:
        return "processing";
      case PayoutStatus::Completed:
        return "completed";
      case PayoutStatus::Failed:
        return "failed";
    }
    return "unknown";
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::PayoutType>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::PayoutType type, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(type), ctx);
  }
};

template <>
struct fmt::formatter<nexus::primitives::PayoutStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::PayoutStatus status, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(status), ctx);
  }
};
