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

  /// Open -> UnderReview -> Resolved, or Open -> Rejected
  enum class DisputeStatus : uint8_t {
    Open,
    UnderReview,
    Resolved,
    Rejected,
  };

  enum class DisputeResolution : uint8_t {
    Accepted,
    Rejected,
  };

  /// Challenge of one submission of a completed bounty
  struct Dispute {
    DisputeId id;
    BountyId bounty_id;
    SubmissionId submission_id;
    AccountId disputer;
    std::string reason;
    std::string evidence;
    Balance stake;
    DisputeStatus status = DisputeStatus::Open;
    std::optional<std::string> resolution_note;
    std::optional<AccountId> resolver;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> resolved_at;

    bool operator==(const Dispute &) const = default;
  };

  inline std::string_view toString(DisputeStatus status) {
    switch (status) {
      case DisputeStatus::Open:
        return "open";
      case DisputeStatus::UnderReview:
        return "under_review";
      case DisputeStatus::Resolved:
        return "resolved";
      case DisputeStatus::Rejected:
        return "rejected";
    }
    return "unknown";
  }

  inline std::string_view toString(DisputeResolution resolution) {
    switch (resolution) {
      case DisputeResolution::Accepted:
        return "accepted";
      case DisputeResolution::Rejected:
        return "rejected";
    }
    return "unknown";
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::DisputeStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::DisputeStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(status), ctx);
  }
};

template <>
struct fmt::formatter<nexus::primitives::DisputeResolution>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::DisputeResolution resolution,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(resolution), ctx);
  }
};
