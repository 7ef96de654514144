/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"
#include "primitives/decimal.hpp"

namespace nexus::primitives {

  enum class ReputationTier : uint8_t {
    Novice,
    Skilled,
    Expert,
    Master,
    Legendary,
  };

  struct ReputationRecord {
    EngineId engine_id;
    int32_t score = 0;
    uint32_t total_submissions = 0;
    uint32_t correct_submissions = 0;
    uint32_t current_streak = 0;
    uint32_t best_streak = 0;
    Balance total_earned;
    /// 1-based position by score, 0 until ranked
    uint32_t rank = 0;
    Decimal percentile;
    Timestamp last_active;
    Timestamp last_decay;

    Decimal accuracyRate() const {
      if (total_submissions == 0) {
        return Decimal{0};
      }
      return Decimal(correct_submissions) / total_submissions;
    }

    bool operator==(const ReputationRecord &) const = default;
  };

  inline ReputationTier tierOf(int32_t score) {
    if (score < 100) {
      return ReputationTier::Novice;
    }
    if (score < 500) {
      return ReputationTier::Skilled;
    }
    if (score < 1000) {
      return ReputationTier::Expert;
    }
    if (score < 2500) {
      return ReputationTier::Master;
    }
    return ReputationTier::Legendary;
  }

  inline std::string_view toString(ReputationTier tier) {
    switch (tier) {
      case ReputationTier::Novice:
        return "novice";
      case ReputationTier::Skilled:
        return "skilled";
      case ReputationTier::Expert:
        return "expert";
      case ReputationTier::Master:
        return "master";
      case ReputationTier::Legendary:
        return "legendary";
    }
    return "unknown";
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::ReputationTier>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::ReputationTier tier, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(tier), ctx);
  }
};
