/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "primitives/common.hpp"
#include "primitives/decimal.hpp"
#include "primitives/verdict.hpp"

namespace nexus::primitives {

  enum class SubmissionStatus : uint8_t {
    Pending,
    Correct,
    Incorrect,
  };

  /**
   * One engine's vote on a bounty. Ingestion guarantees confidence in [0, 1]
   * and a positive stake; outcome fields stay unset until the bounty resolves
   * and are rewritten on every re-resolution.
   */
  struct Submission {
    SubmissionId id;
    BountyId bounty_id;
    EngineId engine_id;
    Verdict verdict = Verdict::Unknown;
    Decimal confidence;
    Balance stake;
    Timestamp submitted_at;

    /// Reputation used for weighting, fixed at the first resolution
    std::optional<int32_t> reputation_snapshot;

    SubmissionStatus status = SubmissionStatus::Pending;
    std::optional<Decimal> accuracy_score;
    std::optional<Timestamp> processed_at;

    /// Removed from consensus by an upheld dispute
    bool excluded = false;

    bool operator==(const Submission &) const = default;
  };

  inline std::string_view toString(SubmissionStatus status) {
    switch (status) {
      case SubmissionStatus::Pending:
        return "pending";
      case SubmissionStatus::Correct:
        return "correct";
      case SubmissionStatus::Incorrect:
        return "incorrect";
    }
    return "unknown";
  }

}  // namespace nexus::primitives

template <>
struct fmt::formatter<nexus::primitives::SubmissionStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(nexus::primitives::SubmissionStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        nexus::primitives::toString(status), ctx);
  }
};
