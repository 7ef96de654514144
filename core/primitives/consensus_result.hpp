/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <map>
#include <vector>

#include "primitives/common.hpp"
#include "primitives/decimal.hpp"
#include "primitives/verdict.hpp"

namespace nexus::primitives {

  /// Aggregate of the votes given for one verdict category
  struct VoteStats {
    size_t count = 0;
    Decimal weighted_count;
    /// Share of the total weight, 0..100
    Decimal percentage;
    Decimal average_confidence;
    /// In input order
    std::vector<EngineId> voters;

    bool operator==(const VoteStats &) const = default;
  };

  /// Per-verdict statistics, always holding all four categories
  struct VerdictDistribution {
    std::array<VoteStats, kVerdictCount> stats;
    Decimal total_weight;

    const VoteStats &at(Verdict verdict) const {
      return stats[index(verdict)];
    }

    VoteStats &at(Verdict verdict) {
      return stats[index(verdict)];
    }

    size_t totalCount() const {
      size_t total = 0;
      for (auto &s : stats) {
        total += s.count;
      }
      return total;
    }

    bool operator==(const VerdictDistribution &) const = default;
  };

  /**
   * Outcome of aggregating a bounty's votes. Recomputed on demand, the last
   * computation is cached on the bounty.
   */
  struct ConsensusResult {
    BountyId bounty_id;
    Verdict final_verdict = Verdict::Unknown;
    /// Average confidence of the submissions matching the final verdict
    Decimal confidence;
    size_t total_submissions = 0;
    VerdictDistribution distribution;
    /// Winning share of the total weight, 0..1
    Decimal weighted_score;
    bool consensus_reached = false;
    /// Largest category percentage, 0..100
    Decimal agreement_score;
    bool dispute_eligible = false;
    /// Whether the distribution was built from weights or plain counts
    bool weighted_voting = true;
    /// Model weight of every counted submission
    std::map<SubmissionId, Decimal> weights;

    bool operator==(const ConsensusResult &) const = default;
  };

}  // namespace nexus::primitives
