/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/verdict_distribution.hpp"

namespace nexus::consensus {

  VerdictDistribution buildDistribution(const std::vector<WeightedVote> &votes,
                                        bool weighted) {
    VerdictDistribution distribution;
    std::array<Decimal, primitives::kVerdictCount> confidence_sums;

    for (auto &vote : votes) {
      auto &stats = distribution.at(vote.verdict);
      const Decimal contribution = weighted ? vote.weight : Decimal{1};

      stats.count += 1;
      stats.weighted_count += contribution;
      stats.voters.emplace_back(vote.voter);
      confidence_sums[primitives::index(vote.verdict)] += vote.confidence;
      distribution.total_weight += contribution;
    }

    for (auto verdict : primitives::kVerdicts) {
      auto &stats = distribution.at(verdict);
      if (distribution.total_weight > 0) {
        stats.percentage =
            stats.weighted_count / distribution.total_weight * 100;
      }
      if (stats.count > 0) {
        stats.average_confidence =
            confidence_sums[primitives::index(verdict)] / stats.count;
      }
    }

    return distribution;
  }

}  // namespace nexus::consensus
