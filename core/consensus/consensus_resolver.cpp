/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/consensus_resolver.hpp"

#include <optional>

namespace nexus::consensus {

  using primitives::Verdict;

  namespace {
    constexpr std::array kThresholdEligible{
        Verdict::Malicious,
        Verdict::Benign,
        Verdict::Suspicious,
    };
  }  // namespace

  Resolution resolve(const VerdictDistribution &distribution,
                     const Decimal &threshold) {
    const Decimal required = threshold * 100;

    for (auto verdict : kThresholdEligible) {
      auto &stats = distribution.at(verdict);
      if (stats.count > 0 and stats.percentage >= required) {
        return {verdict, stats.average_confidence, true};
      }
    }

    // fallback to plurality; strict comparison keeps the earlier category
    std::optional<Verdict> best;
    for (auto verdict : primitives::kVerdicts) {
      auto &stats = distribution.at(verdict);
      if (stats.weighted_count <= 0) {
        continue;
      }
      if (not best
          or stats.weighted_count > distribution.at(*best).weighted_count) {
        best = verdict;
      }
    }

    if (not best) {
      return {Verdict::Unknown, Decimal{0}, false};
    }
    return {*best, distribution.at(*best).average_confidence, false};
  }

  bool isConsensusReached(const Resolution &resolution,
                          size_t eligible_submissions,
                          size_t min_submissions) {
    return resolution.threshold_met
       and eligible_submissions >= min_submissions;
  }

}  // namespace nexus::consensus
