/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "consensus/consensus_config.hpp"
#include "primitives/bounty.hpp"
#include "primitives/submission.hpp"

namespace nexus::consensus {

  /**
   * Runs weighting, distribution, resolution and agreement for one bounty
   */
  class ConsensusAggregator {
   public:
    virtual ~ConsensusAggregator() = default;

    /**
     * Selects the submissions that take part in consensus: stake at least
     * the bounty minimum, not excluded by a dispute, ordered by submission
     * time (then id) and capped at the configured maximum
     */
    virtual std::vector<primitives::Submission> countedSubmissions(
        const primitives::Bounty &bounty,
        std::vector<primitives::Submission> submissions) const = 0;

    /**
     * Aggregates counted submissions, each must carry its reputation snapshot
     */
    virtual primitives::ConsensusResult aggregate(
        const primitives::Bounty &bounty,
        const std::vector<primitives::Submission> &counted) const = 0;

    /**
     * Replaces the verdict of a computed result by an administrative one,
     * keeping the distribution
     */
    virtual primitives::ConsensusResult imposeVerdict(
        const primitives::ConsensusResult &computed,
        primitives::Verdict verdict) const = 0;

    virtual const ConsensusConfig &config() const = 0;
  };

}  // namespace nexus::consensus
