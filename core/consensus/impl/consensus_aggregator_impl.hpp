/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/consensus_aggregator.hpp"

#include "consensus/vote_weight.hpp"
#include "log/logger.hpp"

namespace nexus::consensus {

  class ConsensusAggregatorImpl final : public ConsensusAggregator {
   public:
    explicit ConsensusAggregatorImpl(ConsensusConfig config);

    std::vector<primitives::Submission> countedSubmissions(
        const primitives::Bounty &bounty,
        std::vector<primitives::Submission> submissions) const override;

    primitives::ConsensusResult aggregate(
        const primitives::Bounty &bounty,
        const std::vector<primitives::Submission> &counted) const override;

    primitives::ConsensusResult imposeVerdict(
        const primitives::ConsensusResult &computed,
        primitives::Verdict verdict) const override;

    const ConsensusConfig &config() const override {
      return config_;
    }

   private:
    ConsensusConfig config_;
    VoteWeighting weighting_;
    log::Logger logger_;
  };

}  // namespace nexus::consensus
