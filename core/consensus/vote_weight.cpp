/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/vote_weight.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace nexus::consensus {

  VoteWeighting::VoteWeighting(const ConsensusConfig &config)
      : reputation_weight_{config.reputation_weight},
        confidence_weight_{config.confidence_weight},
        time_weight_{config.time_weight},
        weight_sum_{config.reputation_weight + config.confidence_weight
                    + config.time_weight} {
    BOOST_ASSERT_MSG(weight_sum_ > 0, "weight coefficients must not all be 0");
  }

  Decimal VoteWeighting::weight(const Decimal &confidence,
                                int32_t reputation,
                                const Decimal &time_factor) const {
    BOOST_ASSERT(confidence >= 0 and confidence <= 1);

    auto clamped = std::clamp(reputation, 0, kReputationCeiling);
    const Decimal reputation_factor = Decimal(clamped) / kReputationCeiling;

    const Decimal combined = reputation_factor * reputation_weight_
                           + confidence * confidence_weight_
                           + time_factor * time_weight_;
    return combined / weight_sum_;
  }

  Decimal VoteWeighting::weight(const primitives::Submission &submission,
                                int32_t reputation) const {
    return weight(submission.confidence, reputation, timeFactor(0, 1));
  }

  Decimal VoteWeighting::timeFactor(size_t, size_t) {
    return Decimal{1};
  }

}  // namespace nexus::consensus
