/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/consensus_config.hpp"
#include "primitives/submission.hpp"

namespace nexus::consensus {

  /**
   * Vote weighting model. Combines the submitter reputation, the declared
   * confidence and the time factor into a weight bounded by [0, 1]:
   *
   *   (rep / kReputationCeiling * Wr + confidence * Wc + time * Wt)
   *     / (Wr + Wc + Wt)
   *
   * Stake gates eligibility but does not scale the weight.
   */
  class VoteWeighting {
   public:
    static constexpr int32_t kReputationCeiling = 10000;

    explicit VoteWeighting(const ConsensusConfig &config);

    Decimal weight(const Decimal &confidence,
                   int32_t reputation,
                   const Decimal &time_factor) const;

    Decimal weight(const primitives::Submission &submission,
                   int32_t reputation) const;

    /**
     * Time factor of the submission at position `order` (0-based) out of
     * `total` counted ones. Constant for now; any replacement must stay
     * deterministic and within (0, 1].
     */
    static Decimal timeFactor(size_t order, size_t total);

   private:
    Decimal reputation_weight_;
    Decimal confidence_weight_;
    Decimal time_weight_;
    Decimal weight_sum_;
  };

}  // namespace nexus::consensus
