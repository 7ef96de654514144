/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/reputation.hpp"
#include "reputation/reputation_config.hpp"

namespace nexus::reputation {

  /// What a resolution says about one submission of an engine
  struct AccuracyOutcome {
    bool correct = false;
    /// Verdict matched the final one of a bounty that reached consensus
    bool in_consensus = false;
    /// Submitted within the early share of the voting window
    bool early = false;
    Decimal confidence;
  };

  /**
   * Reputation arithmetic. Pure, so it is safe to share between threads.
   */
  class ReputationScorer {
   public:
    explicit ReputationScorer(ReputationConfig config);

    /**
     * Score delta for one scored submission:
     * base points, times the streak multiplier when correct, plus the
     * consensus and early bonuses, all scaled by the confidence and
     * truncated toward zero. The delta never moves the score out of the
     * configured bounds.
     */
    int32_t scoreChange(const primitives::ReputationRecord &record,
                        const AccuracyOutcome &outcome) const;

    /**
     * Score after `days` of inactivity, never below the minimum
     */
    int32_t applyDecay(int32_t score, const Decimal &days) const;

    int32_t clamp(int64_t score) const;

    const ReputationConfig &config() const {
      return config_;
    }

   private:
    ReputationConfig config_;
  };

}  // namespace nexus::reputation
