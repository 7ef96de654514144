/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/bounty.hpp"
#include "primitives/payout.hpp"
#include "primitives/submission.hpp"

namespace nexus::reputation {

  /**
   * Feeds resolution outcomes into engine reputation
   */
  class ReputationUpdater {
   public:
    virtual ~ReputationUpdater() = default;

    /**
     * Applies the reputation change of every scored submission and credits
     * the rewards of `plan` to their recipients. Safe to repeat: a
     * submission outcome and a reward are each applied once.
     */
    virtual outcome::result<void> applyResolution(
        const primitives::Bounty &bounty,
        const primitives::ConsensusResult &result,
        const std::vector<primitives::Submission> &scored,
        const std::vector<primitives::PayoutAction> &plan) = 0;

    /// Recomputes rank and percentile of every engine
    virtual outcome::result<void> refreshRanking() = 0;
  };

}  // namespace nexus::reputation
