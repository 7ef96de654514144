/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "log/logger.hpp"
#include "primitives/bounty.hpp"
#include "primitives/dispute.hpp"
#include "primitives/payout.hpp"
#include "primitives/submission.hpp"
#include "settlement/settlement_config.hpp"

namespace nexus::settlement {

  using primitives::PayoutAction;

  /**
   * Translates a resolution into the money movements it implies. The planner
   * never moves funds itself. Plans are deterministic: the same inputs give
   * the same actions with the same ids in the same order.
   */
  class SettlementPlanner {
   public:
    explicit SettlementPlanner(SettlementConfig config);

    /**
     * Plan of a bounty that reached consensus.
     * Correct submissions get their stake back and share the reward pool in
     * proportion to their weight; the rounding remainder goes to the
     * heaviest of them. Incorrect submissions lose `slash_fraction` of their
     * stake to the treasury and get the rest back. Submissions that did not
     * take part (status Pending) get their stake back. If nobody was correct,
     * the pool returns to the bounty creator.
     * @param submissions every submission of the bounty, after scoring
     */
    std::vector<PayoutAction> plan(
        const primitives::Bounty &bounty,
        const primitives::ConsensusResult &result,
        const std::vector<primitives::Submission> &submissions,
        uint32_t round) const;

    /**
     * Plan of a bounty settled without consensus: every stake returns to its
     * owner and the reward returns to the creator.
     * "Every" includes submissions that were never counted, such as those
     * staking less than `min_stake`.
     */
    std::vector<PayoutAction> planStakeReturn(
        const primitives::Bounty &bounty,
        const std::vector<primitives::Submission> &submissions,
        uint32_t round) const;

    /**
     * Compensating actions that bring what `previous` paid up to `target`.
     * Only positive differences are emitted and slashes are never repeated:
     * money already paid out stays paid.
     */
    static std::vector<PayoutAction> reconcile(
        const std::vector<PayoutAction> &previous,
        const std::vector<PayoutAction> &target);

    /**
     * Settles the stake of a resolved dispute: returned to the disputer when
     * the dispute is accepted, forfeited to the treasury when rejected
     */
    std::vector<PayoutAction> planDisputeStake(
        const primitives::Dispute &dispute,
        primitives::DisputeResolution resolution) const;

    static std::string planKey(const primitives::BountyId &bounty_id,
                               uint32_t round);

    static std::string disputePlanKey(const primitives::DisputeId &dispute_id);

    const SettlementConfig &config() const {
      return config_;
    }

   private:
    SettlementConfig config_;
    log::Logger logger_;
  };

}  // namespace nexus::settlement
