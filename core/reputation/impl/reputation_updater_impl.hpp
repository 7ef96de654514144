/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "reputation/reputation_updater.hpp"

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "reputation/reputation_scorer.hpp"
#include "storage/reputation_repository.hpp"

namespace nexus::reputation {

  class ReputationUpdaterImpl final : public ReputationUpdater {
   public:
    /**
     * @param early_window share of the voting window, counted from bounty
     * creation, in which a submission earns the early bonus
     */
    ReputationUpdaterImpl(
        std::shared_ptr<storage::ReputationRepository> repository,
        std::shared_ptr<clock::SystemClock> clock,
        ReputationScorer scorer,
        Decimal early_window);

    outcome::result<void> applyResolution(
        const primitives::Bounty &bounty,
        const primitives::ConsensusResult &result,
        const std::vector<primitives::Submission> &scored,
        const std::vector<primitives::PayoutAction> &plan) override;

    outcome::result<void> refreshRanking() override;

    /// Whether the submission arrived within the early window of the bounty
    bool isEarly(const primitives::Bounty &bounty,
                 const primitives::Submission &submission) const;

   private:
    std::shared_ptr<storage::ReputationRepository> repository_;
    std::shared_ptr<clock::SystemClock> clock_;
    ReputationScorer scorer_;
    Decimal early_window_;
    log::Logger logger_;
  };

}  // namespace nexus::reputation
