/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "bounty/bounty_resolver.hpp"

#include "clock/clock.hpp"
#include "consensus/consensus_aggregator.hpp"
#include "log/logger.hpp"
#include "notification/event_publisher.hpp"
#include "reputation/reputation_updater.hpp"
#include "settlement/settlement_planner.hpp"
#include "storage/bounty_repository.hpp"
#include "storage/payout_repository.hpp"
#include "storage/reputation_repository.hpp"

namespace nexus::bounty {

  class BountyResolverImpl final : public BountyResolver {
   public:
    BountyResolverImpl(
        std::shared_ptr<storage::BountyRepository> bounties,
        std::shared_ptr<storage::PayoutRepository> payouts,
        std::shared_ptr<storage::ReputationRepository> reputations,
        std::shared_ptr<consensus::ConsensusAggregator> aggregator,
        std::shared_ptr<settlement::SettlementPlanner> planner,
        std::shared_ptr<reputation::ReputationUpdater> reputation_updater,
        std::shared_ptr<notification::EventPublisher> publisher,
        std::shared_ptr<clock::SystemClock> clock);

    outcome::result<Evaluation> evaluate(
        const primitives::Bounty &bounty) const override;

    outcome::result<void> finalize(const primitives::Bounty &bounty,
                                   const Evaluation &evaluation,
                                   uint32_t round) override;

    outcome::result<void> expire(const primitives::Bounty &bounty,
                                 const Evaluation &evaluation,
                                 uint32_t round) override;

    outcome::result<void> resume(const primitives::Bounty &bounty) override;

   private:
    /// Submissions with reputation snapshots taken where missing
    outcome::result<std::vector<primitives::Submission>> loadSubmissions(
        const primitives::BountyId &bounty_id) const;

    /// Sets outcome fields of every submission against the result
    std::vector<primitives::Submission> score(
        const Evaluation &evaluation, primitives::Timestamp now) const;

    /**
     * Records the actions of a round once
     * @return the actions stored under the round's plan key
     */
    outcome::result<std::vector<primitives::PayoutAction>> record(
        const primitives::BountyId &bounty_id,
        uint32_t round,
        const std::vector<primitives::PayoutAction> &actions,
        primitives::Timestamp now);

    std::shared_ptr<storage::BountyRepository> bounties_;
    std::shared_ptr<storage::PayoutRepository> payouts_;
    std::shared_ptr<storage::ReputationRepository> reputations_;
    std::shared_ptr<consensus::ConsensusAggregator> aggregator_;
    std::shared_ptr<settlement::SettlementPlanner> planner_;
    std::shared_ptr<reputation::ReputationUpdater> reputation_updater_;
    std::shared_ptr<notification::EventPublisher> publisher_;
    std::shared_ptr<clock::SystemClock> clock_;
    log::Logger logger_;
  };

}  // namespace nexus::bounty
