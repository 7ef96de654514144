/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "dispute/dispute_resolver.hpp"

#include <optional>

#include "bounty/bounty_resolver.hpp"
#include "clock/clock.hpp"
#include "consensus/consensus_aggregator.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "notification/event_publisher.hpp"
#include "settlement/settlement_planner.hpp"
#include "storage/bounty_repository.hpp"
#include "storage/dispute_repository.hpp"
#include "storage/payout_repository.hpp"

namespace nexus::dispute {

  class DisputeResolverImpl final : public DisputeResolver {
   public:
    DisputeResolverImpl(
        std::shared_ptr<storage::DisputeRepository> disputes,
        std::shared_ptr<storage::BountyRepository> bounties,
        std::shared_ptr<storage::PayoutRepository> payouts,
        std::shared_ptr<bounty::BountyResolver> bounty_resolver,
        std::shared_ptr<consensus::ConsensusAggregator> aggregator,
        std::shared_ptr<settlement::SettlementPlanner> planner,
        std::shared_ptr<notification::EventPublisher> publisher,
        std::shared_ptr<clock::SystemClock> clock,
        std::shared_ptr<metrics::Registry> metrics_registry);

    outcome::result<primitives::Dispute> openDispute(
        const DisputeRequest &request) override;

    outcome::result<primitives::Dispute> resolveDispute(
        const primitives::DisputeId &dispute_id,
        primitives::DisputeResolution resolution,
        const primitives::AccountId &resolver,
        std::string note) override;

    outcome::result<primitives::ConsensusResult> overrideVerdict(
        const primitives::BountyId &bounty_id,
        primitives::Verdict verdict,
        const primitives::AccountId &admin) override;

   private:
    outcome::result<primitives::Dispute> accept(
        primitives::Dispute dispute,
        const primitives::AccountId &resolver,
        std::string note);

    outcome::result<primitives::Dispute> reject(
        primitives::Dispute dispute,
        const primitives::AccountId &resolver,
        std::string note);

    /**
     * Takes a completed bounty under review for \param reviewer, optionally
     * excludes a submission, and commits and settles a new resolution round
     */
    outcome::result<primitives::ConsensusResult> reopen(
        primitives::Bounty bounty,
        const std::string &reviewer,
        const std::optional<primitives::SubmissionId> &exclude,
        std::optional<primitives::Verdict> imposed);

    outcome::result<primitives::Submission> findSubmission(
        const primitives::BountyId &bounty_id,
        const primitives::SubmissionId &submission_id) const;

    outcome::result<void> recordStakePlan(
        const primitives::Dispute &dispute,
        primitives::DisputeResolution resolution,
        primitives::Timestamp now);

    std::shared_ptr<storage::DisputeRepository> disputes_;
    std::shared_ptr<storage::BountyRepository> bounties_;
    std::shared_ptr<storage::PayoutRepository> payouts_;
    std::shared_ptr<bounty::BountyResolver> bounty_resolver_;
    std::shared_ptr<consensus::ConsensusAggregator> aggregator_;
    std::shared_ptr<settlement::SettlementPlanner> planner_;
    std::shared_ptr<notification::EventPublisher> publisher_;
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<metrics::Registry> metrics_registry_;
    metrics::Counter *metric_resolved_;
    log::Logger logger_;
  };

}  // namespace nexus::dispute
