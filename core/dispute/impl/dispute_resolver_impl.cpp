/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute/impl/dispute_resolver_impl.hpp"

#include <algorithm>

#include "bounty/resolution_error.hpp"
#include "dispute/dispute_error.hpp"
#include "storage/storage_error.hpp"

namespace {
  constexpr auto disputesResolvedMetricName = "nexus_disputes_resolved_total";
  // overrides share one reviewer so any admin can finish an interrupted one
  constexpr auto overrideReviewer = "override";
}

namespace nexus::dispute {

  using bounty::ResolutionError;
  using primitives::Bounty;
  using primitives::BountyStatus;
  using primitives::Dispute;
  using primitives::DisputeResolution;
  using primitives::DisputeStatus;
  using primitives::Submission;

  DisputeResolverImpl::DisputeResolverImpl(
      std::shared_ptr<storage::DisputeRepository> disputes,
      std::shared_ptr<storage::BountyRepository> bounties,
      std::shared_ptr<storage::PayoutRepository> payouts,
      std::shared_ptr<bounty::BountyResolver> bounty_resolver,
      std::shared_ptr<consensus::ConsensusAggregator> aggregator,
      std::shared_ptr<settlement::SettlementPlanner> planner,
      std::shared_ptr<notification::EventPublisher> publisher,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<metrics::Registry> metrics_registry)
      : disputes_{std::move(disputes)},
        bounties_{std::move(bounties)},
        payouts_{std::move(payouts)},
        bounty_resolver_{std::move(bounty_resolver)},
        aggregator_{std::move(aggregator)},
        planner_{std::move(planner)},
        publisher_{std::move(publisher)},
        clock_{std::move(clock)},
        metrics_registry_{std::move(metrics_registry)},
        logger_{log::createLogger("DisputeResolver", "dispute")} {
    BOOST_ASSERT(disputes_);
    BOOST_ASSERT(bounties_);
    BOOST_ASSERT(payouts_);
    BOOST_ASSERT(bounty_resolver_);
    BOOST_ASSERT(aggregator_);
    BOOST_ASSERT(planner_);
    BOOST_ASSERT(publisher_);
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(metrics_registry_);

    metrics_registry_->registerCounterFamily(
        disputesResolvedMetricName, "Number of disputes accepted or rejected");
    metric_resolved_ =
        metrics_registry_->registerCounterMetric(disputesResolvedMetricName);
  }

  outcome::result<Submission> DisputeResolverImpl::findSubmission(
      const primitives::BountyId &bounty_id,
      const primitives::SubmissionId &submission_id) const {
    OUTCOME_TRY(submissions, bounties_->getSubmissions(bounty_id));
    auto it = std::find_if(
        submissions.begin(), submissions.end(), [&](const Submission &s) {
          return s.id == submission_id;
        });
    if (it == submissions.end()) {
      return DisputeError::SUBMISSION_NOT_IN_BOUNTY;
    }
    return std::move(*it);
  }

  outcome::result<Dispute> DisputeResolverImpl::openDispute(
      const DisputeRequest &request) {
    if (request.reason.empty()) {
      return DisputeError::EMPTY_REASON;
    }
    if (request.stake == 0) {
      return DisputeError::ZERO_STAKE;
    }

    OUTCOME_TRY(bounty, bounties_->getBounty(request.bounty_id));
    if (bounty.status != BountyStatus::Completed) {
      return DisputeError::BOUNTY_NOT_COMPLETED;
    }
    OUTCOME_TRY(findSubmission(bounty.id, request.submission_id));

    const bool eligible = bounty.consensus and bounty.consensus->dispute_eligible;
    if (not eligible and not request.admin) {
      return DisputeError::DISPUTE_WINDOW_CLOSED;
    }

    OUTCOME_TRY(existing, disputes_->getDisputes(bounty.id));
    auto now = clock_->now();
    Dispute dispute{
        .id = fmt::format("{}:{}:{}",
                          bounty.id,
                          request.submission_id,
                          existing.size() + 1),
        .bounty_id = bounty.id,
        .submission_id = request.submission_id,
        .disputer = request.disputer,
        .reason = request.reason,
        .evidence = request.evidence,
        .stake = request.stake,
        .created_at = now,
        .updated_at = now,
    };
    OUTCOME_TRY(disputes_->putDispute(dispute));

    SL_INFO(logger_,
            "Dispute {} opened by {} against submission {}{}",
            dispute.id,
            dispute.disputer,
            dispute.submission_id,
            eligible ? "" : " outside of the dispute window");
    return dispute;
  }

  outcome::result<Dispute> DisputeResolverImpl::resolveDispute(
      const primitives::DisputeId &dispute_id,
      DisputeResolution resolution,
      const primitives::AccountId &resolver,
      std::string note) {
    auto loaded = disputes_->getDispute(dispute_id);
    if (loaded.has_error()) {
      if (loaded.error() == storage::StorageError::NOT_FOUND) {
        return DisputeError::DISPUTE_NOT_FOUND;
      }
      return loaded.as_failure();
    }
    auto &dispute = loaded.value();

    if (resolution == DisputeResolution::Accepted) {
      return accept(std::move(dispute), resolver, std::move(note));
    }
    return reject(std::move(dispute), resolver, std::move(note));
  }

  outcome::result<Dispute> DisputeResolverImpl::accept(
      Dispute dispute, const primitives::AccountId &resolver, std::string note) {
    const bool was_open = dispute.status == DisputeStatus::Open;
    if (was_open) {
      OUTCOME_TRY(claimed,
                  disputes_->compareAndSetStatus(dispute.id,
                                                 DisputeStatus::Open,
                                                 DisputeStatus::UnderReview,
                                                 clock_->now()));
      if (not claimed) {
        return DisputeError::DISPUTE_ALREADY_CLOSED;
      }
      dispute.status = DisputeStatus::UnderReview;
    } else if (dispute.status != DisputeStatus::UnderReview) {
      return DisputeError::DISPUTE_ALREADY_CLOSED;
    }

    OUTCOME_TRY(bounty, bounties_->getBounty(dispute.bounty_id));
    OUTCOME_TRY(submission,
                findSubmission(dispute.bounty_id, dispute.submission_id));

    std::optional<primitives::Verdict> verdict;
    if (bounty.status == BountyStatus::Completed and submission.excluded) {
      // committed by an interrupted call, settlement is the worker's
      SL_VERBOSE(logger_,
                 "Bounty {} was already re-resolved for dispute {}",
                 bounty.id,
                 dispute.id);
      if (bounty.consensus) {
        verdict = bounty.consensus->final_verdict;
      }
    } else {
      auto result = reopen(bounty, dispute.id, submission.id, std::nullopt);
      if (result.has_error()) {
        if (was_open and result.error() == DisputeError::BOUNTY_UNDER_REVIEW) {
          // nothing was changed for this dispute, give it back
          OUTCOME_TRY(disputes_->compareAndSetStatus(dispute.id,
                                                     DisputeStatus::UnderReview,
                                                     DisputeStatus::Open,
                                                     clock_->now()));
        }
        return result.as_failure();
      }
      verdict = result.value().final_verdict;
    }

    auto now = clock_->now();
    OUTCOME_TRY(recordStakePlan(dispute, DisputeResolution::Accepted, now));

    dispute.status = DisputeStatus::Resolved;
    dispute.resolver = resolver;
    dispute.resolution_note = std::move(note);
    dispute.resolved_at = now;
    dispute.updated_at = now;
    OUTCOME_TRY(disputes_->updateDispute(dispute));
    metric_resolved_->inc();

    SL_INFO(logger_,
            "Dispute {} accepted by {}, submission {} excluded, verdict {}",
            dispute.id,
            resolver,
            dispute.submission_id,
            verdict.value_or(primitives::Verdict::Unknown));
    publisher_->publish(notification::DisputeResolved{
        .dispute_id = dispute.id,
        .bounty_id = dispute.bounty_id,
        .resolution = DisputeResolution::Accepted,
        .verdict = verdict,
    });
    return dispute;
  }

  outcome::result<Dispute> DisputeResolverImpl::reject(
      Dispute dispute, const primitives::AccountId &resolver, std::string note) {
    auto now = clock_->now();
    OUTCOME_TRY(claimed,
                disputes_->compareAndSetStatus(dispute.id,
                                               DisputeStatus::Open,
                                               DisputeStatus::Rejected,
                                               now));
    if (not claimed) {
      return DisputeError::DISPUTE_ALREADY_CLOSED;
    }
    OUTCOME_TRY(recordStakePlan(dispute, DisputeResolution::Rejected, now));

    dispute.status = DisputeStatus::Rejected;
    dispute.resolver = resolver;
    dispute.resolution_note = std::move(note);
    dispute.resolved_at = now;
    dispute.updated_at = now;
    OUTCOME_TRY(disputes_->updateDispute(dispute));
    metric_resolved_->inc();

    SL_INFO(logger_,
            "Dispute {} rejected by {}, stake of {} forfeited",
            dispute.id,
            resolver,
            dispute.disputer);
    publisher_->publish(notification::DisputeResolved{
        .dispute_id = dispute.id,
        .bounty_id = dispute.bounty_id,
        .resolution = DisputeResolution::Rejected,
    });
    return dispute;
  }

  outcome::result<void> DisputeResolverImpl::recordStakePlan(
      const Dispute &dispute,
      DisputeResolution resolution,
      primitives::Timestamp now) {
    auto actions = planner_->planDisputeStake(dispute, resolution);
    OUTCOME_TRY(payouts_->recordPlan(
        settlement::SettlementPlanner::disputePlanKey(dispute.id),
        actions,
        now));
    return outcome::success();
  }

  outcome::result<primitives::ConsensusResult> DisputeResolverImpl::reopen(
      Bounty bounty,
      const std::string &reviewer,
      const std::optional<primitives::SubmissionId> &exclude,
      std::optional<primitives::Verdict> imposed) {
    if (bounty.status != BountyStatus::Completed
        and bounty.status != BountyStatus::UnderReview) {
      return DisputeError::BOUNTY_NOT_COMPLETED;
    }
    // nothing is written before the review is ours
    OUTCOME_TRY(taken, bounties_->claimReview(bounty.id, reviewer));
    if (not taken) {
      return DisputeError::BOUNTY_UNDER_REVIEW;
    }
    bounty.status = BountyStatus::UnderReview;
    bounty.reviewer = reviewer;

    if (exclude) {
      OUTCOME_TRY(bounties_->excludeSubmission(bounty.id, *exclude));
    }

    OUTCOME_TRY(evaluation, bounty_resolver_->evaluate(bounty));
    if (imposed) {
      evaluation.result =
          aggregator_->imposeVerdict(evaluation.result, *imposed);
    }

    OUTCOME_TRY(round,
                bounties_->commitResolution(bounty.id,
                                            BountyStatus::UnderReview,
                                            BountyStatus::Completed,
                                            evaluation.result));
    if (not round) {
      return ResolutionError::RESOLUTION_RACE_LOST;
    }
    bounty.status = BountyStatus::Completed;
    bounty.resolution_round = *round;
    bounty.consensus = evaluation.result;

    SL_VERBOSE(logger_,
               "Bounty {} re-resolved in round {}: verdict {}",
               bounty.id,
               *round,
               evaluation.result.final_verdict);
    OUTCOME_TRY(bounty_resolver_->finalize(bounty, evaluation, *round));
    return std::move(evaluation.result);
  }

  outcome::result<primitives::ConsensusResult>
  DisputeResolverImpl::overrideVerdict(const primitives::BountyId &bounty_id,
                                       primitives::Verdict verdict,
                                       const primitives::AccountId &admin) {
    OUTCOME_TRY(bounty, bounties_->getBounty(bounty_id));
    if (bounty.status != BountyStatus::Completed
        and bounty.status != BountyStatus::UnderReview) {
      return DisputeError::BOUNTY_NOT_COMPLETED;
    }
    SL_WARN(logger_,
            "Verdict of bounty {} overridden to {} by {}",
            bounty_id,
            verdict,
            admin);
    return reopen(std::move(bounty), overrideReviewer, std::nullopt, verdict);
  }

}  // namespace nexus::dispute
