/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bounty/impl/bounty_resolver_impl.hpp"

#include <unordered_set>

#include "bounty/resolution_error.hpp"
#include "consensus/accuracy_scorer.hpp"

namespace nexus::bounty {

  namespace {
    // rounds after the first count only what the committed round weighed
    std::vector<primitives::Submission> weighedBefore(
        const primitives::Bounty &bounty,
        std::vector<primitives::Submission> submissions) {
      if (bounty.consensus) {
        auto &weights = bounty.consensus->weights;
        std::erase_if(submissions, [&](const primitives::Submission &s) {
          return not weights.contains(s.id);
        });
      }
      return submissions;
    }

    std::vector<primitives::EngineId> engines(
        const std::vector<primitives::Submission> &submissions) {
      std::vector<primitives::EngineId> ids;
      ids.reserve(submissions.size());
      for (auto &submission : submissions) {
        ids.push_back(submission.engine_id);
      }
      return ids;
    }
  }  // namespace

  using primitives::Bounty;
  using primitives::BountyStatus;
  using primitives::PayoutAction;
  using primitives::Submission;
  using primitives::SubmissionStatus;
  using settlement::SettlementPlanner;

  BountyResolverImpl::BountyResolverImpl(
      std::shared_ptr<storage::BountyRepository> bounties,
      std::shared_ptr<storage::PayoutRepository> payouts,
      std::shared_ptr<storage::ReputationRepository> reputations,
      std::shared_ptr<consensus::ConsensusAggregator> aggregator,
      std::shared_ptr<settlement::SettlementPlanner> planner,
      std::shared_ptr<reputation::ReputationUpdater> reputation_updater,
      std::shared_ptr<notification::EventPublisher> publisher,
      std::shared_ptr<clock::SystemClock> clock)
      : bounties_{std::move(bounties)},
        payouts_{std::move(payouts)},
        reputations_{std::move(reputations)},
        aggregator_{std::move(aggregator)},
        planner_{std::move(planner)},
        reputation_updater_{std::move(reputation_updater)},
        publisher_{std::move(publisher)},
        clock_{std::move(clock)},
        logger_{log::createLogger("BountyResolver", "bounty")} {
    BOOST_ASSERT(bounties_);
    BOOST_ASSERT(payouts_);
    BOOST_ASSERT(reputations_);
    BOOST_ASSERT(aggregator_);
    BOOST_ASSERT(planner_);
    BOOST_ASSERT(reputation_updater_);
    BOOST_ASSERT(publisher_);
    BOOST_ASSERT(clock_);
  }

  outcome::result<std::vector<Submission>> BountyResolverImpl::loadSubmissions(
      const primitives::BountyId &bounty_id) const {
    OUTCOME_TRY(submissions, bounties_->getSubmissions(bounty_id));
    for (auto &submission : submissions) {
      if (not submission.reputation_snapshot) {
        OUTCOME_TRY(score, reputations_->getScore(submission.engine_id));
        submission.reputation_snapshot = score;
      }
    }
    return submissions;
  }

  outcome::result<Evaluation> BountyResolverImpl::evaluate(
      const Bounty &bounty) const {
    OUTCOME_TRY(submissions, loadSubmissions(bounty.id));
    auto counted = aggregator_->countedSubmissions(
        bounty, weighedBefore(bounty, submissions));
    auto result = aggregator_->aggregate(bounty, counted);
    SL_TRACE(logger_,
             "Bounty {} evaluated: {} of {} submissions counted, "
             "verdict {} reached {}",
             bounty.id,
             counted.size(),
             submissions.size(),
             result.final_verdict,
             result.consensus_reached);
    return Evaluation{
        .result = std::move(result),
        .submissions = std::move(submissions),
        .counted = std::move(counted),
    };
  }

  std::vector<Submission> BountyResolverImpl::score(
      const Evaluation &evaluation, primitives::Timestamp now) const {
    auto &result = evaluation.result;
    std::unordered_set<primitives::SubmissionId> counted;
    for (auto &submission : evaluation.counted) {
      counted.emplace(submission.id);
    }

    auto scored = evaluation.submissions;
    for (auto &submission : scored) {
      if (not result.consensus_reached
          or (not counted.contains(submission.id) and not submission.excluded)) {
        submission.status = SubmissionStatus::Pending;
        submission.accuracy_score.reset();
        submission.processed_at.reset();
        continue;
      }
      if (submission.excluded) {
        submission.status = SubmissionStatus::Incorrect;
        submission.accuracy_score = primitives::Decimal{0};
      } else {
        submission.accuracy_score = consensus::accuracyScore(
            submission.verdict, result.final_verdict, submission.confidence);
        submission.status = submission.verdict == result.final_verdict
                              ? SubmissionStatus::Correct
                              : SubmissionStatus::Incorrect;
      }
      submission.processed_at = now;
    }
    return scored;
  }

  outcome::result<std::vector<PayoutAction>> BountyResolverImpl::record(
      const primitives::BountyId &bounty_id,
      uint32_t round,
      const std::vector<PayoutAction> &actions,
      primitives::Timestamp now) {
    auto key = SettlementPlanner::planKey(bounty_id, round);
    OUTCOME_TRY(recorded, payouts_->recordPlan(key, actions, now));
    if (recorded) {
      SL_DEBUG(logger_,
               "Settlement plan {} recorded with {} actions",
               key,
               actions.size());
      return actions;
    }

    SL_DEBUG(logger_, "Settlement plan {} was recorded before", key);
    OUTCOME_TRY(planned, payouts_->getPlannedActions(bounty_id));
    std::vector<PayoutAction> stored;
    for (auto &action : planned) {
      if (action.round == round) {
        stored.emplace_back(std::move(action));
      }
    }
    return stored;
  }

  outcome::result<void> BountyResolverImpl::finalize(
      const Bounty &bounty, const Evaluation &evaluation, uint32_t round) {
    auto &result = evaluation.result;
    auto now = clock_->now();

    auto scored = score(evaluation, now);
    OUTCOME_TRY(bounties_->recordOutcomes(scored));

    std::vector<PayoutAction> actions;
    if (round <= 1) {
      actions = result.consensus_reached
                  ? planner_->plan(bounty, result, scored, round)
                  : planner_->planStakeReturn(bounty, scored, round);
    } else if (result.consensus_reached) {
      // payouts of earlier rounds are final, only top them up
      auto target = planner_->plan(bounty, result, scored, round);
      OUTCOME_TRY(planned, payouts_->getPlannedActions(bounty.id));
      std::vector<PayoutAction> previous;
      for (auto &action : planned) {
        if (action.round >= 1 and action.round < round) {
          previous.emplace_back(std::move(action));
        }
      }
      actions = SettlementPlanner::reconcile(previous, target);
    } else {
      SL_WARN(logger_,
              "Bounty {} round {} has no consensus, earlier payouts stand",
              bounty.id,
              round);
    }

    OUTCOME_TRY(stored, record(bounty.id, round, actions, now));
    OUTCOME_TRY(
        reputation_updater_->applyResolution(bounty, result, scored, stored));
    OUTCOME_TRY(bounties_->markSettled(bounty.id, round));

    SL_INFO(logger_,
            "Bounty {} completed with verdict {} (confidence {}, agreement "
            "{}%), round {}",
            bounty.id,
            result.final_verdict,
            result.confidence,
            result.agreement_score,
            round);
    publisher_->publish(notification::BountyCompleted{
        .bounty_id = bounty.id,
        .verdict = result.final_verdict,
        .confidence = result.confidence,
        .participants = engines(evaluation.counted),
        .round = round,
    });
    return outcome::success();
  }

  outcome::result<void> BountyResolverImpl::expire(
      const Bounty &bounty, const Evaluation &evaluation, uint32_t round) {
    auto now = clock_->now();
    auto actions =
        planner_->planStakeReturn(bounty, evaluation.submissions, round);
    OUTCOME_TRY(record(bounty.id, round, actions, now));
    OUTCOME_TRY(bounties_->markSettled(bounty.id, round));

    SL_INFO(logger_,
            "Bounty {} expired without consensus, {} stakes returned",
            bounty.id,
            evaluation.submissions.size());
    publisher_->publish(notification::BountyExpired{
        .bounty_id = bounty.id,
        .participants = engines(evaluation.submissions),
    });
    return outcome::success();
  }

  outcome::result<void> BountyResolverImpl::resume(const Bounty &bounty) {
    if (bounty.status != BountyStatus::Completed
        and bounty.status != BountyStatus::Expired) {
      return ResolutionError::NOT_RESOLVED;
    }
    SL_VERBOSE(logger_,
               "Resuming settlement of bounty {} round {}",
               bounty.id,
               bounty.resolution_round);

    Evaluation evaluation;
    if (bounty.consensus) {
      OUTCOME_TRY(submissions, loadSubmissions(bounty.id));
      evaluation.counted = aggregator_->countedSubmissions(
          bounty, weighedBefore(bounty, submissions));
      evaluation.submissions = std::move(submissions);
      evaluation.result = *bounty.consensus;
    } else {
      OUTCOME_TRY(evaluated, evaluate(bounty));
      evaluation = std::move(evaluated);
    }

    if (bounty.status == BountyStatus::Expired) {
      return expire(bounty, evaluation, bounty.resolution_round);
    }
    return finalize(bounty, evaluation, bounty.resolution_round);
  }

}  // namespace nexus::bounty
