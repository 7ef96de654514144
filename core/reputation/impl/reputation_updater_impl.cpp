/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reputation/impl/reputation_updater_impl.hpp"

#include "reputation/reputation_ranking.hpp"

namespace nexus::reputation {

  using primitives::PayoutType;
  using primitives::Submission;
  using primitives::SubmissionStatus;

  ReputationUpdaterImpl::ReputationUpdaterImpl(
      std::shared_ptr<storage::ReputationRepository> repository,
      std::shared_ptr<clock::SystemClock> clock,
      ReputationScorer scorer,
      Decimal early_window)
      : repository_{std::move(repository)},
        clock_{std::move(clock)},
        scorer_{std::move(scorer)},
        early_window_{std::move(early_window)},
        logger_{log::createLogger("ReputationUpdater", "reputation")} {
    BOOST_ASSERT(repository_);
    BOOST_ASSERT(clock_);
  }

  bool ReputationUpdaterImpl::isEarly(const primitives::Bounty &bounty,
                                      const Submission &submission) const {
    using std::chrono::milliseconds;
    auto window = std::chrono::duration_cast<milliseconds>(bounty.deadline
                                                           - bounty.created_at);
    if (window.count() <= 0) {
      return false;
    }
    auto elapsed = std::chrono::duration_cast<milliseconds>(
        submission.submitted_at - bounty.created_at);
    const Decimal early_part = Decimal(window.count()) * early_window_;
    return Decimal(elapsed.count()) <= early_part;
  }

  outcome::result<void> ReputationUpdaterImpl::applyResolution(
      const primitives::Bounty &bounty,
      const primitives::ConsensusResult &result,
      const std::vector<Submission> &scored,
      const std::vector<primitives::PayoutAction> &plan) {
    auto now = clock_->now();

    for (auto &submission : scored) {
      if (submission.status == SubmissionStatus::Pending) {
        continue;
      }
      const bool correct = submission.status == SubmissionStatus::Correct;

      OUTCOME_TRY(record, repository_->getRecord(submission.engine_id));
      AccuracyOutcome accuracy{
          .correct = correct,
          .in_consensus = correct and result.consensus_reached,
          .early = isEarly(bounty, submission),
          .confidence = submission.confidence,
      };
      auto delta = scorer_.scoreChange(record, accuracy);

      // one key per submission: a flipped outcome revises the earlier one
      auto key = fmt::format("{}:{}:outcome", bounty.id, submission.id);
      OUTCOME_TRY(applied,
                  repository_->applyDelta(key,
                                          submission.engine_id,
                                          {
                                              .delta = delta,
                                              .correct = correct,
                                              .at = now,
                                          }));
      if (applied) {
        SL_DEBUG(logger_,
                 "Engine {} {} on bounty {}, reputation {:+}",
                 submission.engine_id,
                 correct ? "correct" : "incorrect",
                 bounty.id,
                 delta);
      } else {
        SL_TRACE(logger_,
                 "Outcome of submission {} on bounty {} is already applied",
                 submission.id,
                 bounty.id);
      }
    }

    for (auto &action : plan) {
      if (action.type != PayoutType::BountyReward) {
        continue;
      }
      OUTCOME_TRY(repository_->applyDelta(fmt::format("earned:{}", action.id),
                                          action.recipient,
                                          {
                                              .earned = action.amount,
                                              .at = now,
                                          }));
    }

    return refreshRanking();
  }

  outcome::result<void> ReputationUpdaterImpl::refreshRanking() {
    OUTCOME_TRY(records, repository_->getRecords());
    auto ranking = computeRanking(std::move(records));
    OUTCOME_TRY(repository_->updateRanking(ranking));
    SL_TRACE(logger_, "Ranking refreshed for {} engines", ranking.size());
    return outcome::success();
  }

}  // namespace nexus::reputation
