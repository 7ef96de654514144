/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "bounty/impl/bounty_resolver_impl.hpp"
#include "bounty/resolution_error.hpp"
#include "consensus/impl/consensus_aggregator_impl.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/notification/event_publisher_mock.hpp"
#include "reputation/impl/reputation_updater_impl.hpp"
#include "storage/in_memory/in_memory_bounty_repository.hpp"
#include "storage/in_memory/in_memory_payout_repository.hpp"
#include "storage/in_memory/in_memory_reputation_repository.hpp"
#include "storage/storage_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/fixtures.hpp"

using nexus::bounty::BountyResolverImpl;
using nexus::bounty::ResolutionError;
using nexus::clock::SystemClockMock;
using nexus::consensus::ConsensusAggregatorImpl;
using nexus::consensus::ConsensusConfig;
using nexus::notification::BountyCompleted;
using nexus::notification::BountyExpired;
using nexus::notification::EventPublisherMock;
using nexus::primitives::Balance;
using nexus::primitives::Bounty;
using nexus::primitives::BountyStatus;
using nexus::primitives::Decimal;
using nexus::primitives::PayoutAction;
using nexus::primitives::PayoutStatus;
using nexus::primitives::PayoutType;
using nexus::primitives::SubmissionStatus;
using nexus::primitives::Verdict;
using nexus::reputation::ReputationConfig;
using nexus::reputation::ReputationScorer;
using nexus::reputation::ReputationUpdaterImpl;
using nexus::settlement::SettlementConfig;
using nexus::settlement::SettlementPlanner;
using nexus::storage::InMemoryBountyRepository;
using nexus::storage::InMemoryPayoutRepository;
using nexus::storage::InMemoryReputationRepository;
using nexus::storage::StorageError;
using testutil::kT0;
using testutil::makeBounty;
using testutil::makeSubmission;

using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::Return;
using testing::VariantWith;

using namespace std::chrono_literals;

namespace {

  struct Paid {
    std::string recipient;
    PayoutType type;
    Balance amount;

    bool operator==(const Paid &) const = default;
  };

  std::vector<Paid> paidOf(const std::vector<PayoutAction> &actions) {
    std::vector<Paid> paid;
    for (auto &action : actions) {
      paid.push_back({action.recipient, action.type, action.amount});
    }
    return paid;
  }

}  // namespace

class BountyResolverTest : public testing::Test {
 public:
  using Evaluation = nexus::bounty::Evaluation;

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*clock, now()).WillByDefault(Return(kT0 + 30min));

    bounty.min_stake = 50;
    EXPECT_OUTCOME_TRUE_1(bounties->putBounty(bounty));
    for (auto &submission : {
             makeSubmission(bounty, "a", Verdict::Malicious, "0.9", 8000),
             makeSubmission(
                 bounty, "b", Verdict::Malicious, "1", 6000, 100, 10s),
             makeSubmission(bounty, "c", Verdict::Benign, "0.5", 2000, 100, 20s),
             // below the minimum stake, never counted
             makeSubmission(bounty, "d", Verdict::Benign, "1", 9000, 10, 30s),
         }) {
      EXPECT_OUTCOME_TRUE_1(bounties->putSubmission(submission));
    }

    resolver = std::make_shared<BountyResolverImpl>(
        bounties,
        payouts,
        reputations,
        aggregator,
        std::make_shared<SettlementPlanner>(SettlementConfig{}),
        std::make_shared<ReputationUpdaterImpl>(
            reputations,
            clock,
            ReputationScorer{ReputationConfig{}},
            Decimal{"0.2"}),
        publisher,
        clock);
  }

  /// Commits the bounty from `from` to `to` the way the worker does
  Bounty commit(BountyStatus from, BountyStatus to, const Evaluation &eval) {
    EXPECT_OUTCOME_TRUE(
        round, bounties->commitResolution(bounty.id, from, to, eval.result));
    EXPECT_TRUE(round.has_value());
    EXPECT_OUTCOME_TRUE(committed, bounties->getBounty(bounty.id));
    return committed;
  }

  Bounty bounty = makeBounty("bounty");
  std::shared_ptr<InMemoryBountyRepository> bounties =
      std::make_shared<InMemoryBountyRepository>();
  std::shared_ptr<InMemoryPayoutRepository> payouts =
      std::make_shared<InMemoryPayoutRepository>();
  std::shared_ptr<InMemoryReputationRepository> reputations =
      std::make_shared<InMemoryReputationRepository>(1000, 0, 10000);
  std::shared_ptr<ConsensusAggregatorImpl> aggregator =
      std::make_shared<ConsensusAggregatorImpl>(ConsensusConfig{});
  std::shared_ptr<testing::NiceMock<SystemClockMock>> clock =
      std::make_shared<testing::NiceMock<SystemClockMock>>();
  std::shared_ptr<testing::NiceMock<EventPublisherMock>> publisher =
      std::make_shared<testing::NiceMock<EventPublisherMock>>();
  std::shared_ptr<BountyResolverImpl> resolver;
};

/**
 * @given a bounty with three counted submissions and one under the minimum
 * stake
 * @when it is evaluated
 * @then only the three take part and Malicious reaches consensus
 */
TEST_F(BountyResolverTest, Evaluate) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  EXPECT_EQ(evaluation.submissions.size(), 4);
  ASSERT_EQ(evaluation.counted.size(), 3);
  EXPECT_EQ(evaluation.counted[2].id, "bounty/c");
  EXPECT_EQ(evaluation.result.final_verdict, Verdict::Malicious);
  EXPECT_TRUE(evaluation.result.consensus_reached);

  // nothing is stored by an evaluation
  EXPECT_OUTCOME_TRUE(stored, bounties->getBounty(bounty.id));
  EXPECT_EQ(stored.status, BountyStatus::Open);
}

/**
 * @given a bounty committed to Completed
 * @when its first round is finalized
 * @then submissions are scored, payouts planned, reputation updated, the
 * round settled and the completion published
 */
TEST_F(BountyResolverTest, Finalize) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  auto completed =
      commit(BountyStatus::Open, BountyStatus::Completed, evaluation);

  EXPECT_CALL(*publisher,
              publish(VariantWith<BountyCompleted>(
                  AllOf(Field(&BountyCompleted::verdict, Verdict::Malicious),
                        Field(&BountyCompleted::participants,
                              ElementsAre("a", "b", "c")),
                        Field(&BountyCompleted::round, 1)))));
  EXPECT_OUTCOME_TRUE_1(resolver->finalize(completed, evaluation, 1));

  EXPECT_OUTCOME_TRUE(submissions, bounties->getSubmissions(bounty.id));
  ASSERT_EQ(submissions.size(), 4);
  EXPECT_EQ(submissions[0].status, SubmissionStatus::Correct);
  EXPECT_EQ(submissions[0].accuracy_score, Decimal{"0.95"});
  EXPECT_EQ(submissions[0].processed_at, kT0 + 30min);
  EXPECT_EQ(submissions[1].status, SubmissionStatus::Correct);
  EXPECT_EQ(submissions[2].status, SubmissionStatus::Incorrect);
  EXPECT_EQ(submissions[2].accuracy_score, Decimal{0});
  EXPECT_EQ(submissions[3].status, SubmissionStatus::Pending);
  EXPECT_FALSE(submissions[3].accuracy_score.has_value());

  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  std::vector<Paid> expected{
      {"a", PayoutType::StakeReturn, 100},
      {"a", PayoutType::BountyReward, 521},
      {"b", PayoutType::StakeReturn, 100},
      {"b", PayoutType::BountyReward, 479},
      {"treasury", PayoutType::StakeSlash, 100},
      {"d", PayoutType::StakeReturn, 10},
  };
  EXPECT_EQ(paidOf(planned), expected);
  EXPECT_OUTCOME_TRUE(pending, payouts->getPayouts(PayoutStatus::Pending));
  EXPECT_EQ(pending.size(), 6);

  EXPECT_OUTCOME_TRUE(a, reputations->getRecord("a"));
  EXPECT_EQ(a.score, 1076);
  EXPECT_EQ(a.total_earned, 521);
  EXPECT_OUTCOME_TRUE(c, reputations->getRecord("c"));
  EXPECT_EQ(c.score, 950);
  EXPECT_OUTCOME_TRUE(records, reputations->getRecords());
  EXPECT_EQ(records.size(), 3);

  EXPECT_OUTCOME_TRUE(settled, bounties->getBounty(bounty.id));
  EXPECT_EQ(settled.settled_round, 1);
  EXPECT_OUTCOME_TRUE(unsettled, bounties->getUnsettledBounties());
  EXPECT_TRUE(unsettled.empty());
}

/**
 * @given a finalized round
 * @when it is finalized again
 * @then no payout or reputation change is repeated
 */
TEST_F(BountyResolverTest, FinalizeTwice) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  auto completed =
      commit(BountyStatus::Open, BountyStatus::Completed, evaluation);
  EXPECT_OUTCOME_TRUE_1(resolver->finalize(completed, evaluation, 1));
  EXPECT_OUTCOME_TRUE(records, reputations->getRecords());

  EXPECT_OUTCOME_TRUE_1(resolver->finalize(completed, evaluation, 1));
  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  EXPECT_EQ(planned.size(), 6);
  EXPECT_OUTCOME_TRUE(again, reputations->getRecords());
  EXPECT_EQ(again, records);
}

/**
 * @given a bounty committed to Expired
 * @when it is expired
 * @then every stake and the reward go back and the expiry is published
 */
TEST_F(BountyResolverTest, Expire) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  auto expired = commit(BountyStatus::Open, BountyStatus::Expired, evaluation);

  EXPECT_CALL(*publisher,
              publish(VariantWith<BountyExpired>(
                  Field(&BountyExpired::participants,
                        ElementsAre("a", "b", "c", "d")))));
  EXPECT_OUTCOME_TRUE_1(resolver->expire(expired, evaluation, 1));

  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  std::vector<Paid> expected{
      {"a", PayoutType::StakeReturn, 100},
      {"b", PayoutType::StakeReturn, 100},
      {"c", PayoutType::StakeReturn, 100},
      {"d", PayoutType::StakeReturn, 10},
      {"creator", PayoutType::Refund, 1000},
  };
  EXPECT_EQ(paidOf(planned), expected);

  // expiry does not touch reputation
  EXPECT_OUTCOME_TRUE(records, reputations->getRecords());
  EXPECT_TRUE(records.empty());
  EXPECT_OUTCOME_TRUE(settled, bounties->getBounty(bounty.id));
  EXPECT_EQ(settled.settled_round, 1);
}

/**
 * @given a bounty committed to Completed whose settlement never ran
 * @when it is resumed
 * @then it is settled from the cached result
 */
TEST_F(BountyResolverTest, Resume) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  commit(BountyStatus::Open, BountyStatus::Completed, evaluation);

  EXPECT_OUTCOME_TRUE(unsettled, bounties->getUnsettledBounties());
  ASSERT_EQ(unsettled.size(), 1);
  EXPECT_OUTCOME_TRUE_1(resolver->resume(unsettled[0]));

  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  EXPECT_EQ(planned.size(), 6);
  EXPECT_OUTCOME_TRUE(after, bounties->getUnsettledBounties());
  EXPECT_TRUE(after.empty());
}

/**
 * @given a submission stored after the bounty was evaluated but before the
 * resolution was committed
 * @when the settlement is resumed from the cached result
 * @then that submission is neither scored nor slashed, only its stake goes
 * back, and no submission is accepted once the bounty left Open
 */
TEST_F(BountyResolverTest, LateSubmissionNotScored) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  auto late =
      makeSubmission(bounty, "e", Verdict::Benign, "1", 9000, 100, 40s);
  EXPECT_OUTCOME_TRUE_1(bounties->putSubmission(late));
  commit(BountyStatus::Open, BountyStatus::Completed, evaluation);

  auto too_late =
      makeSubmission(bounty, "f", Verdict::Benign, "1", 9000, 100, 50s);
  EXPECT_EC(bounties->putSubmission(too_late), StorageError::WRONG_STATE);

  EXPECT_OUTCOME_TRUE(unsettled, bounties->getUnsettledBounties());
  ASSERT_EQ(unsettled.size(), 1);
  EXPECT_OUTCOME_TRUE_1(resolver->resume(unsettled[0]));

  EXPECT_OUTCOME_TRUE(submissions, bounties->getSubmissions(bounty.id));
  ASSERT_EQ(submissions.size(), 5);
  EXPECT_EQ(submissions[4].id, late.id);
  EXPECT_EQ(submissions[4].status, SubmissionStatus::Pending);
  EXPECT_FALSE(submissions[4].accuracy_score.has_value());
  EXPECT_EQ(submissions[2].status, SubmissionStatus::Incorrect);

  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  std::vector<Paid> of_late;
  Balance slashed = 0;
  for (auto &paid : paidOf(planned)) {
    if (paid.recipient == "e") {
      of_late.push_back(paid);
    }
    if (paid.type == PayoutType::StakeSlash) {
      slashed += paid.amount;
    }
  }
  std::vector<Paid> expected{{"e", PayoutType::StakeReturn, 100}};
  EXPECT_EQ(of_late, expected);
  EXPECT_EQ(slashed, 100);

  EXPECT_OUTCOME_TRUE(a, reputations->getRecord("a"));
  EXPECT_EQ(a.total_earned, 521);
  EXPECT_OUTCOME_TRUE(records, reputations->getRecords());
  EXPECT_EQ(records.size(), 3);
}

/**
 * @given an open bounty
 * @when its settlement is resumed
 * @then it is refused
 */
TEST_F(BountyResolverTest, ResumeOpenBounty) {
  EXPECT_EC(resolver->resume(bounty), ResolutionError::NOT_RESOLVED);
}

/**
 * @given a first round paid to the Malicious voters
 * @when a second round settles on Benign
 * @then the new winner receives its stake and the whole pool on top,
 * earlier payouts and slashes stay as they were
 */
TEST_F(BountyResolverTest, SecondRoundTopsUp) {
  EXPECT_OUTCOME_TRUE(evaluation, resolver->evaluate(bounty));
  auto completed =
      commit(BountyStatus::Open, BountyStatus::Completed, evaluation);
  EXPECT_OUTCOME_TRUE_1(resolver->finalize(completed, evaluation, 1));

  auto overturned = evaluation;
  overturned.result =
      aggregator->imposeVerdict(evaluation.result, Verdict::Benign);
  EXPECT_OUTCOME_TRUE_1(resolver->finalize(completed, overturned, 2));

  EXPECT_OUTCOME_TRUE(planned, payouts->getPlannedActions(bounty.id));
  std::vector<PayoutAction> second_round;
  for (auto &action : planned) {
    if (action.round == 2) {
      second_round.push_back(action);
    }
  }
  std::vector<Paid> expected{
      {"c", PayoutType::StakeReturn, 100},
      {"c", PayoutType::BountyReward, 1000},
  };
  EXPECT_EQ(paidOf(second_round), expected);

  EXPECT_OUTCOME_TRUE(c, reputations->getRecord("c"));
  EXPECT_EQ(c.total_submissions, 1);
  EXPECT_EQ(c.correct_submissions, 1);
  EXPECT_EQ(c.total_earned, 1000);

  EXPECT_OUTCOME_TRUE(submissions, bounties->getSubmissions(bounty.id));
  EXPECT_EQ(submissions[0].status, SubmissionStatus::Incorrect);
  EXPECT_EQ(submissions[2].status, SubmissionStatus::Correct);
  EXPECT_OUTCOME_TRUE(settled, bounties->getBounty(bounty.id));
  EXPECT_EQ(settled.settled_round, 2);
}
