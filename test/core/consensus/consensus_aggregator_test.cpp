/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "consensus/impl/consensus_aggregator_impl.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/fixtures.hpp"

using nexus::consensus::ConsensusAggregatorImpl;
using nexus::consensus::ConsensusConfig;
using nexus::primitives::Bounty;
using nexus::primitives::Decimal;
using nexus::primitives::Submission;
using nexus::primitives::Verdict;
using testutil::decimalNear;
using testutil::makeBounty;
using testutil::makeSubmission;

using namespace std::chrono_literals;

class ConsensusAggregatorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  ConsensusConfig config;
  Bounty bounty = makeBounty("bounty");
};

/**
 * @given three submissions, two Malicious from reputable engines and one
 * Benign from a weak one
 * @when aggregating with weighted voting
 * @then weights are 0.87, 0.8 and 0.45, Malicious wins with about 78.8% of
 * the weight and the confidence of its voters
 */
TEST_F(ConsensusAggregatorTest, WeightedEndToEnd) {
  ConsensusAggregatorImpl aggregator{config};
  std::vector<Submission> counted{
      makeSubmission(bounty, "a", Verdict::Malicious, "0.9", 8000),
      makeSubmission(bounty, "b", Verdict::Malicious, "1.0", 6000),
      makeSubmission(bounty, "c", Verdict::Benign, "0.5", 2000),
  };

  auto result = aggregator.aggregate(bounty, counted);

  EXPECT_EQ(result.bounty_id, "bounty");
  EXPECT_EQ(result.total_submissions, 3);
  EXPECT_EQ(result.weights.at("bounty/a"), Decimal{"0.87"});
  EXPECT_EQ(result.weights.at("bounty/b"), Decimal{"0.8"});
  EXPECT_EQ(result.weights.at("bounty/c"), Decimal{"0.45"});

  EXPECT_EQ(result.final_verdict, Verdict::Malicious);
  EXPECT_TRUE(result.consensus_reached);
  EXPECT_TRUE(decimalNear(result.confidence, Decimal{"0.95"}));
  EXPECT_EQ(result.distribution.total_weight, Decimal{"2.12"});
  EXPECT_TRUE(decimalNear(result.distribution.at(Verdict::Malicious).percentage,
                          Decimal{"78.773585"}));
  EXPECT_TRUE(decimalNear(result.weighted_score, Decimal{"0.787736"}));
  EXPECT_EQ(result.agreement_score,
            result.distribution.at(Verdict::Malicious).percentage);
  EXPECT_FALSE(result.dispute_eligible);
  EXPECT_EQ(result.distribution.at(Verdict::Malicious).voters,
            (std::vector<std::string>{"a", "b"}));
}

/**
 * @given votes where two weak engines outvote one strong engine by count
 * @when aggregating the same votes in weighted and in simple mode
 * @then the strong engine decides in weighted mode, the majority in simple
 * mode
 */
TEST_F(ConsensusAggregatorTest, WeightedAndSimpleDisagree) {
  bounty.consensus_threshold = Decimal{"0.6"};
  std::vector<Submission> counted{
      makeSubmission(bounty, "weak1", Verdict::Malicious, "0", 0),
      makeSubmission(bounty, "weak2", Verdict::Malicious, "0", 0),
      makeSubmission(bounty, "strong", Verdict::Benign, "1", 10000),
  };

  ConsensusAggregatorImpl weighted{config};
  auto weighted_result = weighted.aggregate(bounty, counted);
  EXPECT_EQ(weighted_result.final_verdict, Verdict::Benign);
  EXPECT_TRUE(weighted_result.consensus_reached);
  EXPECT_TRUE(weighted_result.weighted_voting);

  config.weighted_voting = false;
  ConsensusAggregatorImpl simple{config};
  auto simple_result = simple.aggregate(bounty, counted);
  EXPECT_EQ(simple_result.final_verdict, Verdict::Malicious);
  EXPECT_TRUE(simple_result.consensus_reached);
  EXPECT_FALSE(simple_result.weighted_voting);
  EXPECT_EQ(simple_result.distribution.total_weight, Decimal{3});
}

/**
 * @given a winner by threshold but fewer counted submissions than required
 * @when aggregating
 * @then the verdict is reported without consensus
 */
TEST_F(ConsensusAggregatorTest, NotEnoughSubmissions) {
  ConsensusAggregatorImpl aggregator{config};
  auto result = aggregator.aggregate(
      bounty,
      {makeSubmission(bounty, "a", Verdict::Benign, "0.9"),
       makeSubmission(bounty, "b", Verdict::Benign, "0.8")});

  EXPECT_EQ(result.final_verdict, Verdict::Benign);
  EXPECT_FALSE(result.consensus_reached);
}

/**
 * @given three equally weighted submissions for different verdicts
 * @when aggregating
 * @then there is no consensus, the plurality tie goes to Malicious and the
 * low agreement opens the dispute window
 */
TEST_F(ConsensusAggregatorTest, SplitVoteIsDisputable) {
  ConsensusAggregatorImpl aggregator{config};
  auto result = aggregator.aggregate(
      bounty,
      {makeSubmission(bounty, "a", Verdict::Suspicious, "0.5"),
       makeSubmission(bounty, "b", Verdict::Benign, "0.5"),
       makeSubmission(bounty, "c", Verdict::Malicious, "0.5")});

  EXPECT_FALSE(result.consensus_reached);
  EXPECT_EQ(result.final_verdict, Verdict::Malicious);
  EXPECT_TRUE(decimalNear(result.agreement_score, Decimal{"33.333333"}));
  EXPECT_TRUE(result.dispute_eligible);
}

/**
 * @given a bounty whose own threshold is below the dispute threshold and a
 * vote split 3/3/2
 * @when aggregating
 * @then Malicious reaches consensus with 37.5% and the result stays open to
 * regular disputes, which the default threshold never allows
 */
TEST_F(ConsensusAggregatorTest, LowThresholdConsensusIsDisputable) {
  ConsensusAggregatorImpl aggregator{config};
  std::vector<Submission> counted;
  for (auto [engine, verdict] : std::vector<std::pair<const char *, Verdict>>{
           {"a", Verdict::Malicious},
           {"b", Verdict::Benign},
           {"c", Verdict::Suspicious},
           {"d", Verdict::Malicious},
           {"e", Verdict::Benign},
           {"f", Verdict::Suspicious},
           {"g", Verdict::Malicious},
           {"h", Verdict::Benign},
       }) {
    counted.push_back(makeSubmission(bounty, engine, verdict, "0.5"));
  }

  bounty.consensus_threshold = Decimal{"0.35"};
  auto result = aggregator.aggregate(bounty, counted);
  EXPECT_TRUE(result.consensus_reached);
  EXPECT_EQ(result.final_verdict, Verdict::Malicious);
  EXPECT_TRUE(decimalNear(result.agreement_score, Decimal{"37.5"}));
  EXPECT_TRUE(result.dispute_eligible);

  bounty.consensus_threshold = config.threshold;
  auto strict = aggregator.aggregate(bounty, counted);
  EXPECT_FALSE(strict.consensus_reached);
}

/**
 * @given no submissions
 * @when aggregating
 * @then the result is Unknown without consensus
 */
TEST_F(ConsensusAggregatorTest, NoSubmissions) {
  ConsensusAggregatorImpl aggregator{config};
  auto result = aggregator.aggregate(bounty, {});

  EXPECT_EQ(result.final_verdict, Verdict::Unknown);
  EXPECT_EQ(result.confidence, Decimal{0});
  EXPECT_EQ(result.weighted_score, Decimal{0});
  EXPECT_FALSE(result.consensus_reached);
  EXPECT_EQ(result.total_submissions, 0);
}

/**
 * @given submissions with a stake below the minimum, an excluded one and
 * arrivals out of order
 * @when selecting the counted submissions with a cap of two
 * @then ineligible ones are dropped and the earliest two are kept in
 * submission order
 */
TEST_F(ConsensusAggregatorTest, CountedSubmissions) {
  config.max_submissions = 2;
  ConsensusAggregatorImpl aggregator{config};
  bounty.min_stake = 50;

  auto late = makeSubmission(
      bounty, "late", Verdict::Benign, "0.5", 5000, 100, 30s);
  auto cheap = makeSubmission(
      bounty, "cheap", Verdict::Benign, "0.5", 5000, 49, 1s);
  auto excluded = makeSubmission(
      bounty, "excluded", Verdict::Benign, "0.5", 5000, 100, 2s);
  excluded.excluded = true;
  auto first = makeSubmission(
      bounty, "first", Verdict::Benign, "0.5", 5000, 50, 5s);
  auto second = makeSubmission(
      bounty, "second", Verdict::Benign, "0.5", 5000, 100, 10s);

  auto counted = aggregator.countedSubmissions(
      bounty, {late, cheap, excluded, second, first});

  ASSERT_EQ(counted.size(), 2);
  EXPECT_EQ(counted[0].id, first.id);
  EXPECT_EQ(counted[1].id, second.id);
}

/**
 * @given two submissions at the same instant
 * @when selecting the counted submissions
 * @then the submission id breaks the tie
 */
TEST_F(ConsensusAggregatorTest, CountedSubmissionsTieBreak) {
  ConsensusAggregatorImpl aggregator{config};
  auto b = makeSubmission(bounty, "b", Verdict::Benign, "0.5");
  auto a = makeSubmission(bounty, "a", Verdict::Benign, "0.5");

  auto counted = aggregator.countedSubmissions(bounty, {b, a});
  ASSERT_EQ(counted.size(), 2);
  EXPECT_EQ(counted[0].id, a.id);
}

/**
 * @given a computed Malicious result
 * @when an admin imposes Benign
 * @then the verdict and its statistics change, the distribution stays and
 * the result is final
 */
TEST_F(ConsensusAggregatorTest, ImposeVerdict) {
  ConsensusAggregatorImpl aggregator{config};
  auto computed = aggregator.aggregate(
      bounty,
      {makeSubmission(bounty, "a", Verdict::Malicious, "0.9", 8000),
       makeSubmission(bounty, "b", Verdict::Malicious, "1.0", 6000),
       makeSubmission(bounty, "c", Verdict::Benign, "0.5", 2000)});

  auto imposed = aggregator.imposeVerdict(computed, Verdict::Benign);

  EXPECT_EQ(imposed.final_verdict, Verdict::Benign);
  EXPECT_TRUE(decimalNear(imposed.confidence, Decimal{"0.5"}));
  EXPECT_TRUE(decimalNear(imposed.weighted_score, Decimal{"0.212264"}));
  EXPECT_TRUE(imposed.consensus_reached);
  EXPECT_FALSE(imposed.dispute_eligible);
  EXPECT_EQ(imposed.distribution, computed.distribution);
  EXPECT_EQ(imposed.weights, computed.weights);
}
