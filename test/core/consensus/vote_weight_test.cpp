/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "consensus/vote_weight.hpp"
#include "testutil/primitives/fixtures.hpp"

using nexus::consensus::ConsensusConfig;
using nexus::consensus::VoteWeighting;
using nexus::primitives::Decimal;
using testutil::decimalNear;

class VoteWeightTest : public testing::Test {
 public:
  ConsensusConfig config;
  VoteWeighting weighting{config};
};

/**
 * @given default coefficients 0.5 / 0.3 / 0.2
 * @when weighting a vote of reputation 8000 and confidence 0.9
 * @then the weight is 0.8 * 0.5 + 0.9 * 0.3 + 1 * 0.2 = 0.87
 */
TEST_F(VoteWeightTest, CombinesFactors) {
  EXPECT_EQ(weighting.weight(Decimal{"0.9"}, 8000, Decimal{1}), Decimal{"0.87"});
}

/**
 * @given default coefficients
 * @when weighting with the reputation outside of [0, 10000]
 * @then the reputation factor is clamped
 */
TEST_F(VoteWeightTest, ClampsReputation) {
  EXPECT_EQ(weighting.weight(Decimal{1}, 25000, Decimal{1}), Decimal{1});
  EXPECT_EQ(weighting.weight(Decimal{0}, -50, Decimal{1}), Decimal{"0.2"});
}

/**
 * @given coefficients that do not sum up to one
 * @when weighting the best possible vote
 * @then the weight is normalised to one
 */
TEST_F(VoteWeightTest, NormalisesCoefficients) {
  ConsensusConfig scaled;
  scaled.reputation_weight = Decimal{5};
  scaled.confidence_weight = Decimal{3};
  scaled.time_weight = Decimal{2};
  VoteWeighting scaled_weighting{scaled};

  EXPECT_EQ(scaled_weighting.weight(Decimal{1}, 10000, Decimal{1}),
            Decimal{1});
  EXPECT_TRUE(decimalNear(
      scaled_weighting.weight(Decimal{"0.9"}, 8000, Decimal{1}),
      Decimal{"0.87"}));
}

/**
 * @given only the confidence coefficient set
 * @when weighting votes
 * @then the weight equals the declared confidence
 */
TEST_F(VoteWeightTest, ConfidenceOnly) {
  ConsensusConfig only_confidence;
  only_confidence.reputation_weight = Decimal{0};
  only_confidence.time_weight = Decimal{0};
  VoteWeighting confidence_weighting{only_confidence};

  EXPECT_EQ(confidence_weighting.weight(Decimal{"0.35"}, 9000, Decimal{1}),
            Decimal{"0.35"});
}

/**
 * @given a submission with confidence and a reputation
 * @when weighting it through the submission overload
 * @then the constant time factor of one is used
 */
TEST_F(VoteWeightTest, SubmissionOverload) {
  auto bounty = testutil::makeBounty("b");
  auto submission = testutil::makeSubmission(
      bounty, "engine", nexus::primitives::Verdict::Benign, "0.5");

  EXPECT_EQ(VoteWeighting::timeFactor(0, 1), Decimal{1});
  EXPECT_EQ(VoteWeighting::timeFactor(7, 10), Decimal{1});
  EXPECT_EQ(weighting.weight(submission, 2000), Decimal{"0.45"});
}
