/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "primitives/bounty.hpp"
#include "primitives/submission.hpp"

namespace testutil {

  using nexus::primitives::Balance;
  using nexus::primitives::Bounty;
  using nexus::primitives::Decimal;
  using nexus::primitives::Submission;
  using nexus::primitives::Timestamp;
  using nexus::primitives::Verdict;

  /// Fixed point in time the tests count from
  inline const Timestamp kT0{std::chrono::seconds{1'700'000'000}};

  inline Bounty makeBounty(std::string id,
                           Balance reward = 1000,
                           uint32_t min_submissions = 3,
                           const char *threshold = "0.66") {
    Bounty bounty;
    bounty.id = std::move(id);
    bounty.creator = "creator";
    bounty.reward = reward;
    bounty.min_stake = 1;
    bounty.min_submissions = min_submissions;
    bounty.consensus_threshold = Decimal{threshold};
    bounty.created_at = kT0;
    bounty.deadline = kT0 + std::chrono::hours{1};
    return bounty;
  }

  /**
   * Submission of engine `engine` to `bounty`, `offset` after the bounty
   * was created. The id is "<bounty>/<engine>".
   */
  inline Submission makeSubmission(const Bounty &bounty,
                                   std::string engine,
                                   Verdict verdict,
                                   const char *confidence,
                                   std::optional<int32_t> reputation = 5000,
                                   Balance stake = 100,
                                   std::chrono::seconds offset =
                                       std::chrono::seconds{0}) {
    Submission submission;
    submission.id = bounty.id + "/" + engine;
    submission.bounty_id = bounty.id;
    submission.engine_id = std::move(engine);
    submission.verdict = verdict;
    submission.confidence = Decimal{confidence};
    submission.stake = stake;
    submission.submitted_at = bounty.created_at + offset;
    submission.reputation_snapshot = reputation;
    return submission;
  }

  /// Decimals are compared within `epsilon`, division results are inexact
  inline ::testing::AssertionResult decimalNear(const Decimal &actual,
                                                const Decimal &expected,
                                                const char *epsilon =
                                                    "0.000001") {
    const Decimal diff = actual - expected;
    const Decimal distance = boost::multiprecision::abs(diff);
    if (distance <= Decimal{epsilon}) {
      return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure()
        << actual.str(12) << " is not within " << epsilon << " of "
        << expected.str(12);
  }

}  // namespace testutil
