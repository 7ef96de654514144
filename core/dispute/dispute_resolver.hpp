/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "outcome/outcome.hpp"
#include "primitives/consensus_result.hpp"
#include "primitives/dispute.hpp"
#include "primitives/verdict.hpp"

namespace nexus::dispute {

  struct DisputeRequest {
    primitives::SubmissionId submission_id;
    primitives::BountyId bounty_id;
    primitives::AccountId disputer;
    std::string reason;
    std::string evidence;
    primitives::Balance stake;
    /// Admins may dispute a result outside of the dispute window
    bool admin = false;
  };

  /**
   * Challenges of completed bounties. An accepted dispute excludes the
   * disputed submission and re-resolves the bounty in a new round whose
   * payouts only compensate what earlier rounds paid.
   */
  class DisputeResolver {
   public:
    virtual ~DisputeResolver() = default;

    /// Validates the request and stores an Open dispute
    virtual outcome::result<primitives::Dispute> openDispute(
        const DisputeRequest &request) = 0;

    /**
     * Accepts or rejects an open dispute. An accepted dispute left
     * UnderReview by an interrupted call is carried on by repeating it.
     * One bounty is re-resolved for one dispute at a time, accepting another
     * meanwhile fails with BOUNTY_UNDER_REVIEW and leaves that dispute Open.
     */
    virtual outcome::result<primitives::Dispute> resolveDispute(
        const primitives::DisputeId &dispute_id,
        primitives::DisputeResolution resolution,
        const primitives::AccountId &resolver,
        std::string note) = 0;

    /// Re-scores a completed bounty against a verdict chosen by an admin
    virtual outcome::result<primitives::ConsensusResult> overrideVerdict(
        const primitives::BountyId &bounty_id,
        primitives::Verdict verdict,
        const primitives::AccountId &admin) = 0;
  };

}  // namespace nexus::dispute
