/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/bounty.hpp"
#include "primitives/submission.hpp"

namespace nexus::storage {

  using primitives::Bounty;
  using primitives::BountyId;
  using primitives::BountyStatus;
  using primitives::Submission;

  /**
   * Bounties and their submissions. Status changes go through
   * compare-and-swap so concurrent resolvers cannot both win.
   */
  class BountyRepository {
   public:
    virtual ~BountyRepository() = default;

    virtual outcome::result<Bounty> getBounty(const BountyId &id) const = 0;

    virtual outcome::result<std::vector<Bounty>> getBounties(
        BountyStatus status) const = 0;

    /// Completed or expired bounties whose last round is not settled yet
    virtual outcome::result<std::vector<Bounty>> getUnsettledBounties()
        const = 0;

    /// Inserts a new bounty, fails with ALREADY_EXISTS on duplicate id
    virtual outcome::result<void> putBounty(const Bounty &bounty) = 0;

    /**
     * Sets the status to `desired` if it is `expected`
     * @return false if the current status differs
     */
    virtual outcome::result<bool> compareAndSetStatus(const BountyId &id,
                                                      BountyStatus expected,
                                                      BountyStatus desired) = 0;

    /**
     * Moves a Completed bounty to UnderReview on behalf of `reviewer`. A
     * bounty already under review by the same reviewer is handed back to it,
     * so an interrupted re-resolution can be carried on.
     * @return false if the bounty is under review by someone else or is not
     * completed
     */
    virtual outcome::result<bool> claimReview(const BountyId &id,
                                              const std::string &reviewer) = 0;

    /**
     * Atomically moves the bounty from `expected` to `desired`, starts a new
     * resolution round and caches `result`. Leaving UnderReview drops the
     * reviewer.
     * @return the new round, none if the current status differs
     */
    virtual outcome::result<std::optional<uint32_t>> commitResolution(
        const BountyId &id,
        BountyStatus expected,
        BountyStatus desired,
        const primitives::ConsensusResult &result) = 0;

    /// Records that settlement of `round` is complete
    virtual outcome::result<void> markSettled(const BountyId &id,
                                              uint32_t round) = 0;

    virtual outcome::result<std::vector<Submission>> getSubmissions(
        const BountyId &bounty_id) const = 0;

    /**
     * Stores a new submission. One submission per engine and bounty,
     * a second one fails with ALREADY_EXISTS. Only open bounties take
     * submissions, others fail with WRONG_STATE.
     */
    virtual outcome::result<void> putSubmission(
        const Submission &submission) = 0;

    /**
     * Stores scoring results of already stored submissions as one change:
     * status, accuracy score, processing time, and the reputation snapshot
     * if none was stored yet. Other fields are left as they are.
     */
    virtual outcome::result<void> recordOutcomes(
        const std::vector<Submission> &submissions) = 0;

    /// Leaves the submission out of every later resolution
    virtual outcome::result<void> excludeSubmission(
        const BountyId &bounty_id, const primitives::SubmissionId &id) = 0;
  };

}  // namespace nexus::storage
