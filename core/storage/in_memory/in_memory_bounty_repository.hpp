/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/bounty_repository.hpp"

#include <map>

#include "utils/safe_object.hpp"

namespace nexus::storage {

  /**
   * Bounty repository kept in process memory. Every call is atomic with
   * respect to the others.
   */
  class InMemoryBountyRepository final : public BountyRepository {
   public:
    outcome::result<Bounty> getBounty(const BountyId &id) const override;

    outcome::result<std::vector<Bounty>> getBounties(
        BountyStatus status) const override;

    outcome::result<std::vector<Bounty>> getUnsettledBounties() const override;

    outcome::result<void> putBounty(const Bounty &bounty) override;

    outcome::result<bool> compareAndSetStatus(const BountyId &id,
                                              BountyStatus expected,
                                              BountyStatus desired) override;

    outcome::result<bool> claimReview(const BountyId &id,
                                      const std::string &reviewer) override;

    outcome::result<std::optional<uint32_t>> commitResolution(
        const BountyId &id,
        BountyStatus expected,
        BountyStatus desired,
        const primitives::ConsensusResult &result) override;

    outcome::result<void> markSettled(const BountyId &id,
                                      uint32_t round) override;

    outcome::result<std::vector<Submission>> getSubmissions(
        const BountyId &bounty_id) const override;

    outcome::result<void> putSubmission(const Submission &submission) override;

    outcome::result<void> recordOutcomes(
        const std::vector<Submission> &submissions) override;

    outcome::result<void> excludeSubmission(
        const BountyId &bounty_id, const primitives::SubmissionId &id) override;

   private:
    struct State {
      std::map<BountyId, Bounty> bounties;
      // in arrival order
      std::map<BountyId, std::vector<Submission>> submissions;
    };

    static Submission *find(State &state,
                            const BountyId &bounty_id,
                            const primitives::SubmissionId &id);

    SafeObject<State> state_;
  };

}  // namespace nexus::storage
