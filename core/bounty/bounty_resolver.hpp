/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/bounty.hpp"
#include "primitives/submission.hpp"

namespace nexus::bounty {

  /// Consensus over the current submissions of a bounty
  struct Evaluation {
    primitives::ConsensusResult result;
    /// every submission of the bounty, reputation snapshots filled
    std::vector<primitives::Submission> submissions;
    /// the ones taking part in consensus, in counting order
    std::vector<primitives::Submission> counted;
  };

  /**
   * Evaluates bounties and carries out the side effects of a committed
   * resolution round: submission scoring, settlement plan, reputation and
   * notification. Each side effect is idempotent per round, so a round
   * interrupted half way can be settled again.
   */
  class BountyResolver {
   public:
    virtual ~BountyResolver() = default;

    /// Pure evaluation, nothing is stored
    virtual outcome::result<Evaluation> evaluate(
        const primitives::Bounty &bounty) const = 0;

    /**
     * Settles round `round` of a bounty committed to Completed. From the
     * second round on, the plan only compensates what earlier rounds paid.
     */
    virtual outcome::result<void> finalize(const primitives::Bounty &bounty,
                                           const Evaluation &evaluation,
                                           uint32_t round) = 0;

    /// Settles a bounty committed to Expired: stakes and reward go back
    virtual outcome::result<void> expire(const primitives::Bounty &bounty,
                                         const Evaluation &evaluation,
                                         uint32_t round) = 0;

    /**
     * Settles the last round of a Completed or Expired bounty whose
     * settlement did not finish, using the cached consensus result
     */
    virtual outcome::result<void> resume(const primitives::Bounty &bounty) = 0;
  };

}  // namespace nexus::bounty
