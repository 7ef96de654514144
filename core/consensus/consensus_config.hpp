/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/decimal.hpp"

namespace nexus::consensus {

  using primitives::Decimal;

  struct ConsensusConfig {
    /// Fewest eligible submissions a bounty needs to be resolvable
    uint32_t min_submissions = 3;
    /// Only the earliest submissions up to this count are counted
    uint32_t max_submissions = 100;
    /// Fraction of total weight a verdict must reach
    Decimal threshold{"0.66"};
    /// Weighted distribution when true, one vote one count otherwise
    bool weighted_voting = true;

    Decimal reputation_weight{"0.5"};
    Decimal confidence_weight{"0.3"};
    Decimal time_weight{"0.2"};

    /**
     * Results whose agreement stays below this fraction may be disputed.
     * A consensus winner holds at least the bounty threshold, so only
     * bounties whose threshold is below this one can be disputed by regular
     * users.
     */
    Decimal dispute_threshold{"0.4"};
    /// Share of the voting window that counts as an early submission
    Decimal early_window{"0.2"};
  };

}  // namespace nexus::consensus
