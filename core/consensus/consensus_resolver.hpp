/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/consensus_result.hpp"

namespace nexus::consensus {

  using primitives::Decimal;
  using primitives::VerdictDistribution;

  struct Resolution {
    primitives::Verdict verdict = primitives::Verdict::Unknown;
    Decimal confidence;
    /// The verdict was picked because it reached the threshold
    bool threshold_met = false;
  };

  /**
   * Picks the final verdict.
   *
   * Malicious, Benign and Suspicious are checked in this order, the first one
   * whose percentage reaches threshold * 100 wins. Otherwise the category
   * with the highest weighted count is taken, ties going to the earlier one in
   * canonical order. With no weight at all the result is Unknown with zero
   * confidence. Unknown never wins by threshold.
   * @param threshold fraction 0..1
   */
  Resolution resolve(const VerdictDistribution &distribution,
                     const Decimal &threshold);

  /**
   * Consensus needs a verdict that reached the threshold and at least
   * `min_submissions` counted submissions
   */
  bool isConsensusReached(const Resolution &resolution,
                          size_t eligible_submissions,
                          size_t min_submissions);

}  // namespace nexus::consensus
