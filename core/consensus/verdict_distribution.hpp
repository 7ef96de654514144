/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "primitives/consensus_result.hpp"

namespace nexus::consensus {

  using primitives::Decimal;
  using primitives::VerdictDistribution;

  /// Input of the distribution builder: a vote with its model weight
  struct WeightedVote {
    primitives::SubmissionId submission_id;
    primitives::EngineId voter;
    primitives::Verdict verdict = primitives::Verdict::Unknown;
    Decimal confidence;
    Decimal weight;
  };

  /**
   * Groups votes by verdict. Every category is present in the output, in
   * canonical order. In weighted mode each vote adds its weight to the
   * category, in simple mode it adds one.
   * @param votes in submission order; voter lists keep that order
   */
  VerdictDistribution buildDistribution(const std::vector<WeightedVote> &votes,
                                        bool weighted);

}  // namespace nexus::consensus
