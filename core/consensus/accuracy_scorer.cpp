/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/accuracy_scorer.hpp"

namespace nexus::consensus {

  using primitives::Decimal;

  Decimal accuracyScore(primitives::Verdict submitted,
                        primitives::Verdict final_verdict,
                        const Decimal &confidence) {
    if (submitted != final_verdict) {
      return Decimal{0};
    }
    static const Decimal kHalf{"0.5"};
    return kHalf + confidence * kHalf;
  }

}  // namespace nexus::consensus
