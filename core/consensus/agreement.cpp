/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/agreement.hpp"

namespace nexus::consensus {

  Decimal agreementScore(const primitives::VerdictDistribution &distribution) {
    Decimal best{0};
    for (auto &stats : distribution.stats) {
      if (stats.percentage > best) {
        best = stats.percentage;
      }
    }
    return best;
  }

  bool canDispute(const Decimal &agreement, const Decimal &dispute_threshold) {
    const Decimal required = dispute_threshold * 100;
    return agreement < required;
  }

}  // namespace nexus::consensus
