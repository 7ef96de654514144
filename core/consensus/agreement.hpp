/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/consensus_result.hpp"

namespace nexus::consensus {

  using primitives::Decimal;

  /// Largest category percentage of the distribution, 0..100
  Decimal agreementScore(const primitives::VerdictDistribution &distribution);

  /**
   * A result may be disputed when its agreement stays below the dispute
   * threshold
   * @param dispute_threshold fraction 0..1
   */
  bool canDispute(const Decimal &agreement, const Decimal &dispute_threshold);

}  // namespace nexus::consensus
