/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/decimal.hpp"
#include "primitives/verdict.hpp"

namespace nexus::consensus {

  /**
   * Accuracy of a submission against the final verdict: 0.5 + confidence / 2
   * when it matches, 0 otherwise
   */
  primitives::Decimal accuracyScore(primitives::Verdict submitted,
                                    primitives::Verdict final_verdict,
                                    const primitives::Decimal &confidence);

}  // namespace nexus::consensus
