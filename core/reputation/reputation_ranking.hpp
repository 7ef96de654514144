/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "storage/reputation_repository.hpp"

namespace nexus::reputation {

  /**
   * Ranks engines by score, best first, ties broken by engine id.
   * Percentile is (total - rank + 1) / total * 100.
   */
  std::vector<storage::RankEntry> computeRanking(
      std::vector<primitives::ReputationRecord> records);

}  // namespace nexus::reputation
