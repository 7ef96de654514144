/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reputation/reputation_ranking.hpp"

#include <algorithm>

namespace nexus::reputation {

  std::vector<storage::RankEntry> computeRanking(
      std::vector<primitives::ReputationRecord> records) {
    std::sort(records.begin(),
              records.end(),
              [](const primitives::ReputationRecord &lhs,
                 const primitives::ReputationRecord &rhs) {
                if (lhs.score != rhs.score) {
                  return lhs.score > rhs.score;
                }
                return lhs.engine_id < rhs.engine_id;
              });

    std::vector<storage::RankEntry> ranking;
    ranking.reserve(records.size());
    const auto total = static_cast<uint32_t>(records.size());
    for (uint32_t i = 0; i < total; ++i) {
      const uint32_t rank = i + 1;
      const primitives::Decimal share =
          primitives::Decimal(total - rank + 1) / total;
      const primitives::Decimal percentile = share * 100;
      ranking.push_back(storage::RankEntry{
          .engine_id = records[i].engine_id,
          .rank = rank,
          .percentile = percentile,
      });
    }
    return ranking;
  }

}  // namespace nexus::reputation
