/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/reputation_repository.hpp"

#include <map>

#include "utils/safe_object.hpp"

namespace nexus::storage {

  class InMemoryReputationRepository final : public ReputationRepository {
   public:
    InMemoryReputationRepository(int32_t base_score,
                                 int32_t min_score,
                                 int32_t max_score);

    outcome::result<int32_t> getScore(const EngineId &engine_id) const override;

    outcome::result<ReputationRecord> getRecord(
        const EngineId &engine_id) const override;

    outcome::result<std::vector<ReputationRecord>> getRecords() const override;

    outcome::result<bool> applyDelta(const std::string &key,
                                     const EngineId &engine_id,
                                     const ReputationDelta &delta) override;

    outcome::result<void> updateRanking(
        const std::vector<RankEntry> &ranking) override;

   private:
    /// What a key changed, so a revised outcome can take it back
    struct Applied {
      int32_t score_change = 0;
      std::optional<bool> correct;
    };

    struct State {
      std::map<EngineId, ReputationRecord> records;
      std::map<std::string, Applied> applied;
    };

    ReputationRecord fresh(const EngineId &engine_id) const;

    /// Adds \param delta to the score within bounds, returns the real change
    int32_t shiftScore(ReputationRecord &record, int64_t delta) const;

    const int32_t base_score_;
    const int32_t min_score_;
    const int32_t max_score_;
    SafeObject<State> state_;
  };

}  // namespace nexus::storage
