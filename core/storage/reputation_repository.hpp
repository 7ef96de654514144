/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/reputation.hpp"

namespace nexus::storage {

  using primitives::EngineId;
  using primitives::ReputationRecord;

  /// Score change together with the bookkeeping it implies
  struct ReputationDelta {
    int32_t delta = 0;
    /// Outcome of a scored submission, none when only the score or the
    /// earnings change
    std::optional<bool> correct;
    primitives::Balance earned;
    primitives::Timestamp at;
    /// Inactivity decay, moves the last decay time instead of last activity
    bool decay = false;
  };

  struct RankEntry {
    EngineId engine_id;
    uint32_t rank = 0;
    primitives::Decimal percentile;
  };

  /**
   * Reputation of analysis engines. Unknown engines read as a fresh record
   * with the base score.
   */
  class ReputationRepository {
   public:
    virtual ~ReputationRepository() = default;

    virtual outcome::result<int32_t> getScore(
        const EngineId &engine_id) const = 0;

    virtual outcome::result<ReputationRecord> getRecord(
        const EngineId &engine_id) const = 0;

    virtual outcome::result<std::vector<ReputationRecord>> getRecords()
        const = 0;

    /**
     * Applies a delta once per idempotency key. The resulting score is kept
     * within the repository bounds. An outcome delta under a key that holds
     * the opposite outcome revises it: the earlier score change and correct
     * count are taken back and the submission is still counted once.
     * @return false if the key was applied before with the same outcome
     */
    virtual outcome::result<bool> applyDelta(const std::string &key,
                                             const EngineId &engine_id,
                                             const ReputationDelta &delta) = 0;

    virtual outcome::result<void> updateRanking(
        const std::vector<RankEntry> &ranking) = 0;
  };

}  // namespace nexus::storage
