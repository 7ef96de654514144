/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_reputation_repository.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "storage/storage_error.hpp"

namespace nexus::storage {

  InMemoryReputationRepository::InMemoryReputationRepository(
      int32_t base_score, int32_t min_score, int32_t max_score)
      : base_score_{base_score}, min_score_{min_score}, max_score_{max_score} {
    BOOST_ASSERT(min_score_ <= base_score_ and base_score_ <= max_score_);
  }

  ReputationRecord InMemoryReputationRepository::fresh(
      const EngineId &engine_id) const {
    ReputationRecord record;
    record.engine_id = engine_id;
    record.score = base_score_;
    return record;
  }

  outcome::result<int32_t> InMemoryReputationRepository::getScore(
      const EngineId &engine_id) const {
    OUTCOME_TRY(record, getRecord(engine_id));
    return record.score;
  }

  outcome::result<ReputationRecord> InMemoryReputationRepository::getRecord(
      const EngineId &engine_id) const {
    if (engine_id.empty()) {
      return StorageError::INVALID_ARGUMENT;
    }
    return state_.sharedAccess([&](const State &state) {
      auto it = state.records.find(engine_id);
      if (it == state.records.end()) {
        return outcome::result<ReputationRecord>{fresh(engine_id)};
      }
      return outcome::result<ReputationRecord>{it->second};
    });
  }

  outcome::result<std::vector<ReputationRecord>>
  InMemoryReputationRepository::getRecords() const {
    return state_.sharedAccess([&](const State &state) {
      std::vector<ReputationRecord> records;
      records.reserve(state.records.size());
      for (auto &[_, record] : state.records) {
        records.push_back(record);
      }
      return outcome::result<std::vector<ReputationRecord>>{
          std::move(records)};
    });
  }

  int32_t InMemoryReputationRepository::shiftScore(ReputationRecord &record,
                                                   int64_t delta) const {
    auto before = record.score;
    record.score = static_cast<int32_t>(std::clamp<int64_t>(
        static_cast<int64_t>(record.score) + delta, min_score_, max_score_));
    return record.score - before;
  }

  outcome::result<bool> InMemoryReputationRepository::applyDelta(
      const std::string &key,
      const EngineId &engine_id,
      const ReputationDelta &delta) {
    if (engine_id.empty()) {
      return StorageError::INVALID_ARGUMENT;
    }
    return state_.exclusiveAccess([&](State &state) {
      auto it = state.records.find(engine_id);
      if (it == state.records.end()) {
        it = state.records.emplace(engine_id, fresh(engine_id)).first;
      }
      auto &record = it->second;

      auto [entry, inserted] = state.applied.try_emplace(key);
      auto &applied = entry->second;
      const bool revised = not inserted and delta.correct.has_value()
                       and applied.correct.has_value()
                       and *applied.correct != *delta.correct;
      if (not inserted and not revised) {
        return outcome::result<bool>{false};
      }

      if (revised) {
        // the submission is counted once, only its outcome changes
        shiftScore(record, -static_cast<int64_t>(applied.score_change));
        if (*applied.correct) {
          record.correct_submissions -= 1;
        }
      } else if (delta.correct.has_value()) {
        record.total_submissions += 1;
      }

      applied.score_change = shiftScore(record, delta.delta);
      applied.correct = delta.correct;
      record.total_earned += delta.earned;

      if (delta.correct.has_value()) {
        if (*delta.correct) {
          record.correct_submissions += 1;
          record.current_streak += 1;
          record.best_streak =
              std::max(record.best_streak, record.current_streak);
        } else {
          record.current_streak = 0;
        }
      }
      if (delta.decay) {
        record.last_decay = std::max(record.last_decay, delta.at);
      } else {
        record.last_active = std::max(record.last_active, delta.at);
      }
      return outcome::result<bool>{true};
    });
  }

  outcome::result<void> InMemoryReputationRepository::updateRanking(
      const std::vector<RankEntry> &ranking) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      for (auto &entry : ranking) {
        auto it = state.records.find(entry.engine_id);
        if (it == state.records.end()) {
          continue;
        }
        it->second.rank = entry.rank;
        it->second.percentile = entry.percentile;
      }
      return outcome::success();
    });
  }

}  // namespace nexus::storage
