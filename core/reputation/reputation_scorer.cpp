/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reputation/reputation_scorer.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace nexus::reputation {

  ReputationScorer::ReputationScorer(ReputationConfig config)
      : config_{std::move(config)} {
    BOOST_ASSERT(config_.min_score <= config_.max_score);
  }

  int32_t ReputationScorer::clamp(int64_t score) const {
    return static_cast<int32_t>(
        std::clamp<int64_t>(score, config_.min_score, config_.max_score));
  }

  int32_t ReputationScorer::scoreChange(
      const primitives::ReputationRecord &record,
      const AccuracyOutcome &outcome) const {
    int64_t points =
        outcome.correct ? config_.correct_points : config_.incorrect_penalty;

    if (outcome.correct and record.current_streak > 0) {
      const Decimal growth = Decimal(record.current_streak) * Decimal{"0.1"};
      const Decimal stepped = Decimal{1} + growth;
      const Decimal multiplier = std::min(stepped, config_.streak_cap);
      const Decimal boosted = Decimal(points) * multiplier;
      points = primitives::truncToInt(boosted);
    }

    if (outcome.in_consensus) {
      points += config_.consensus_bonus;
    }
    if (outcome.early) {
      points += config_.early_bonus;
    }

    const Decimal scaled = Decimal(points) * outcome.confidence;
    auto delta = primitives::truncToInt(scaled);

    return static_cast<int32_t>(clamp(record.score + delta) - record.score);
  }

  int32_t ReputationScorer::applyDecay(int32_t score,
                                       const Decimal &days) const {
    const Decimal loss = config_.decay_rate * days;
    Decimal factor = Decimal{1} - loss;
    if (factor < 0) {
      factor = 0;
    }
    const Decimal decayed = Decimal(score) * factor;
    return clamp(primitives::truncToInt(decayed));
  }

}  // namespace nexus::reputation
