/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/decimal.hpp"

namespace nexus::reputation {

  using primitives::Decimal;

  struct ReputationConfig {
    /// Score of an engine without history
    int32_t base_score = 1000;
    int32_t correct_points = 50;
    int32_t incorrect_penalty = -100;
    /// Upper bound of the streak multiplier
    Decimal streak_cap{"1.5"};
    int32_t consensus_bonus = 25;
    int32_t early_bonus = 10;
    /// Share of the score lost per day of inactivity
    Decimal decay_rate{"0.001"};
    int32_t min_score = 0;
    int32_t max_score = 10000;
  };

}  // namespace nexus::reputation
