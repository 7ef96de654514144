/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nexus::application {

  enum class ConfigurationError : int {
    INVALID_NUMBER = 1,
    INVALID_THRESHOLD,
    NEGATIVE_WEIGHT,
    ZERO_WEIGHTS,
    INVALID_FRACTION,
    INVALID_SCORE_BOUNDS,
    ZERO_ATTEMPTS,
    ZERO_THREADS,
    INVALID_SEED,
  };

}  // namespace nexus::application

OUTCOME_HPP_DECLARE_ERROR(nexus::application, ConfigurationError);
