/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/configuration_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nexus::application, ConfigurationError, e) {
  using E = nexus::application::ConfigurationError;
  switch (e) {
    case E::INVALID_NUMBER:
      return "Value is not a valid number";
    case E::INVALID_THRESHOLD:
      return "Consensus threshold must be in (0, 1]";
    case E::NEGATIVE_WEIGHT:
      return "Vote weight coefficients must not be negative";
    case E::ZERO_WEIGHTS:
      return "At least one vote weight coefficient must be positive";
    case E::INVALID_FRACTION:
      return "Fraction must be in [0, 1]";
    case E::INVALID_SCORE_BOUNDS:
      return "Minimal reputation score exceeds the maximal one";
    case E::ZERO_ATTEMPTS:
      return "Payout attempts must be positive";
    case E::ZERO_THREADS:
      return "Worker thread count must be positive";
    case E::INVALID_SEED:
      return "Seed file is malformed";
  }
  return "Unknown configuration error";
}
