/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/util.hpp"

#include <algorithm>
#include <limits>
#include <regex>

#include "application/configuration_error.hpp"

namespace nexus::application::util {

  using primitives::Decimal;

  outcome::result<Decimal> parseDecimal(std::string_view str) {
    static const std::regex kDecimal{R"(^-?[0-9]+(\.[0-9]+)?$)"};
    std::string value{str};
    if (not std::regex_match(value, kDecimal)) {
      return ConfigurationError::INVALID_NUMBER;
    }
    return Decimal{value};
  }

  outcome::result<primitives::Balance> parseBalance(std::string_view str) {
    if (str.empty() or str.size() > 39
        or not std::all_of(str.begin(), str.end(), [](char c) {
             return c >= '0' and c <= '9';
           })) {
      return ConfigurationError::INVALID_NUMBER;
    }
    // uint128 holds every 38-digit number, 39 digits may overflow
    const Decimal value{std::string{str}};
    const Decimal max{std::numeric_limits<primitives::Balance>::max()};
    if (value > max) {
      return ConfigurationError::INVALID_NUMBER;
    }
    return primitives::Balance{std::string{str}};
  }

  outcome::result<void> validate(const consensus::ConsensusConfig &consensus,
                                 const reputation::ReputationConfig &reputation,
                                 const settlement::SettlementConfig &settlement,
                                 const WorkerConfig &worker) {
    if (consensus.threshold <= 0 or consensus.threshold > 1) {
      return ConfigurationError::INVALID_THRESHOLD;
    }
    if (consensus.reputation_weight < 0 or consensus.confidence_weight < 0
        or consensus.time_weight < 0) {
      return ConfigurationError::NEGATIVE_WEIGHT;
    }
    const Decimal weights = consensus.reputation_weight
                          + consensus.confidence_weight + consensus.time_weight;
    if (weights == 0) {
      return ConfigurationError::ZERO_WEIGHTS;
    }
    if (consensus.dispute_threshold < 0 or consensus.dispute_threshold > 1
        or consensus.early_window < 0 or consensus.early_window > 1) {
      return ConfigurationError::INVALID_FRACTION;
    }
    if (reputation.min_score > reputation.max_score) {
      return ConfigurationError::INVALID_SCORE_BOUNDS;
    }
    if (reputation.decay_rate < 0 or reputation.decay_rate > 1) {
      return ConfigurationError::INVALID_FRACTION;
    }
    if (settlement.slash_fraction < 0 or settlement.slash_fraction > 1
        or settlement.fee_fraction < 0 or settlement.fee_fraction >= 1) {
      return ConfigurationError::INVALID_FRACTION;
    }
    if (settlement.max_attempts == 0) {
      return ConfigurationError::ZERO_ATTEMPTS;
    }
    if (worker.threads == 0) {
      return ConfigurationError::ZERO_THREADS;
    }
    return outcome::success();
  }

}  // namespace nexus::application::util
