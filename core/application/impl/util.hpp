/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "application/app_configuration.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "primitives/decimal.hpp"

namespace nexus::application::util {

  /// Parses a plain decimal such as "0.66"
  outcome::result<primitives::Decimal> parseDecimal(std::string_view str);

  /// Parses a non-negative integer amount
  outcome::result<primitives::Balance> parseBalance(std::string_view str);

  /// Checks the ranges and relations of the numeric settings
  outcome::result<void> validate(const consensus::ConsensusConfig &consensus,
                                 const reputation::ReputationConfig &reputation,
                                 const settlement::SettlementConfig &settlement,
                                 const WorkerConfig &worker);

}  // namespace nexus::application::util
