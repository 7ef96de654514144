/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "primitives/common.hpp"
#include "primitives/decimal.hpp"

namespace nexus::settlement {

  using primitives::Decimal;

  struct SettlementConfig {
    /// Share of an incorrect submission's stake that is forfeited
    Decimal slash_fraction{1};
    /// Platform fee taken from the reward before it is split
    Decimal fee_fraction{0};
    /// Recipient of slashed stakes and fees
    primitives::AccountId treasury = "treasury";
    uint32_t max_attempts = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{60000};
  };

}  // namespace nexus::settlement
