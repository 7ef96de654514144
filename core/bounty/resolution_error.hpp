/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nexus::bounty {

  enum class ResolutionError : int {
    /// settlement was requested for a bounty without a committed resolution
    NOT_RESOLVED = 1,
    /// another resolver changed the bounty status first
    RESOLUTION_RACE_LOST,
  };

}  // namespace nexus::bounty

OUTCOME_HPP_DECLARE_ERROR(nexus::bounty, ResolutionError);
