/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nexus::dispute {

  enum class DisputeError : int {
    BOUNTY_NOT_COMPLETED = 1,
    SUBMISSION_NOT_IN_BOUNTY,
    DISPUTE_NOT_FOUND,
    DISPUTE_ALREADY_CLOSED,
    ZERO_STAKE,
    EMPTY_REASON,
    DISPUTE_WINDOW_CLOSED,
    BOUNTY_UNDER_REVIEW,
  };

}  // namespace nexus::dispute

OUTCOME_HPP_DECLARE_ERROR(nexus::dispute, DisputeError);
