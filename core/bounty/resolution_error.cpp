/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bounty/resolution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nexus::bounty, ResolutionError, e) {
  using E = nexus::bounty::ResolutionError;
  switch (e) {
    case E::NOT_RESOLVED:
      return "Bounty is neither completed nor expired";
    case E::RESOLUTION_RACE_LOST:
      return "Bounty was resolved concurrently";
  }
  return "Unknown resolution error";
}
