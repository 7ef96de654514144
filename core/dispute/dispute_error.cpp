/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispute/dispute_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nexus::dispute, DisputeError, e) {
  using E = nexus::dispute::DisputeError;
  switch (e) {
    case E::BOUNTY_NOT_COMPLETED:
      return "Bounty is not completed";
    case E::SUBMISSION_NOT_IN_BOUNTY:
      return "Submission does not belong to the bounty";
    case E::DISPUTE_NOT_FOUND:
      return "Dispute not found";
    case E::DISPUTE_ALREADY_CLOSED:
      return "Dispute is already being resolved or closed";
    case E::ZERO_STAKE:
      return "Dispute stake must be positive";
    case E::EMPTY_REASON:
      return "Dispute reason is empty";
    case E::DISPUTE_WINDOW_CLOSED:
      return "Bounty result can not be disputed";
    case E::BOUNTY_UNDER_REVIEW:
      return "Bounty is being re-resolved for another dispute";
  }
  return "Unknown dispute error";
}
