/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/payout.hpp"

namespace nexus::storage {

  using primitives::Payout;
  using primitives::PayoutAction;
  using primitives::PayoutStatus;

  /**
   * Settlement plans and the execution state of every planned action
   */
  class PayoutRepository {
   public:
    virtual ~PayoutRepository() = default;

    /**
     * Stores a plan as pending payouts. A plan key is recorded at most once,
     * so regenerating a plan after a crash does not pay twice.
     * @param plan_key identifies the plan, e.g. a bounty resolution round
     * @return false if the key was recorded before, nothing is stored then
     */
    virtual outcome::result<bool> recordPlan(
        const std::string &plan_key,
        const std::vector<PayoutAction> &actions,
        primitives::Timestamp now) = 0;

    virtual outcome::result<bool> hasPlan(
        const std::string &plan_key) const = 0;

    /// Every action ever planned for the bounty, in planning order
    virtual outcome::result<std::vector<PayoutAction>> getPlannedActions(
        const primitives::BountyId &bounty_id) const = 0;

    virtual outcome::result<std::vector<Payout>> getPayouts(
        PayoutStatus status) const = 0;

    virtual outcome::result<Payout> getPayout(
        const primitives::PayoutId &id) const = 0;

    /// @return false if the payout is not in `expected` status
    virtual outcome::result<bool> compareAndSetStatus(
        const primitives::PayoutId &id,
        PayoutStatus expected,
        PayoutStatus desired) = 0;

    virtual outcome::result<void> updatePayout(const Payout &payout) = 0;
  };

}  // namespace nexus::storage
