/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/payout_repository.hpp"

#include <map>
#include <set>

#include "utils/safe_object.hpp"

namespace nexus::storage {

  class InMemoryPayoutRepository final : public PayoutRepository {
   public:
    outcome::result<bool> recordPlan(const std::string &plan_key,
                                     const std::vector<PayoutAction> &actions,
                                     primitives::Timestamp now) override;

    outcome::result<bool> hasPlan(const std::string &plan_key) const override;

    outcome::result<std::vector<PayoutAction>> getPlannedActions(
        const primitives::BountyId &bounty_id) const override;

    outcome::result<std::vector<Payout>> getPayouts(
        PayoutStatus status) const override;

    outcome::result<Payout> getPayout(
        const primitives::PayoutId &id) const override;

    outcome::result<bool> compareAndSetStatus(const primitives::PayoutId &id,
                                              PayoutStatus expected,
                                              PayoutStatus desired) override;

    outcome::result<void> updatePayout(const Payout &payout) override;

   private:
    struct State {
      std::set<std::string> plan_keys;
      std::map<primitives::BountyId, std::vector<primitives::PayoutId>>
          by_bounty;
      std::map<primitives::PayoutId, Payout> payouts;
    };

    SafeObject<State> state_;
  };

}  // namespace nexus::storage
