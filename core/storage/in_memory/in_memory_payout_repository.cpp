/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_payout_repository.hpp"

#include "storage/storage_error.hpp"

namespace nexus::storage {

  outcome::result<bool> InMemoryPayoutRepository::recordPlan(
      const std::string &plan_key,
      const std::vector<PayoutAction> &actions,
      primitives::Timestamp now) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<bool> {
      if (state.plan_keys.contains(plan_key)) {
        return false;
      }
      std::set<primitives::PayoutId> ids;
      for (auto &action : actions) {
        if (state.payouts.contains(action.id)
            or not ids.emplace(action.id).second) {
          return StorageError::ALREADY_EXISTS;
        }
      }
      state.plan_keys.emplace(plan_key);
      for (auto &action : actions) {
        state.by_bounty[action.bounty_id].push_back(action.id);
        state.payouts.emplace(action.id,
                              Payout{.action = action, .created_at = now});
      }
      return true;
    });
  }

  outcome::result<bool> InMemoryPayoutRepository::hasPlan(
      const std::string &plan_key) const {
    return state_.sharedAccess([&](const State &state) {
      return outcome::result<bool>{state.plan_keys.contains(plan_key)};
    });
  }

  outcome::result<std::vector<PayoutAction>>
  InMemoryPayoutRepository::getPlannedActions(
      const primitives::BountyId &bounty_id) const {
    return state_.sharedAccess([&](const State &state) {
      std::vector<PayoutAction> actions;
      auto it = state.by_bounty.find(bounty_id);
      if (it != state.by_bounty.end()) {
        for (auto &id : it->second) {
          actions.push_back(state.payouts.at(id).action);
        }
      }
      return outcome::result<std::vector<PayoutAction>>{std::move(actions)};
    });
  }

  outcome::result<std::vector<Payout>> InMemoryPayoutRepository::getPayouts(
      PayoutStatus status) const {
    return state_.sharedAccess([&](const State &state) {
      std::vector<Payout> payouts;
      for (auto &[_, payout] : state.payouts) {
        if (payout.status == status) {
          payouts.push_back(payout);
        }
      }
      return outcome::result<std::vector<Payout>>{std::move(payouts)};
    });
  }

  outcome::result<Payout> InMemoryPayoutRepository::getPayout(
      const primitives::PayoutId &id) const {
    return state_.sharedAccess([&](const State &state) -> outcome::result<Payout> {
      auto it = state.payouts.find(id);
      if (it == state.payouts.end()) {
        return StorageError::NOT_FOUND;
      }
      return it->second;
    });
  }

  outcome::result<bool> InMemoryPayoutRepository::compareAndSetStatus(
      const primitives::PayoutId &id,
      PayoutStatus expected,
      PayoutStatus desired) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<bool> {
      auto it = state.payouts.find(id);
      if (it == state.payouts.end()) {
        return StorageError::NOT_FOUND;
      }
      if (it->second.status != expected) {
        return false;
      }
      it->second.status = desired;
      return true;
    });
  }

  outcome::result<void> InMemoryPayoutRepository::updatePayout(
      const Payout &payout) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      auto it = state.payouts.find(payout.action.id);
      if (it == state.payouts.end()) {
        return StorageError::NOT_FOUND;
      }
      if (it->second.action != payout.action) {
        return StorageError::INVALID_ARGUMENT;
      }
      it->second = payout;
      return outcome::success();
    });
  }

}  // namespace nexus::storage
