/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_dispute_repository.hpp"

#include "storage/storage_error.hpp"

namespace nexus::storage {

  using Disputes = std::map<DisputeId, Dispute>;

  outcome::result<void> InMemoryDisputeRepository::putDispute(
      const Dispute &dispute) {
    return disputes_.exclusiveAccess(
        [&](Disputes &disputes) -> outcome::result<void> {
          if (not disputes.emplace(dispute.id, dispute).second) {
            return StorageError::ALREADY_EXISTS;
          }
          return outcome::success();
        });
  }

  outcome::result<Dispute> InMemoryDisputeRepository::getDispute(
      const DisputeId &id) const {
    return disputes_.sharedAccess(
        [&](const Disputes &disputes) -> outcome::result<Dispute> {
          auto it = disputes.find(id);
          if (it == disputes.end()) {
            return StorageError::NOT_FOUND;
          }
          return it->second;
        });
  }

  outcome::result<std::vector<Dispute>> InMemoryDisputeRepository::getDisputes(
      const primitives::BountyId &bounty_id) const {
    return disputes_.sharedAccess([&](const Disputes &disputes) {
      std::vector<Dispute> found;
      for (auto &[_, dispute] : disputes) {
        if (dispute.bounty_id == bounty_id) {
          found.push_back(dispute);
        }
      }
      return outcome::result<std::vector<Dispute>>{std::move(found)};
    });
  }

  outcome::result<bool> InMemoryDisputeRepository::compareAndSetStatus(
      const DisputeId &id,
      DisputeStatus expected,
      DisputeStatus desired,
      primitives::Timestamp now) {
    return disputes_.exclusiveAccess(
        [&](Disputes &disputes) -> outcome::result<bool> {
          auto it = disputes.find(id);
          if (it == disputes.end()) {
            return StorageError::NOT_FOUND;
          }
          if (it->second.status != expected) {
            return false;
          }
          it->second.status = desired;
          it->second.updated_at = now;
          return true;
        });
  }

  outcome::result<void> InMemoryDisputeRepository::updateDispute(
      const Dispute &dispute) {
    return disputes_.exclusiveAccess(
        [&](Disputes &disputes) -> outcome::result<void> {
          auto it = disputes.find(dispute.id);
          if (it == disputes.end()) {
            return StorageError::NOT_FOUND;
          }
          it->second = dispute;
          return outcome::success();
        });
  }

}  // namespace nexus::storage
