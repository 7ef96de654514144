/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/dispute_repository.hpp"

#include <map>

#include "utils/safe_object.hpp"

namespace nexus::storage {

  class InMemoryDisputeRepository final : public DisputeRepository {
   public:
    outcome::result<void> putDispute(const Dispute &dispute) override;

    outcome::result<Dispute> getDispute(const DisputeId &id) const override;

    outcome::result<std::vector<Dispute>> getDisputes(
        const primitives::BountyId &bounty_id) const override;

    outcome::result<bool> compareAndSetStatus(
        const DisputeId &id,
        DisputeStatus expected,
        DisputeStatus desired,
        primitives::Timestamp now) override;

    outcome::result<void> updateDispute(const Dispute &dispute) override;

   private:
    SafeObject<std::map<DisputeId, Dispute>> disputes_;
  };

}  // namespace nexus::storage
