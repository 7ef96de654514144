/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/dispute.hpp"

namespace nexus::storage {

  using primitives::Dispute;
  using primitives::DisputeId;
  using primitives::DisputeStatus;

  class DisputeRepository {
   public:
    virtual ~DisputeRepository() = default;

    virtual outcome::result<void> putDispute(const Dispute &dispute) = 0;

    virtual outcome::result<Dispute> getDispute(const DisputeId &id) const = 0;

    virtual outcome::result<std::vector<Dispute>> getDisputes(
        const primitives::BountyId &bounty_id) const = 0;

    /// @return false if the dispute is not in `expected` status
    virtual outcome::result<bool> compareAndSetStatus(const DisputeId &id,
                                                      DisputeStatus expected,
                                                      DisputeStatus desired,
                                                      primitives::Timestamp now) = 0;

    virtual outcome::result<void> updateDispute(const Dispute &dispute) = 0;
  };

}  // namespace nexus::storage
