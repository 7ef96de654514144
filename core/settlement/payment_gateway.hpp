/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "outcome/outcome.hpp"
#include "primitives/payout.hpp"

namespace nexus::settlement {

  enum class PaymentError : int {
    /// the payment layer refused the transfer
    REJECTED = 1,
    /// no confirmation arrived in time, the transfer may be retried
    TIMEOUT,
    INSUFFICIENT_FUNDS,
  };

  /// Confirmed transfer
  struct TransactionHandle {
    std::string tx_hash;
  };

  /**
   * Executes payout actions: submits a transfer and waits for its
   * confirmation. Implementations must treat a repeated action id as the
   * same transfer.
   */
  class PaymentGateway {
   public:
    virtual ~PaymentGateway() = default;

    virtual outcome::result<TransactionHandle> execute(
        const primitives::PayoutAction &action) = 0;
  };

}  // namespace nexus::settlement

OUTCOME_HPP_DECLARE_ERROR(nexus::settlement, PaymentError);
