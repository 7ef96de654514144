/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "settlement/payment_gateway.hpp"

#include <map>

#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace nexus::settlement {

  /**
   * Payment gateway that settles into an in-process ledger of account
   * balances. Used when the node runs without a chain connection.
   */
  class LedgerPaymentGateway final : public PaymentGateway {
   public:
    LedgerPaymentGateway();

    outcome::result<TransactionHandle> execute(
        const primitives::PayoutAction &action) override;

    primitives::Balance balance(const primitives::AccountId &account) const;

   private:
    struct Ledger {
      std::map<primitives::AccountId, primitives::Balance> balances;
      std::map<primitives::PayoutId, std::string> transactions;
    };

    SafeObject<Ledger> ledger_;
    log::Logger logger_;
  };

}  // namespace nexus::settlement
