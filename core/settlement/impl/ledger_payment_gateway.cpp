/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settlement/impl/ledger_payment_gateway.hpp"

namespace nexus::settlement {

  LedgerPaymentGateway::LedgerPaymentGateway()
      : logger_{log::createLogger("LedgerPaymentGateway", "settlement")} {}

  outcome::result<TransactionHandle> LedgerPaymentGateway::execute(
      const primitives::PayoutAction &action) {
    if (action.recipient.empty()) {
      return PaymentError::REJECTED;
    }
    return ledger_.exclusiveAccess([&](Ledger &ledger) {
      auto [it, inserted] = ledger.transactions.emplace(action.id, "");
      if (inserted) {
        it->second = fmt::format("0x{:016x}", ledger.transactions.size());
        ledger.balances[action.recipient] += action.amount;
        SL_TRACE(logger_,
                 "Transfer {} of {} to {}",
                 it->second,
                 action.amount,
                 action.recipient);
      }
      return outcome::result<TransactionHandle>{
          TransactionHandle{.tx_hash = it->second}};
    });
  }

  primitives::Balance LedgerPaymentGateway::balance(
      const primitives::AccountId &account) const {
    return ledger_.sharedAccess([&](const Ledger &ledger) {
      auto it = ledger.balances.find(account);
      return it != ledger.balances.end() ? it->second : primitives::Balance{0};
    });
  }

}  // namespace nexus::settlement
