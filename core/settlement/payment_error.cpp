/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settlement/payment_gateway.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nexus::settlement, PaymentError, e) {
  using E = nexus::settlement::PaymentError;
  switch (e) {
    case E::REJECTED:
      return "Payment rejected";
    case E::TIMEOUT:
      return "Payment was not confirmed in time";
    case E::INSUFFICIENT_FUNDS:
      return "Insufficient funds for payment";
  }
  return "Unknown payment error";
}
