/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "application/app_state_manager.hpp"
#include "clock/clock.hpp"
#include "clock/ticker.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "notification/event_publisher.hpp"
#include "settlement/payment_gateway.hpp"
#include "settlement/settlement_config.hpp"
#include "storage/payout_repository.hpp"

namespace nexus::settlement {

  /**
   * Executes pending payouts through the payment gateway. A payout is
   * claimed by moving it to Processing, so two processors never execute the
   * same one. Failed attempts are retried with capped exponential backoff
   * until `max_attempts`, then the payout is marked Failed.
   */
  class PayoutProcessor : public std::enable_shared_from_this<PayoutProcessor> {
   public:
    PayoutProcessor(application::AppStateManager &app_state_manager,
                    std::shared_ptr<clock::SystemClock> clock,
                    std::shared_ptr<clock::Ticker> ticker,
                    std::shared_ptr<storage::PayoutRepository> payouts,
                    std::shared_ptr<PaymentGateway> gateway,
                    std::shared_ptr<notification::EventPublisher> publisher,
                    std::shared_ptr<metrics::Registry> metrics_registry,
                    SettlementConfig config);

    /// Returns payouts interrupted while Processing to the queue
    outcome::result<void> prepare();

    outcome::result<void> start();

    void stop();

    /// @return number of payouts completed in this pass
    outcome::result<size_t> runOnce();

    /// Delay before the attempt following `attempts` failed ones
    std::chrono::milliseconds backoff(uint32_t attempts) const;

   private:
    outcome::result<bool> process(primitives::Payout payout,
                                  primitives::Timestamp now);

    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<clock::Ticker> ticker_;
    std::shared_ptr<storage::PayoutRepository> payouts_;
    std::shared_ptr<PaymentGateway> gateway_;
    std::shared_ptr<notification::EventPublisher> publisher_;
    std::shared_ptr<metrics::Registry> metrics_registry_;
    metrics::Counter *metric_payouts_failed_;
    SettlementConfig config_;
    log::Logger logger_;
  };

}  // namespace nexus::settlement
