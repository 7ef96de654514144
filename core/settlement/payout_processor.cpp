/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settlement/payout_processor.hpp"

#include <algorithm>
#include <tuple>

namespace {
  constexpr auto payoutsFailedMetricName = "nexus_payouts_failed_total";
}

namespace nexus::settlement {

  using primitives::Payout;
  using primitives::PayoutStatus;

  PayoutProcessor::PayoutProcessor(
      application::AppStateManager &app_state_manager,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<clock::Ticker> ticker,
      std::shared_ptr<storage::PayoutRepository> payouts,
      std::shared_ptr<PaymentGateway> gateway,
      std::shared_ptr<notification::EventPublisher> publisher,
      std::shared_ptr<metrics::Registry> metrics_registry,
      SettlementConfig config)
      : clock_{std::move(clock)},
        ticker_{std::move(ticker)},
        payouts_{std::move(payouts)},
        gateway_{std::move(gateway)},
        publisher_{std::move(publisher)},
        metrics_registry_{std::move(metrics_registry)},
        config_{std::move(config)},
        logger_{log::createLogger("PayoutProcessor", "settlement")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(ticker_);
    BOOST_ASSERT(payouts_);
    BOOST_ASSERT(gateway_);
    BOOST_ASSERT(publisher_);
    BOOST_ASSERT(metrics_registry_);
    BOOST_ASSERT(config_.max_attempts > 0);

    metrics_registry_->registerCounterFamily(
        payoutsFailedMetricName,
        "Number of payouts that failed after all attempts");
    metric_payouts_failed_ =
        metrics_registry_->registerCounterMetric(payoutsFailedMetricName);

    app_state_manager.takeControl(*this);
  }

  outcome::result<void> PayoutProcessor::prepare() {
    auto processing = payouts_->getPayouts(PayoutStatus::Processing);
    if (processing.has_error()) {
      SL_ERROR(logger_,
               "Can't load interrupted payouts: {}",
               processing.error());
      return processing.as_failure();
    }
    for (auto &payout : processing.value()) {
      auto res = payouts_->compareAndSetStatus(
          payout.action.id, PayoutStatus::Processing, PayoutStatus::Pending);
      if (res.has_error()) {
        SL_ERROR(logger_,
                 "Can't requeue payout {}: {}",
                 payout.action.id,
                 res.error());
        return res.as_failure();
      }
      SL_WARN(logger_, "Payout {} was interrupted, requeued", payout.action.id);
    }
    return outcome::success();
  }

  outcome::result<void> PayoutProcessor::start() {
    ticker_->asyncCallRepeatedly([weak{weak_from_this()}] {
      if (auto self = weak.lock()) {
        if (auto res = self->runOnce(); res.has_error()) {
          SL_ERROR(self->logger_, "Payout processing failed: {}", res.error());
        }
      }
    });
    ticker_->start(std::chrono::seconds{0});
    SL_INFO(logger_, "Payout processing started");
    return outcome::success();
  }

  void PayoutProcessor::stop() {
    ticker_->stop();
  }

  std::chrono::milliseconds PayoutProcessor::backoff(uint32_t attempts) const {
    auto delay = config_.backoff_base;
    for (uint32_t i = 1; i < attempts and delay < config_.backoff_cap; ++i) {
      delay *= 2;
    }
    return std::min(delay, config_.backoff_cap);
  }

  outcome::result<size_t> PayoutProcessor::runOnce() {
    auto now = clock_->now();
    OUTCOME_TRY(pending, payouts_->getPayouts(PayoutStatus::Pending));
    std::sort(pending.begin(),
              pending.end(),
              [](const Payout &lhs, const Payout &rhs) {
                return std::tie(lhs.created_at, lhs.action.id)
                     < std::tie(rhs.created_at, rhs.action.id);
              });

    size_t completed = 0;
    for (auto &payout : pending) {
      if (payout.next_attempt_at and *payout.next_attempt_at > now) {
        continue;
      }
      auto id = payout.action.id;
      auto res = process(std::move(payout), now);
      if (res.has_error()) {
        // storage trouble, the payout is picked up again next pass
        SL_ERROR(logger_, "Can't process payout {}: {}", id, res.error());
        continue;
      }
      if (res.value()) {
        ++completed;
      }
    }
    if (completed > 0) {
      SL_VERBOSE(logger_, "Completed {} payouts", completed);
    }
    return completed;
  }

  outcome::result<bool> PayoutProcessor::process(Payout payout,
                                                 primitives::Timestamp now) {
    OUTCOME_TRY(claimed,
                payouts_->compareAndSetStatus(payout.action.id,
                                              PayoutStatus::Pending,
                                              PayoutStatus::Processing));
    if (not claimed) {
      return false;
    }

    auto &action = payout.action;
    SL_DEBUG(logger_,
             "Executing payout {}: {} of {} to {}",
             action.id,
             action.type,
             action.amount,
             action.recipient);

    payout.attempts += 1;
    auto executed = gateway_->execute(action);
    if (executed.has_value()) {
      payout.status = PayoutStatus::Completed;
      payout.transaction_hash = executed.value().tx_hash;
      payout.processed_at = now;
      payout.next_attempt_at.reset();
      payout.last_error.reset();
      OUTCOME_TRY(payouts_->updatePayout(payout));
      SL_DEBUG(logger_,
               "Payout {} completed with tx {}",
               action.id,
               *payout.transaction_hash);
      return true;
    }

    payout.last_error = executed.error().message();
    if (payout.attempts >= config_.max_attempts) {
      payout.status = PayoutStatus::Failed;
      payout.next_attempt_at.reset();
      OUTCOME_TRY(payouts_->updatePayout(payout));
      metric_payouts_failed_->inc();
      SL_ERROR(logger_,
               "Payout {} failed after {} attempts: {}",
               action.id,
               payout.attempts,
               executed.error());
      publisher_->publish(notification::PayoutFailed{
          .payout_id = action.id,
          .bounty_id = action.bounty_id,
          .reason = *payout.last_error,
      });
      return false;
    }

    auto delay = backoff(payout.attempts);
    payout.status = PayoutStatus::Pending;
    payout.next_attempt_at = now + delay;
    OUTCOME_TRY(payouts_->updatePayout(payout));
    SL_WARN(logger_,
            "Payout {} attempt {} failed: {}, retry in {} ms",
            action.id,
            payout.attempts,
            executed.error(),
            delay.count());
    return false;
  }

}  // namespace nexus::settlement
