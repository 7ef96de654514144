/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bounty/consensus_worker.hpp"

#include <latch>

#include <libp2p/common/final_action.hpp>

#include "utils/thread_pool.hpp"

namespace {
  constexpr auto resolvedMetricName = "nexus_bounties_resolved_total";
  constexpr auto expiredMetricName = "nexus_bounties_expired_total";
  constexpr auto failuresMetricName = "nexus_consensus_tick_failures_total";
  constexpr auto openMetricName = "nexus_open_bounties";
}  // namespace

namespace nexus::bounty {

  using primitives::Bounty;
  using primitives::BountyStatus;

  ConsensusWorker::ConsensusWorker(
      application::AppStateManager &app_state_manager,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<clock::Ticker> ticker,
      std::shared_ptr<storage::BountyRepository> bounties,
      std::shared_ptr<BountyResolver> resolver,
      std::shared_ptr<ThreadPool> bounty_pool,
      std::shared_ptr<metrics::Registry> metrics_registry)
      : clock_{std::move(clock)},
        ticker_{std::move(ticker)},
        bounties_{std::move(bounties)},
        resolver_{std::move(resolver)},
        bounty_pool_{std::move(bounty_pool)},
        metrics_registry_{std::move(metrics_registry)},
        logger_{log::createLogger("ConsensusWorker", "bounty")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(ticker_);
    BOOST_ASSERT(bounties_);
    BOOST_ASSERT(resolver_);
    BOOST_ASSERT(bounty_pool_);
    BOOST_ASSERT(metrics_registry_);

    metrics_registry_->registerCounterFamily(
        resolvedMetricName, "Number of bounties resolved by consensus");
    metric_resolved_ =
        metrics_registry_->registerCounterMetric(resolvedMetricName);

    metrics_registry_->registerCounterFamily(
        expiredMetricName, "Number of bounties expired without consensus");
    metric_expired_ =
        metrics_registry_->registerCounterMetric(expiredMetricName);

    metrics_registry_->registerCounterFamily(
        failuresMetricName,
        "Number of bounties whose processing failed during a tick");
    metric_failures_ =
        metrics_registry_->registerCounterMetric(failuresMetricName);

    metrics_registry_->registerGaugeFamily(
        openMetricName, "Number of open bounties seen by the last tick");
    metric_open_ = metrics_registry_->registerGaugeMetric(openMetricName);

    app_state_manager.takeControl(*this);
  }

  outcome::result<void> ConsensusWorker::start() {
    ticker_->asyncCallRepeatedly([weak{weak_from_this()}] {
      if (auto self = weak.lock()) {
        if (auto res = self->runOnce(); res.has_error()) {
          SL_ERROR(self->logger_, "Consensus tick failed: {}", res.error());
        }
      }
    });
    ticker_->start(std::chrono::seconds{0});
    SL_INFO(logger_, "Consensus worker started");
    return outcome::success();
  }

  void ConsensusWorker::stop() {
    ticker_->stop();
  }

  void ConsensusWorker::resumeUnsettled() {
    auto unsettled = bounties_->getUnsettledBounties();
    if (unsettled.has_error()) {
      SL_ERROR(logger_,
               "Can't load bounties with unfinished settlement: {}",
               unsettled.error());
      metric_failures_->inc();
      return;
    }
    for (auto &bounty : unsettled.value()) {
      if (auto res = resolver_->resume(bounty); res.has_error()) {
        SL_ERROR(logger_,
                 "Can't finish settlement of bounty {} round {}: {}",
                 bounty.id,
                 bounty.resolution_round,
                 res.error());
        metric_failures_->inc();
      }
    }
  }

  outcome::result<size_t> ConsensusWorker::runOnce() {
    if (in_flight_.exchange(true)) {
      SL_DEBUG(logger_, "Previous tick is still running, skipped");
      return 0;
    }
    libp2p::common::FinalAction release([this] { in_flight_ = false; });

    resumeUnsettled();

    OUTCOME_TRY(open, bounties_->getBounties(BountyStatus::Open));
    metric_open_->set(static_cast<double>(open.size()));
    if (open.empty()) {
      return 0;
    }

    std::atomic_size_t committed = 0;
    std::latch done(static_cast<std::ptrdiff_t>(open.size()));
    for (auto &bounty : open) {
      bounty_pool_->post([this, &bounty, &committed, &done] {
        auto res = processBounty(bounty);
        if (res.has_error()) {
          SL_ERROR(logger_,
                   "Can't process bounty {}: {}",
                   bounty.id,
                   res.error());
          metric_failures_->inc();
        } else if (res.value()) {
          ++committed;
        }
        done.count_down();
      });
    }
    done.wait();

    SL_VERBOSE(logger_,
               "Tick over {} open bounties committed {}",
               open.size(),
               committed.load());
    return committed.load();
  }

  outcome::result<bool> ConsensusWorker::processBounty(const Bounty &bounty) {
    OUTCOME_TRY(evaluation, resolver_->evaluate(bounty));
    auto &result = evaluation.result;

    if (result.consensus_reached) {
      OUTCOME_TRY(round,
                  bounties_->commitResolution(bounty.id,
                                              BountyStatus::Open,
                                              BountyStatus::Completed,
                                              result));
      if (not round) {
        SL_DEBUG(logger_, "Bounty {} was resolved concurrently", bounty.id);
        return false;
      }
      auto resolved = bounty;
      resolved.status = BountyStatus::Completed;
      resolved.resolution_round = *round;
      resolved.consensus = result;
      OUTCOME_TRY(resolver_->finalize(resolved, evaluation, *round));
      metric_resolved_->inc();
      return true;
    }

    if (clock_->now() < bounty.deadline) {
      SL_TRACE(logger_,
               "Bounty {} stays open: {} counted submissions, leader {} "
               "with {}%",
               bounty.id,
               evaluation.counted.size(),
               result.final_verdict,
               result.agreement_score);
      return false;
    }

    OUTCOME_TRY(round,
                bounties_->commitResolution(bounty.id,
                                            BountyStatus::Open,
                                            BountyStatus::Expired,
                                            result));
    if (not round) {
      SL_DEBUG(logger_, "Bounty {} was resolved concurrently", bounty.id);
      return false;
    }
    auto expired = bounty;
    expired.status = BountyStatus::Expired;
    expired.resolution_round = *round;
    expired.consensus = result;
    OUTCOME_TRY(resolver_->expire(expired, evaluation, *round));
    metric_expired_->inc();
    return true;
  }

  outcome::result<primitives::ConsensusResult> ConsensusWorker::recalculate(
      const primitives::BountyId &bounty_id) const {
    OUTCOME_TRY(bounty, bounties_->getBounty(bounty_id));
    OUTCOME_TRY(evaluation, resolver_->evaluate(bounty));
    return std::move(evaluation.result);
  }

}  // namespace nexus::bounty
