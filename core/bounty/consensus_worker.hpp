/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include "application/app_state_manager.hpp"
#include "bounty/bounty_resolver.hpp"
#include "clock/clock.hpp"
#include "clock/ticker.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "storage/bounty_repository.hpp"

namespace nexus {
  class ThreadPool;
}

namespace nexus::bounty {

  /**
   * Periodically resolves open bounties. Every tick first completes the
   * settlement of bounties resolved by an interrupted tick, then evaluates
   * all open bounties in parallel on the bounty pool. A bounty reaching
   * consensus is committed Completed, a bounty past its deadline without
   * consensus is committed Expired. Commits are compare-and-swap, so a
   * bounty resolved by another worker is left alone.
   */
  class ConsensusWorker : public std::enable_shared_from_this<ConsensusWorker> {
   public:
    ConsensusWorker(application::AppStateManager &app_state_manager,
                    std::shared_ptr<clock::SystemClock> clock,
                    std::shared_ptr<clock::Ticker> ticker,
                    std::shared_ptr<storage::BountyRepository> bounties,
                    std::shared_ptr<BountyResolver> resolver,
                    std::shared_ptr<ThreadPool> bounty_pool,
                    std::shared_ptr<metrics::Registry> metrics_registry);

    outcome::result<void> start();

    void stop();

    /**
     * One tick. Returns immediately with zero if a tick is still running.
     * @return number of bounties committed Completed or Expired
     */
    outcome::result<size_t> runOnce();

    /// Current consensus of a bounty, nothing is changed
    outcome::result<primitives::ConsensusResult> recalculate(
        const primitives::BountyId &bounty_id) const;

   private:
    /// @return true if the bounty was committed by this worker
    outcome::result<bool> processBounty(const primitives::Bounty &bounty);

    void resumeUnsettled();

    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<clock::Ticker> ticker_;
    std::shared_ptr<storage::BountyRepository> bounties_;
    std::shared_ptr<BountyResolver> resolver_;
    std::shared_ptr<ThreadPool> bounty_pool_;
    std::shared_ptr<metrics::Registry> metrics_registry_;
    metrics::Counter *metric_resolved_;
    metrics::Counter *metric_expired_;
    metrics::Counter *metric_failures_;
    metrics::Gauge *metric_open_;
    std::atomic_bool in_flight_ = false;
    log::Logger logger_;
  };

}  // namespace nexus::bounty
