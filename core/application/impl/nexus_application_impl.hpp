/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/nexus_application.hpp"

#include <memory>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"
#include "metrics/metrics.hpp"
#include "notification/event_engine.hpp"

namespace nexus {
  class ThreadPool;
}

namespace nexus::clock {
  struct Ticker;
}

namespace nexus::storage {
  class BountyRepository;
  class PayoutRepository;
  class DisputeRepository;
  class ReputationRepository;
}  // namespace nexus::storage

namespace nexus::bounty {
  class ConsensusWorker;
  class BountyResolver;
}  // namespace nexus::bounty

namespace nexus::dispute {
  class DisputeResolver;
}

namespace nexus::reputation {
  class DecayProcessor;
}

namespace nexus::settlement {
  class PayoutProcessor;
  class LedgerPaymentGateway;
}  // namespace nexus::settlement

namespace nexus::application {

  class AppStateManagerImpl;

  /**
   * Wires the node: in-memory repositories, the consensus, reputation and
   * settlement components and the three workers, each worker on its own
   * ticker. Components are built in dependency order and passed to their
   * users by constructor.
   */
  class NexusApplicationImpl final : public NexusApplication {
   public:
    explicit NexusApplicationImpl(
        std::shared_ptr<AppConfiguration> app_config);
    ~NexusApplicationImpl() override;

    int run() override;

    const std::shared_ptr<dispute::DisputeResolver> &disputeResolver() const {
      return dispute_resolver_;
    }

   private:
    std::shared_ptr<AppConfiguration> app_config_;
    log::Logger logger_;

    std::shared_ptr<AppStateManagerImpl> app_state_manager_;
    std::shared_ptr<metrics::Registry> metrics_registry_;

    // the bounty pool outlives the worker pool: a running tick waits for it
    std::shared_ptr<ThreadPool> bounty_pool_;
    std::shared_ptr<ThreadPool> event_pool_;
    std::shared_ptr<ThreadPool> worker_pool_;

    std::shared_ptr<storage::BountyRepository> bounties_;
    std::shared_ptr<storage::PayoutRepository> payouts_;
    std::shared_ptr<storage::DisputeRepository> disputes_;
    std::shared_ptr<storage::ReputationRepository> reputations_;

    notification::EventEnginePtr event_engine_;
    notification::EventSubscriberPtr event_log_;

    std::shared_ptr<settlement::LedgerPaymentGateway> gateway_;
    std::shared_ptr<bounty::BountyResolver> bounty_resolver_;
    std::shared_ptr<dispute::DisputeResolver> dispute_resolver_;

    std::shared_ptr<bounty::ConsensusWorker> consensus_worker_;
    std::shared_ptr<settlement::PayoutProcessor> payout_processor_;
    std::shared_ptr<reputation::DecayProcessor> decay_processor_;
  };

}  // namespace nexus::application
