/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/nexus_application_impl.hpp"

#include <cstdlib>

#include <unistd.h>

#include "application/impl/app_state_manager_impl.hpp"
#include "application/impl/seed_loader.hpp"
#include "bounty/consensus_worker.hpp"
#include "bounty/impl/bounty_resolver_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "clock/impl/ticker_impl.hpp"
#include "consensus/impl/consensus_aggregator_impl.hpp"
#include "dispute/impl/dispute_resolver_impl.hpp"
#include "notification/event_log.hpp"
#include "notification/impl/event_publisher_impl.hpp"
#include "reputation/decay_processor.hpp"
#include "reputation/impl/reputation_updater_impl.hpp"
#include "settlement/impl/ledger_payment_gateway.hpp"
#include "settlement/payout_processor.hpp"
#include "storage/in_memory/in_memory_bounty_repository.hpp"
#include "storage/in_memory/in_memory_dispute_repository.hpp"
#include "storage/in_memory/in_memory_payout_repository.hpp"
#include "storage/in_memory/in_memory_reputation_repository.hpp"
#include "utils/thread_pool.hpp"

namespace nexus::application {

  namespace {
    /// consensus, payout and decay tickers
    constexpr size_t kWorkerThreads = 3;
  }  // namespace

  NexusApplicationImpl::NexusApplicationImpl(
      std::shared_ptr<AppConfiguration> app_config)
      : app_config_{std::move(app_config)},
        logger_{log::createLogger("Application", "application")} {
    BOOST_ASSERT(app_config_);
    auto &consensus_config = app_config_->consensusConfig();
    auto &reputation_config = app_config_->reputationConfig();
    auto &settlement_config = app_config_->settlementConfig();
    auto &worker_config = app_config_->workerConfig();

    app_state_manager_ = std::make_shared<AppStateManagerImpl>();
    metrics_registry_ = metrics::createRegistry();
    auto system_clock = std::make_shared<clock::SystemClockImpl>();

    bounty_pool_ =
        std::make_shared<ThreadPool>("bounties", worker_config.threads);
    event_pool_ = std::make_shared<ThreadPool>("events", 1);
    worker_pool_ = std::make_shared<ThreadPool>("workers", kWorkerThreads);

    bounties_ = std::make_shared<storage::InMemoryBountyRepository>();
    payouts_ = std::make_shared<storage::InMemoryPayoutRepository>();
    disputes_ = std::make_shared<storage::InMemoryDisputeRepository>();
    reputations_ = std::make_shared<storage::InMemoryReputationRepository>(
        reputation_config.base_score,
        reputation_config.min_score,
        reputation_config.max_score);

    event_engine_ = std::make_shared<notification::EventEngine>();
    event_log_ = notification::subscribeEventLog(event_engine_);
    auto publisher = std::make_shared<notification::EventPublisherImpl>(
        event_engine_, event_pool_->io_context());

    auto aggregator =
        std::make_shared<consensus::ConsensusAggregatorImpl>(consensus_config);
    auto planner =
        std::make_shared<settlement::SettlementPlanner>(settlement_config);
    reputation::ReputationScorer scorer{reputation_config};
    auto reputation_updater =
        std::make_shared<reputation::ReputationUpdaterImpl>(
            reputations_, system_clock, scorer, consensus_config.early_window);
    gateway_ = std::make_shared<settlement::LedgerPaymentGateway>();

    bounty_resolver_ =
        std::make_shared<bounty::BountyResolverImpl>(bounties_,
                                                     payouts_,
                                                     reputations_,
                                                     aggregator,
                                                     planner,
                                                     reputation_updater,
                                                     publisher,
                                                     system_clock);
    dispute_resolver_ =
        std::make_shared<dispute::DisputeResolverImpl>(disputes_,
                                                       bounties_,
                                                       payouts_,
                                                       bounty_resolver_,
                                                       aggregator,
                                                       planner,
                                                       publisher,
                                                       system_clock,
                                                       metrics_registry_);

    auto &io = worker_pool_->io_context();
    consensus_worker_ = std::make_shared<bounty::ConsensusWorker>(
        *app_state_manager_,
        system_clock,
        std::make_shared<clock::TickerImpl>(io,
                                            worker_config.consensus_interval),
        bounties_,
        bounty_resolver_,
        bounty_pool_,
        metrics_registry_);
    payout_processor_ = std::make_shared<settlement::PayoutProcessor>(
        *app_state_manager_,
        system_clock,
        std::make_shared<clock::TickerImpl>(io, worker_config.payout_interval),
        payouts_,
        gateway_,
        publisher,
        metrics_registry_,
        settlement_config);
    decay_processor_ = std::make_shared<reputation::DecayProcessor>(
        *app_state_manager_,
        system_clock,
        std::make_shared<clock::TickerImpl>(io, worker_config.decay_interval),
        reputations_,
        reputation_updater,
        scorer);
  }

  NexusApplicationImpl::~NexusApplicationImpl() = default;

  int NexusApplicationImpl::run() {
    if (auto &seed = app_config_->seedPath()) {
      SeedLoader loader{bounties_, app_config_->consensusConfig()};
      auto res = loader.loadFile(*seed);
      if (res.has_error()) {
        SL_CRITICAL(logger_,
                    "Can't load seed file {}: {}",
                    seed->string(),
                    res.error());
        return EXIT_FAILURE;
      }
    }

    app_state_manager_->atShutdown([this] {
      SL_INFO(logger_, "Final metrics:\n{}", metrics_registry_->serialize());
    });

    auto &worker_config = app_config_->workerConfig();
    SL_INFO(logger_,
            "Start as nexus node with PID {}: consensus every {}s, payouts "
            "every {}s, decay every {}s, {} bounty threads",
            getpid(),
            worker_config.consensus_interval.count(),
            worker_config.payout_interval.count(),
            worker_config.decay_interval.count(),
            worker_config.threads);

    app_state_manager_->run();
    if (auto res = app_state_manager_->failure(); res.has_error()) {
      SL_CRITICAL(logger_, "Node stopped after failure: {}", res.error());
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

}  // namespace nexus::application
