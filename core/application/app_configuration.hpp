/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "consensus/consensus_config.hpp"
#include "reputation/reputation_config.hpp"
#include "settlement/settlement_config.hpp"

namespace nexus::application {

  /// Intervals and parallelism of the background workers
  struct WorkerConfig {
    std::chrono::seconds consensus_interval{60};
    std::chrono::seconds payout_interval{30};
    std::chrono::seconds decay_interval{3600};
    /// Bounties processed concurrently by one consensus tick
    uint32_t threads = 2;
  };

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    virtual const consensus::ConsensusConfig &consensusConfig() const = 0;

    virtual const reputation::ReputationConfig &reputationConfig() const = 0;

    virtual const settlement::SettlementConfig &settlementConfig() const = 0;

    virtual const WorkerConfig &workerConfig() const = 0;

    /**
     * @return logging filters given with -l, e.g. {"debug", "bounty=trace"}
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return JSON file with bounties and submissions loaded at startup
     */
    virtual const std::optional<std::filesystem::path> &seedPath() const = 0;
  };

}  // namespace nexus::application
