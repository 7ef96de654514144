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
#include "reputation/reputation_scorer.hpp"
#include "reputation/reputation_updater.hpp"
#include "storage/reputation_repository.hpp"

namespace nexus::reputation {

  /**
   * Periodically decays the reputation of inactive engines. An engine loses
   * `decay-rate` of its score for every whole day since its last activity
   * or its last decay, whichever is later.
   */
  class DecayProcessor : public std::enable_shared_from_this<DecayProcessor> {
   public:
    DecayProcessor(application::AppStateManager &app_state_manager,
                   std::shared_ptr<clock::SystemClock> clock,
                   std::shared_ptr<clock::Ticker> ticker,
                   std::shared_ptr<storage::ReputationRepository> repository,
                   std::shared_ptr<ReputationUpdater> updater,
                   ReputationScorer scorer);

    outcome::result<void> start();

    void stop();

    /// @return number of engines whose score was decayed
    outcome::result<size_t> runOnce();

   private:
    std::shared_ptr<clock::SystemClock> clock_;
    std::shared_ptr<clock::Ticker> ticker_;
    std::shared_ptr<storage::ReputationRepository> repository_;
    std::shared_ptr<ReputationUpdater> updater_;
    ReputationScorer scorer_;
    log::Logger logger_;
  };

}  // namespace nexus::reputation
