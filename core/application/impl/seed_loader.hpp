/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>

#include <rapidjson/document.h>

#include "consensus/consensus_config.hpp"
#include "log/logger.hpp"
#include "storage/bounty_repository.hpp"

namespace nexus::application {

  /**
   * Loads bounties and submissions from a JSON document into the bounty
   * repository. Every submission is validated the way ingestion does it:
   * known verdict, confidence within [0, 1] and a positive stake.
   *
   * Times are unix milliseconds, amounts and fractions are strings:
   * @code
   * {
   *   "bounties": [{"id": "b1", "creator": "alice", "reward": "1000",
   *                 "min-stake": "10", "min-submissions": 3,
   *                 "threshold": "0.66", "created-at": 1700000000000,
   *                 "deadline": 1700086400000}],
   *   "submissions": [{"id": "s1", "bounty": "b1", "engine": "e1",
   *                    "verdict": "malicious", "confidence": "0.9",
   *                    "stake": "100", "submitted-at": 1700000100000}]
   * }
   * @endcode
   */
  class SeedLoader {
   public:
    SeedLoader(std::shared_ptr<storage::BountyRepository> bounties,
               consensus::ConsensusConfig defaults);

    /// @return number of bounties and submissions stored
    outcome::result<std::pair<size_t, size_t>> loadFile(
        const std::filesystem::path &path);

    outcome::result<std::pair<size_t, size_t>> load(
        const rapidjson::Document &document);

   private:
    outcome::result<primitives::Bounty> parseBounty(
        const rapidjson::Value &val) const;

    outcome::result<primitives::Submission> parseSubmission(
        const rapidjson::Value &val) const;

    std::shared_ptr<storage::BountyRepository> bounties_;
    consensus::ConsensusConfig defaults_;
    log::Logger logger_;
  };

}  // namespace nexus::application
