/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "reputation/decay_processor.hpp"

#include <algorithm>

namespace nexus::reputation {

  namespace {
    constexpr std::chrono::hours kDay{24};
  }

  DecayProcessor::DecayProcessor(
      application::AppStateManager &app_state_manager,
      std::shared_ptr<clock::SystemClock> clock,
      std::shared_ptr<clock::Ticker> ticker,
      std::shared_ptr<storage::ReputationRepository> repository,
      std::shared_ptr<ReputationUpdater> updater,
      ReputationScorer scorer)
      : clock_{std::move(clock)},
        ticker_{std::move(ticker)},
        repository_{std::move(repository)},
        updater_{std::move(updater)},
        scorer_{std::move(scorer)},
        logger_{log::createLogger("DecayProcessor", "reputation")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(ticker_);
    BOOST_ASSERT(repository_);
    BOOST_ASSERT(updater_);
    app_state_manager.takeControl(*this);
  }

  outcome::result<void> DecayProcessor::start() {
    ticker_->asyncCallRepeatedly([weak{weak_from_this()}] {
      if (auto self = weak.lock()) {
        if (auto res = self->runOnce(); res.has_error()) {
          SL_ERROR(self->logger_, "Reputation decay failed: {}", res.error());
        }
      }
    });
    ticker_->start(std::chrono::seconds{0});
    SL_INFO(logger_, "Reputation decay started");
    return outcome::success();
  }

  void DecayProcessor::stop() {
    ticker_->stop();
  }

  outcome::result<size_t> DecayProcessor::runOnce() {
    auto now = clock_->now();
    OUTCOME_TRY(records, repository_->getRecords());

    size_t decayed = 0;
    for (auto &record : records) {
      auto since = std::max(record.last_active, record.last_decay);
      if (since == primitives::Timestamp{} or now <= since) {
        continue;
      }
      auto days = (now - since) / kDay;
      if (days <= 0) {
        continue;
      }

      auto score = scorer_.applyDecay(record.score, Decimal(days));
      auto key = fmt::format("decay:{}:{}",
                             record.engine_id,
                             now.time_since_epoch() / kDay);
      // the unconsumed part of a day counts toward the next decay
      auto decayed_until = since + days * kDay;
      OUTCOME_TRY(applied,
                  repository_->applyDelta(
                      key,
                      record.engine_id,
                      {
                          .delta = score - record.score,
                          .at = std::chrono::time_point_cast<
                              primitives::Timestamp::duration>(decayed_until),
                          .decay = true,
                      }));
      if (applied) {
        ++decayed;
        SL_DEBUG(logger_,
                 "Engine {} inactive for {} days, reputation {} -> {}",
                 record.engine_id,
                 days,
                 record.score,
                 score);
      }
    }

    if (decayed > 0) {
      OUTCOME_TRY(updater_->refreshRanking());
      SL_VERBOSE(logger_, "Decayed reputation of {} engines", decayed);
    }
    return decayed;
  }

}  // namespace nexus::reputation
