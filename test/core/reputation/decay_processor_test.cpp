/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "application/impl/app_state_manager_impl.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/clock/ticker_mock.hpp"
#include "reputation/decay_processor.hpp"
#include "reputation/impl/reputation_updater_impl.hpp"
#include "storage/in_memory/in_memory_reputation_repository.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/fixtures.hpp"

using nexus::application::AppStateManagerImpl;
using nexus::clock::SystemClockMock;
using nexus::clock::TickerMock;
using nexus::primitives::Decimal;
using nexus::primitives::Timestamp;
using nexus::reputation::DecayProcessor;
using nexus::reputation::ReputationConfig;
using nexus::reputation::ReputationScorer;
using nexus::reputation::ReputationUpdaterImpl;
using nexus::storage::InMemoryReputationRepository;
using nexus::storage::ReputationDelta;
using testutil::kT0;

using testing::_;
using testing::ReturnPointee;
using testing::SaveArg;

using namespace std::chrono_literals;

class DecayProcessorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*clock, now()).WillByDefault(ReturnPointee(&now));

    auto updater = std::make_shared<ReputationUpdaterImpl>(
        repository, clock, ReputationScorer{config}, Decimal{"0.2"});
    processor = std::make_shared<DecayProcessor>(*app_state_manager,
                                                 clock,
                                                 ticker,
                                                 repository,
                                                 updater,
                                                 ReputationScorer{config});

    // active engine with the base score of 1000
    ASSERT_OUTCOME_SUCCESS(
        applied,
        repository->applyDelta("seen", "engine", ReputationDelta{.at = kT0}));
    ASSERT_TRUE(applied);
  }

  ReputationConfig config;
  Timestamp now = kT0;
  std::shared_ptr<AppStateManagerImpl> app_state_manager =
      std::make_shared<AppStateManagerImpl>();
  std::shared_ptr<testing::NiceMock<SystemClockMock>> clock =
      std::make_shared<testing::NiceMock<SystemClockMock>>();
  std::shared_ptr<TickerMock> ticker = std::make_shared<TickerMock>();
  std::shared_ptr<InMemoryReputationRepository> repository =
      std::make_shared<InMemoryReputationRepository>(1000, 0, 10000);
  std::shared_ptr<DecayProcessor> processor;
};

/**
 * @given an engine inactive for ten and a half days
 * @when decay runs
 * @then the score loses 1% and the unconsumed half day is kept for later
 */
TEST_F(DecayProcessorTest, DecaysWholeDays) {
  now = kT0 + 24h * 10 + 12h;
  EXPECT_OUTCOME_TRUE(decayed, processor->runOnce());
  EXPECT_EQ(decayed, 1);

  EXPECT_OUTCOME_TRUE(record, repository->getRecord("engine"));
  EXPECT_EQ(record.score, 990);
  EXPECT_EQ(record.last_decay, kT0 + 24h * 10);
  EXPECT_EQ(record.last_active, kT0);
  EXPECT_EQ(record.rank, 1);

  // the same day again decays nothing
  EXPECT_OUTCOME_TRUE(repeated, processor->runOnce());
  EXPECT_EQ(repeated, 0);

  now = kT0 + 24h * 11 + 1h;
  EXPECT_OUTCOME_TRUE(next_day, processor->runOnce());
  EXPECT_EQ(next_day, 1);
  EXPECT_OUTCOME_TRUE(later, repository->getRecord("engine"));
  EXPECT_EQ(later.score, 989);
}

/**
 * @given an engine active less than a day ago
 * @when decay runs
 * @then its score is kept
 */
TEST_F(DecayProcessorTest, RecentActivityKept) {
  now = kT0 + 23h;
  EXPECT_OUTCOME_TRUE(decayed, processor->runOnce());
  EXPECT_EQ(decayed, 0);
  EXPECT_OUTCOME_TRUE(record, repository->getRecord("engine"));
  EXPECT_EQ(record.score, 1000);
}

/**
 * @given a decay processor under control of the application state manager
 * @when the application launches and the ticker fires
 * @then the ticker is started at once and each tick runs a decay pass
 */
TEST_F(DecayProcessorTest, StartsTicker) {
  std::function<void()> tick;
  EXPECT_CALL(*ticker, asyncCallRepeatedly(_)).WillOnce(SaveArg<0>(&tick));
  EXPECT_CALL(*ticker, start(nexus::clock::SystemClock::Duration{0}));
  EXPECT_OUTCOME_TRUE_1(processor->start());

  now = kT0 + 24h * 10;
  ASSERT_TRUE(tick);
  tick();
  EXPECT_OUTCOME_TRUE(record, repository->getRecord("engine"));
  EXPECT_EQ(record.score, 990);

  EXPECT_CALL(*ticker, stop());
  processor->stop();
}
