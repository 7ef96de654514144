/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "application/impl/app_state_manager_impl.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/clock/ticker_mock.hpp"
#include "mock/core/notification/event_publisher_mock.hpp"
#include "mock/core/settlement/payment_gateway_mock.hpp"
#include "settlement/payout_processor.hpp"
#include "storage/in_memory/in_memory_payout_repository.hpp"
#include "testutil/metrics.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/fixtures.hpp"

using nexus::application::AppStateManagerImpl;
using nexus::clock::SystemClockMock;
using nexus::clock::TickerMock;
using nexus::notification::EventPublisherMock;
using nexus::notification::PayoutFailed;
using nexus::primitives::PayoutAction;
using nexus::primitives::PayoutStatus;
using nexus::primitives::PayoutType;
using nexus::primitives::Timestamp;
using nexus::settlement::PaymentError;
using nexus::settlement::PaymentGatewayMock;
using nexus::settlement::PayoutProcessor;
using nexus::settlement::SettlementConfig;
using nexus::settlement::TransactionHandle;
using nexus::storage::InMemoryPayoutRepository;
using testutil::kT0;

using testing::_;
using testing::Field;
using testing::InSequence;
using testing::Return;
using testing::ReturnPointee;
using testing::VariantWith;

using namespace std::chrono_literals;

class PayoutProcessorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*clock, now()).WillByDefault(ReturnPointee(&now));
    processor = std::make_shared<PayoutProcessor>(*app_state_manager,
                                                  clock,
                                                  ticker,
                                                  payouts,
                                                  gateway,
                                                  publisher,
                                                  registry,
                                                  config);
  }

  static PayoutAction action(std::string id) {
    return PayoutAction{
        .id = std::move(id),
        .bounty_id = "bounty",
        .recipient = "engine",
        .amount = 100,
        .type = PayoutType::BountyReward,
        .round = 1,
    };
  }

  SettlementConfig config{
      .max_attempts = 3,
      .backoff_base = 1000ms,
      .backoff_cap = 3000ms,
  };
  Timestamp now = kT0;
  std::shared_ptr<AppStateManagerImpl> app_state_manager =
      std::make_shared<AppStateManagerImpl>();
  std::shared_ptr<testing::NiceMock<SystemClockMock>> clock =
      std::make_shared<testing::NiceMock<SystemClockMock>>();
  std::shared_ptr<TickerMock> ticker = std::make_shared<TickerMock>();
  std::shared_ptr<InMemoryPayoutRepository> payouts =
      std::make_shared<InMemoryPayoutRepository>();
  std::shared_ptr<PaymentGatewayMock> gateway =
      std::make_shared<PaymentGatewayMock>();
  std::shared_ptr<EventPublisherMock> publisher =
      std::make_shared<EventPublisherMock>();
  std::shared_ptr<nexus::metrics::Registry> registry =
      nexus::metrics::createRegistry();
  std::shared_ptr<PayoutProcessor> processor;
};

/**
 * @given two pending payouts recorded at different times
 * @when the processor runs
 * @then both are executed oldest first and completed with their tx hashes
 */
TEST_F(PayoutProcessorTest, CompletesInCreationOrder) {
  ASSERT_OUTCOME_SUCCESS(late, payouts->recordPlan("late", {action("z")}, kT0));
  ASSERT_OUTCOME_SUCCESS(
      early, payouts->recordPlan("early", {action("y")}, kT0 - 1s));
  EXPECT_TRUE(late);
  EXPECT_TRUE(early);

  {
    InSequence s;
    EXPECT_CALL(*gateway, execute(Field(&PayoutAction::id, "y")))
        .WillOnce(Return(TransactionHandle{.tx_hash = "0x01"}));
    EXPECT_CALL(*gateway, execute(Field(&PayoutAction::id, "z")))
        .WillOnce(Return(TransactionHandle{.tx_hash = "0x02"}));
  }

  now = kT0 + 5s;
  EXPECT_OUTCOME_TRUE(completed, processor->runOnce());
  EXPECT_EQ(completed, 2);

  EXPECT_OUTCOME_TRUE(payout, payouts->getPayout("y"));
  EXPECT_EQ(payout.status, PayoutStatus::Completed);
  EXPECT_EQ(payout.transaction_hash, "0x01");
  EXPECT_EQ(payout.attempts, 1);
  EXPECT_EQ(payout.processed_at, kT0 + 5s);

  // nothing left to do
  EXPECT_OUTCOME_TRUE(again, processor->runOnce());
  EXPECT_EQ(again, 0);
}

/**
 * @given a payout whose transfer times out
 * @when the processor runs before and after the backoff elapsed
 * @then the payout waits for the backoff and is retried after it
 */
TEST_F(PayoutProcessorTest, RetriesWithBackoff) {
  ASSERT_OUTCOME_SUCCESS(recorded,
                         payouts->recordPlan("plan", {action("a")}, kT0));
  EXPECT_TRUE(recorded);

  EXPECT_CALL(*gateway, execute(_))
      .WillOnce(Return(outcome::failure(PaymentError::TIMEOUT)))
      .WillOnce(Return(TransactionHandle{.tx_hash = "0x01"}));

  EXPECT_OUTCOME_TRUE(first, processor->runOnce());
  EXPECT_EQ(first, 0);
  EXPECT_OUTCOME_TRUE(waiting, payouts->getPayout("a"));
  EXPECT_EQ(waiting.status, PayoutStatus::Pending);
  EXPECT_EQ(waiting.attempts, 1);
  EXPECT_EQ(waiting.next_attempt_at, kT0 + 1s);
  EXPECT_TRUE(waiting.last_error.has_value());

  now = kT0 + 999ms;
  EXPECT_OUTCOME_TRUE(too_early, processor->runOnce());
  EXPECT_EQ(too_early, 0);

  now = kT0 + 1s;
  EXPECT_OUTCOME_TRUE(retried, processor->runOnce());
  EXPECT_EQ(retried, 1);
  EXPECT_OUTCOME_TRUE(done, payouts->getPayout("a"));
  EXPECT_EQ(done.status, PayoutStatus::Completed);
  EXPECT_EQ(done.attempts, 2);
  EXPECT_FALSE(done.next_attempt_at.has_value());
  EXPECT_FALSE(done.last_error.has_value());
}

/**
 * @given a payout the gateway always rejects
 * @when it has been attempted the maximum number of times
 * @then it is marked failed, counted and reported
 */
TEST_F(PayoutProcessorTest, FailsAfterMaxAttempts) {
  ASSERT_OUTCOME_SUCCESS(recorded,
                         payouts->recordPlan("plan", {action("a")}, kT0));
  EXPECT_TRUE(recorded);

  EXPECT_CALL(*gateway, execute(_))
      .Times(3)
      .WillRepeatedly(Return(outcome::failure(PaymentError::REJECTED)));
  EXPECT_CALL(*publisher,
              publish(VariantWith<PayoutFailed>(
                  Field(&PayoutFailed::payout_id, "a"))));

  for (auto i = 0; i < 3; ++i) {
    EXPECT_OUTCOME_TRUE(completed, processor->runOnce());
    EXPECT_EQ(completed, 0);
    now += 1h;
  }

  EXPECT_OUTCOME_TRUE(payout, payouts->getPayout("a"));
  EXPECT_EQ(payout.status, PayoutStatus::Failed);
  EXPECT_EQ(payout.attempts, 3);
  EXPECT_DOUBLE_EQ(
      testutil::counterValue(*registry, "nexus_payouts_failed_total"), 1.0);

  // failed payouts are not picked up again
  EXPECT_OUTCOME_TRUE(after, processor->runOnce());
  EXPECT_EQ(after, 0);
}

/**
 * @given a payout left in Processing by an interrupted run
 * @when the processor prepares
 * @then the payout is back in the queue
 */
TEST_F(PayoutProcessorTest, PrepareRequeuesInterrupted) {
  ASSERT_OUTCOME_SUCCESS(recorded,
                         payouts->recordPlan("plan", {action("a")}, kT0));
  EXPECT_TRUE(recorded);
  ASSERT_OUTCOME_SUCCESS(
      claimed,
      payouts->compareAndSetStatus(
          "a", PayoutStatus::Pending, PayoutStatus::Processing));
  EXPECT_TRUE(claimed);

  EXPECT_OUTCOME_TRUE_1(processor->prepare());

  EXPECT_OUTCOME_TRUE(payout, payouts->getPayout("a"));
  EXPECT_EQ(payout.status, PayoutStatus::Pending);
}

/**
 * @given a base delay of one second capped at three
 * @when backoff is computed for growing attempt counts
 * @then it doubles until the cap
 */
TEST_F(PayoutProcessorTest, Backoff) {
  EXPECT_EQ(processor->backoff(1), 1000ms);
  EXPECT_EQ(processor->backoff(2), 2000ms);
  EXPECT_EQ(processor->backoff(3), 3000ms);
  EXPECT_EQ(processor->backoff(40), 3000ms);
}

/**
 * @given a payout processor under control of the application state manager
 * @when it starts and the ticker fires
 * @then pending payouts are processed
 */
TEST_F(PayoutProcessorTest, StartsTicker) {
  std::function<void()> tick;
  EXPECT_CALL(*ticker, asyncCallRepeatedly(_))
      .WillOnce(testing::SaveArg<0>(&tick));
  EXPECT_CALL(*ticker, start(nexus::clock::SystemClock::Duration{0}));
  EXPECT_OUTCOME_TRUE_1(processor->start());

  ASSERT_OUTCOME_SUCCESS(recorded,
                         payouts->recordPlan("plan", {action("a")}, kT0));
  EXPECT_TRUE(recorded);
  EXPECT_CALL(*gateway, execute(_))
      .WillOnce(Return(TransactionHandle{.tx_hash = "0x01"}));
  ASSERT_TRUE(tick);
  tick();

  EXPECT_OUTCOME_TRUE(payout, payouts->getPayout("a"));
  EXPECT_EQ(payout.status, PayoutStatus::Completed);

  EXPECT_CALL(*ticker, stop());
  processor->stop();
}
