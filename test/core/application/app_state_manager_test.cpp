/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <csignal>
#include <thread>

#include "application/impl/app_state_manager_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using nexus::application::AppStateException;
using nexus::application::AppStateManager;
using nexus::application::AppStateManagerImpl;
using State = nexus::application::AppStateManager::State;

using testing::Return;
using testing::Sequence;

namespace {
  const outcome::result<void> kOk = outcome::success();
  const std::error_code kBroken = std::make_error_code(std::errc::io_error);
}  // namespace

class StepMock {
 public:
  MOCK_METHOD(outcome::result<void>, call, ());
  outcome::result<void> operator()() {
    return call();
  }
};

class StopMock {
 public:
  MOCK_METHOD(void, call, ());
  void operator()() {
    call();
  }
};

/// Stands for a worker: recovers at prepare, ticks after start
struct ServiceStub {
  ServiceStub(StepMock &p, StepMock &l, StopMock &s) : p(p), l(l), s(s) {}

  StepMock &p;
  StepMock &l;
  StopMock &s;
  int stage = 0;

  outcome::result<void> prepare() {
    stage = 1;
    return p();
  }

  outcome::result<void> start() {
    stage = 2;
    return l();
  }

  void stop() {
    stage = 3;
    s();
  }
};

class AppStateManagerTest : public AppStateManagerImpl, public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    reset();
  }

  StepMock prepare_step;
  StepMock launch_step;
  StopMock stop_step;
};

/**
 * @given fresh manager
 * @when stages run in order
 * @then the state follows them
 */
TEST_F(AppStateManagerTest, StagesInOrder) {
  ASSERT_EQ(state(), State::Init);
  ASSERT_NO_THROW(doPrepare());
  ASSERT_EQ(state(), State::ReadyToStart);
  ASSERT_NO_THROW(doLaunch());
  ASSERT_EQ(state(), State::Works);
  ASSERT_NO_THROW(doShutdown());
  ASSERT_EQ(state(), State::ReadyToStop);
  EXPECT_OUTCOME_TRUE_1(failure());
}

/**
 * @given manager that already ran prepare and launch
 * @when an earlier stage is run again
 * @then it throws, the state is kept and shutdown still works
 */
TEST_F(AppStateManagerTest, RepeatedStageThrows) {
  doPrepare();
  EXPECT_THROW(doPrepare(), AppStateException);
  EXPECT_EQ(state(), State::ReadyToStart);
  doLaunch();
  EXPECT_THROW(doLaunch(), AppStateException);
  EXPECT_EQ(state(), State::Works);
  EXPECT_NO_THROW(doShutdown());
  EXPECT_THROW(doShutdown(), AppStateException);
  EXPECT_EQ(state(), State::ReadyToStop);
}

/**
 * @given manager in each stage
 * @when steps are registered
 * @then only steps of stages that have not run yet are accepted
 */
TEST_F(AppStateManagerTest, RegistrationWindow) {
  EXPECT_NO_THROW(atPrepare([] { return kOk; }));
  doPrepare();
  EXPECT_THROW(atPrepare([] { return kOk; }), AppStateException);
  EXPECT_NO_THROW(atLaunch([] { return kOk; }));
  doLaunch();
  EXPECT_THROW(atLaunch([] { return kOk; }), AppStateException);
  EXPECT_NO_THROW(atShutdown([] {}));
  doShutdown();
  EXPECT_THROW(atShutdown([] {}), AppStateException);
}

/**
 * @given service taken under control
 * @when stages run
 * @then its prepare, start and stop are called at the matching stage
 */
TEST_F(AppStateManagerTest, TakeControl) {
  ServiceStub service(prepare_step, launch_step, stop_step);
  takeControl(service);

  EXPECT_CALL(prepare_step, call()).WillOnce(Return(kOk));
  EXPECT_CALL(launch_step, call()).WillOnce(Return(kOk));
  EXPECT_CALL(stop_step, call()).Times(1);

  doPrepare();
  EXPECT_EQ(service.stage, 1);
  doLaunch();
  EXPECT_EQ(service.stage, 2);
  doShutdown();
  EXPECT_EQ(service.stage, 3);
}

/**
 * @given two prepare steps, the first of which fails
 * @when stages run
 * @then the second step and every launch step are skipped, stop steps still
 * run and the failure is reported
 */
TEST_F(AppStateManagerTest, FailedPrepareSkipsLaunch) {
  StepMock second;
  atPrepare([this] { return prepare_step(); });
  atPrepare([&] { return second(); });
  atLaunch([this] { return launch_step(); });
  atShutdown([this] { stop_step(); });

  EXPECT_CALL(prepare_step, call()).WillOnce(Return(kBroken));
  EXPECT_CALL(second, call()).Times(0);
  EXPECT_CALL(launch_step, call()).Times(0);
  EXPECT_CALL(stop_step, call()).Times(1);

  doPrepare();
  EXPECT_EQ(state(), State::ShuttingDown);
  doLaunch();
  EXPECT_EQ(state(), State::ShuttingDown);
  doShutdown();
  EXPECT_EQ(state(), State::ReadyToStop);

  auto res = failure();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), kBroken);
}

/**
 * @given manager owned by a shared pointer with a controlled service
 * @when a termination signal arrives during launch
 * @then run returns after calling the steps in stage order
 */
TEST_F(AppStateManagerTest, RunUntilSignal) {
  EXPECT_THROW(run(), std::logic_error);

  auto manager = std::make_shared<AppStateManagerImpl>();
  ServiceStub service(prepare_step, launch_step, stop_step);
  manager->takeControl(service);

  Sequence seq;
  EXPECT_CALL(prepare_step, call()).InSequence(seq).WillOnce(Return(kOk));
  EXPECT_CALL(launch_step, call()).InSequence(seq).WillOnce(Return(kOk));
  EXPECT_CALL(stop_step, call()).InSequence(seq);

  manager->atLaunch([] {
    std::thread terminator([] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      raise(SIGTERM);
    });
    terminator.join();
    return kOk;
  });

  std::thread main([&] { EXPECT_NO_THROW(manager->run()); });
  main.join();
  EXPECT_EQ(manager->state(), State::ReadyToStop);
  EXPECT_OUTCOME_TRUE_1(manager->failure());
}
