/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_state_manager_impl.hpp"

#include <csignal>
#include <cstring>

namespace nexus::application {
  std::atomic_bool AppStateManagerImpl::signals_enabled{false};
  std::weak_ptr<AppStateManagerImpl> AppStateManagerImpl::running_;

  void AppStateManagerImpl::signalsEnable() {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = onTerminationSignal;
    sigemptyset(&act.sa_mask);
    sigaddset(&act.sa_mask, SIGINT);
    sigaddset(&act.sa_mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &act.sa_mask, nullptr);
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
    signals_enabled.store(true);
    sigprocmask(SIG_UNBLOCK, &act.sa_mask, nullptr);
  }

  void AppStateManagerImpl::signalsDisable() {
    auto expected = true;
    if (not signals_enabled.compare_exchange_strong(expected, false)) {
      return;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = SIG_DFL;
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
  }

  void AppStateManagerImpl::onTerminationSignal(int signal) {
    signalsDisable();
    if (auto self = running_.lock()) {
      SL_TRACE(self->logger_, "Termination signal {} received", signal);
      self->shutdown();
    }
  }

  AppStateManagerImpl::AppStateManagerImpl()
      : logger_(log::createLogger("AppStateManager", "application")) {
    signalsEnable();
  }

  AppStateManagerImpl::~AppStateManagerImpl() {
    signalsDisable();
    running_.reset();
  }

  void AppStateManagerImpl::reset() {
    std::lock_guard lg(mutex_);
    prepare_.clear();
    launch_.clear();
    shutdown_.clear();
    failure_.reset();
    state_ = State::Init;
  }

  void AppStateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Prepare) {
      throw AppStateException("registering a prepare step");
    }
    prepare_.emplace_back(std::move(cb));
  }

  void AppStateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Starting) {
      throw AppStateException("registering a launch step");
    }
    launch_.emplace_back(std::move(cb));
  }

  void AppStateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::ShuttingDown) {
      throw AppStateException("registering a shutdown step");
    }
    shutdown_.emplace_back(std::move(cb));
  }

  outcome::result<void> AppStateManagerImpl::failure() const {
    std::lock_guard lg(mutex_);
    if (failure_) {
      return *failure_;
    }
    return outcome::success();
  }

  void AppStateManagerImpl::enterStage(State from,
                                       State to,
                                       const char *stage) {
    auto state = from;
    if (not state_.compare_exchange_strong(state, to)
        and state != State::ShuttingDown) {
      throw AppStateException(stage);
    }
  }

  void AppStateManagerImpl::runSteps(std::deque<OnPrepare> &steps,
                                     State stage_state,
                                     const char *stage) {
    // once a step fails the rest are dropped, shutdown follows
    while (not steps.empty()) {
      auto step = std::move(steps.front());
      steps.pop_front();
      if (state_ != stage_state) {
        continue;
      }
      if (auto res = step(); res.has_error()) {
        SL_ERROR(logger_, "Stage '{}' failed: {}", stage, res.error());
        failure_ = res.error();
        auto state = stage_state;
        state_.compare_exchange_strong(state, State::ShuttingDown);
      }
    }
  }

  void AppStateManagerImpl::doPrepare() {
    std::lock_guard lg(mutex_);
    enterStage(State::Init, State::Prepare, "prepare");
    runSteps(prepare_, State::Prepare, "prepare");
    auto state = State::Prepare;
    state_.compare_exchange_strong(state, State::ReadyToStart);
  }

  void AppStateManagerImpl::doLaunch() {
    std::lock_guard lg(mutex_);
    enterStage(State::ReadyToStart, State::Starting, "launch");
    runSteps(launch_, State::Starting, "launch");
    auto state = State::Starting;
    state_.compare_exchange_strong(state, State::Works);
  }

  void AppStateManagerImpl::doShutdown() {
    std::lock_guard lg(mutex_);
    enterStage(State::Works, State::ShuttingDown, "shutdown");

    prepare_.clear();
    launch_.clear();

    while (not shutdown_.empty()) {
      auto step = std::move(shutdown_.front());
      shutdown_.pop_front();
      step();
    }

    auto state = State::ShuttingDown;
    state_.compare_exchange_strong(state, State::ReadyToStop);
  }

  void AppStateManagerImpl::run() {
    running_ = weak_from_this();
    if (running_.expired()) {
      throw std::logic_error(
          "AppStateManager must be owned by a shared pointer to run");
    }

    doPrepare();
    doLaunch();

    if (state_.load() == State::Works) {
      SL_DEBUG(logger_, "Services started, waiting for termination");
      waitShutdownRequest();
    }

    SL_DEBUG(logger_, "Stopping services");
    doShutdown();
    SL_DEBUG(logger_, "Services stopped");
  }

  void AppStateManagerImpl::waitShutdownRequest() {
    std::unique_lock lock(cv_mutex_);
    cv_.wait(lock, [&] { return state_ == State::ShuttingDown; });
  }

  void AppStateManagerImpl::shutdown() {
    signalsDisable();
    auto state = state_.load();
    if (state == State::ReadyToStop or state == State::ShuttingDown) {
      SL_TRACE(logger_, "Shutdown already in progress");
      return;
    }

    SL_TRACE(logger_, "Shutdown requested");
    std::lock_guard lg(cv_mutex_);
    state_.store(State::ShuttingDown);
    cv_.notify_one();
  }
}  // namespace nexus::application
