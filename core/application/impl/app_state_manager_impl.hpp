/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

#include "log/logger.hpp"

namespace nexus::application {

  /**
   * Runs stage callbacks in registration order. SIGINT and SIGTERM request
   * shutdown of the instance that is currently running.
   */
  class AppStateManagerImpl
      : public AppStateManager,
        public std::enable_shared_from_this<AppStateManagerImpl> {
   public:
    AppStateManagerImpl();
    AppStateManagerImpl(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl(AppStateManagerImpl &&) = delete;

    ~AppStateManagerImpl() override;

    AppStateManagerImpl &operator=(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl &operator=(AppStateManagerImpl &&) = delete;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override {
      return state_;
    }

    outcome::result<void> failure() const override;

   protected:
    void reset();

    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    static std::weak_ptr<AppStateManagerImpl> running_;

    static std::atomic_bool signals_enabled;
    static void signalsEnable();
    static void signalsDisable();
    static void onTerminationSignal(int);

    /// Moves from \param from to \param to, tolerating a pending shutdown
    void enterStage(State from, State to, const char *stage);

    /// Runs \param steps while the state is still \param stage_state
    void runSteps(std::deque<OnPrepare> &steps,
                  State stage_state,
                  const char *stage);

    void waitShutdownRequest();

    log::Logger logger_;

    std::atomic<State> state_ = State::Init;
    std::optional<std::error_code> failure_;

    mutable std::recursive_mutex mutex_;

    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::deque<OnPrepare> prepare_;
    std::deque<OnLaunch> launch_;
    std::deque<OnShutdown> shutdown_;
  };

}  // namespace nexus::application
