/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include "outcome/outcome.hpp"

namespace nexus::application {

  // A service is controllable when it has a method for at least one stage.
  // Return types are checked at registration, so a `start()` returning
  // something else is a compile error rather than a skipped stage.
  template <typename T>
  concept AppStatePreparable = requires(T &t) { t.prepare(); };
  template <typename T>
  concept AppStateStartable = requires(T &t) { t.start(); };
  template <typename T>
  concept AppStateStoppable = requires(T &t) { t.stop(); };

  template <typename T>
  concept AppStateControllable =
      AppStatePreparable<T> || AppStateStoppable<T> || AppStateStartable<T>;

  /**
   * Drives the life cycle of the long-running services of the node
   * (consensus worker, payout processor, reputation decay):
   * prepare (recover interrupted work), launch (start periodic ticks),
   * then wait for a termination request and stop everything.
   */
  class AppStateManager {
   public:
    using OnPrepare = std::function<outcome::result<void>()>;
    using OnLaunch = std::function<outcome::result<void>()>;
    using OnShutdown = std::function<void()>;

    enum class State {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~AppStateManager() = default;

    /// Recovery step run before any service starts
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /// Start step, run once every prepare step succeeded
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /// Stop step, always run on the way out
    virtual void atShutdown(OnShutdown &&cb) = 0;

    /**
     * @brief Registers the `prepare`, `start` and `stop` methods present on
     * \param service as handlers of the matching stages
     */
    template <AppStateControllable Service>
    void takeControl(Service &service) {
      if constexpr (AppStatePreparable<Service>) {
        atPrepare([&service]() -> outcome::result<void> {
          return service.prepare();
        });
      }
      if constexpr (AppStateStartable<Service>) {
        atLaunch(
            [&service]() -> outcome::result<void> { return service.start(); });
      }
      if constexpr (AppStateStoppable<Service>) {
        atShutdown([&service]() -> void { service.stop(); });
      }
    }

    /// Runs every stage; returns once shutdown is complete
    virtual void run() = 0;

    /// Requests shutdown, safe to call from any thread at any time
    virtual void shutdown() = 0;

    virtual State state() const = 0;

    /// Error of the first failed prepare or launch step, if any
    virtual outcome::result<void> failure() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;
  };

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(std::string stage)
        : std::runtime_error("Unexpected life cycle stage: " + std::move(stage)) {
    }
  };
}  // namespace nexus::application
