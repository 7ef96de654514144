/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <system_error>

#include "clock/clock.hpp"

namespace nexus::clock {
  /**
   * Interface for asynchronous ticker
   */
  struct Ticker {
    virtual ~Ticker() = default;

    /**
     * start ticker after delay
     */
    virtual void start(SystemClock::Duration delay) = 0;

    /**
     * cancel ticker, no callback is invoked afterwards
     */
    virtual void stop() = 0;

    virtual bool isStarted() const = 0;

    /**
     * Set the callback called every interval.
     * Start ticker only after setting callback here!
     */
    virtual void asyncCallRepeatedly(std::function<void()> h) = 0;
  };
}  // namespace nexus::clock
