/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/ticker.hpp"

#include <atomic>
#include <memory>

#include <boost/asio/basic_waitable_timer.hpp>
#include <boost/asio/io_context.hpp>

namespace nexus::clock {
  /**
   * Implementation of ticker over boost::asio::basic_waitable_timer.
   * Must be owned by a shared_ptr: pending waits keep only a weak reference.
   */
  class TickerImpl : public Ticker,
                     public std::enable_shared_from_this<TickerImpl> {
   public:
    TickerImpl(std::shared_ptr<boost::asio::io_context> io_context,
               SystemClock::Duration interval);

    void start(SystemClock::Duration delay) override;

    void stop() override;

    bool isStarted() const override;

    void asyncCallRepeatedly(std::function<void()> h) override;

   private:
    void schedule(SystemClock::Duration delay);
    void onTick(const boost::system::error_code &ec);

    std::atomic_bool started_{false};
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::basic_waitable_timer<std::chrono::system_clock> timer_;
    std::function<void()> callback_;
    SystemClock::Duration interval_;
  };
}  // namespace nexus::clock
