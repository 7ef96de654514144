/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/ticker_impl.hpp"

#include <boost/asio/post.hpp>

namespace nexus::clock {
  TickerImpl::TickerImpl(std::shared_ptr<boost::asio::io_context> io_context,
                         SystemClock::Duration interval)
      : io_context_{std::move(io_context)},
        timer_{*io_context_},
        interval_{interval} {}

  void TickerImpl::start(SystemClock::Duration delay) {
    if (callback_ and not started_.exchange(true)) {
      schedule(delay);
    }
  }

  void TickerImpl::stop() {
    started_ = false;
    // the timer belongs to the io_context strand of execution
    boost::asio::post(*io_context_, [weak{weak_from_this()}] {
      if (auto self = weak.lock()) {
        self->timer_.cancel();
      }
    });
  }

  bool TickerImpl::isStarted() const {
    return started_;
  }

  void TickerImpl::asyncCallRepeatedly(std::function<void()> h) {
    if (not started_) {
      callback_ = std::move(h);
    }
  }

  void TickerImpl::schedule(SystemClock::Duration delay) {
    timer_.expires_after(delay);
    timer_.async_wait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (auto self = weak.lock()) {
            self->onTick(ec);
          }
        });
  }

  void TickerImpl::onTick(const boost::system::error_code &ec) {
    if (ec or not started_) {
      return;
    }
    callback_();
    if (started_) {
      schedule(interval_);
    }
  }
}  // namespace nexus::clock
