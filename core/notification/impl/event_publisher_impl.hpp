/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "notification/event_publisher.hpp"

#include <boost/asio/io_context.hpp>

#include "log/logger.hpp"
#include "notification/event_engine.hpp"

namespace nexus::notification {

  /// Delivers events to the engine subscribers on the given io_context
  class EventPublisherImpl final : public EventPublisher {
   public:
    EventPublisherImpl(EventEnginePtr engine,
                       std::shared_ptr<boost::asio::io_context> io_context);

    void publish(Event event) override;

   private:
    EventEnginePtr engine_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    log::Logger logger_;
  };

}  // namespace nexus::notification
