/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "notification/impl/event_publisher_impl.hpp"

#include <boost/asio/post.hpp>

namespace nexus::notification {

  EventPublisherImpl::EventPublisherImpl(
      EventEnginePtr engine,
      std::shared_ptr<boost::asio::io_context> io_context)
      : engine_{std::move(engine)},
        io_context_{std::move(io_context)},
        logger_{log::createLogger("EventPublisher", "notification")} {
    BOOST_ASSERT(engine_);
    BOOST_ASSERT(io_context_);
  }

  void EventPublisherImpl::publish(Event event) {
    auto type = eventType(event);
    SL_TRACE(logger_, "Publishing {} event", type);
    boost::asio::post(
        *io_context_,
        [engine{engine_}, type, event{std::move(event)}] {
          engine->notify(type, event);
        });
  }

}  // namespace nexus::notification
