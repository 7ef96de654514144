/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <initializer_list>

#include "log/logger.hpp"
#include "notification/events.hpp"
#include "subscription/subscriber.hpp"
#include "subscription/subscription_engine.hpp"

namespace nexus::notification {

  using EventEngine = subscription::SubscriptionEngine<EventType, Event>;
  using EventEnginePtr = std::shared_ptr<EventEngine>;
  using EventSubscriber = subscription::Subscriber<EventType, Event>;
  using EventSubscriberPtr = std::shared_ptr<EventSubscriber>;

  /**
   * Subscribes `handler` to the given event types. The subscription lives as
   * long as the returned subscriber. Exceptions thrown by the handler are
   * logged and do not reach the publisher.
   */
  template <typename Handler>
  EventSubscriberPtr subscribe(const EventEnginePtr &engine,
                               std::initializer_list<EventType> types,
                               Handler &&handler) {
    auto subscriber = std::make_shared<EventSubscriber>(engine);
    subscriber->setCallback(
        [handler{std::forward<Handler>(handler)},
         log{log::createLogger("EventSubscriber", "notification")}](
            subscription::SubscriptionSetId,
            const EventType &type,
            const Event &event) {
          try {
            handler(event);
          } catch (const std::exception &e) {
            SL_WARN(log, "Handler of {} event failed: {}", type, e.what());
          }
        });
    auto set_id = subscriber->generateSubscriptionSetId();
    for (auto type : types) {
      subscriber->subscribe(set_id, type);
    }
    return subscriber;
  }

}  // namespace nexus::notification
