/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "notification/events.hpp"

namespace nexus::notification {

  /**
   * Outbound notifications. Delivery is fire-and-forget: publishing never
   * blocks and never fails the caller.
   */
  class EventPublisher {
   public:
    virtual ~EventPublisher() = default;

    virtual void publish(Event event) = 0;
  };

}  // namespace nexus::notification
