/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "notification/event_publisher.hpp"

#include <gmock/gmock.h>

namespace nexus::notification {

  class EventPublisherMock : public EventPublisher {
   public:
    MOCK_METHOD(void, publish, (Event), (override));
  };

}  // namespace nexus::notification
