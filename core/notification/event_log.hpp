/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "notification/event_engine.hpp"

namespace nexus::notification {

  /**
   * Writes every published event to the "notification" log group. Stands in
   * for webhook and e-mail delivery, which live outside the node.
   */
  EventSubscriberPtr subscribeEventLog(const EventEnginePtr &engine);

}  // namespace nexus::notification
