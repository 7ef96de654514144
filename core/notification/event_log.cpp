/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "notification/event_log.hpp"

#include "common/visitor.hpp"

namespace nexus::notification {

  EventSubscriberPtr subscribeEventLog(const EventEnginePtr &engine) {
    return subscribe(
        engine,
        {EventType::BountyCompleted,
         EventType::BountyExpired,
         EventType::DisputeResolved,
         EventType::PayoutFailed},
        [log{log::createLogger("EventLog", "notification")}](
            const Event &event) {
          visit_in_place(
              event,
              [&](const BountyCompleted &e) {
                SL_INFO(log,
                        "Bounty {} completed in round {}: {} with confidence "
                        "{} from {} submissions",
                        e.bounty_id,
                        e.round,
                        e.verdict,
                        e.confidence,
                        e.participants.size());
              },
              [&](const BountyExpired &e) {
                SL_INFO(log,
                        "Bounty {} expired with {} submissions",
                        e.bounty_id,
                        e.participants.size());
              },
              [&](const DisputeResolved &e) {
                if (e.verdict) {
                  SL_INFO(log,
                          "Dispute {} on bounty {} {}, verdict is now {}",
                          e.dispute_id,
                          e.bounty_id,
                          e.resolution,
                          *e.verdict);
                } else {
                  SL_INFO(log,
                          "Dispute {} on bounty {} {}",
                          e.dispute_id,
                          e.bounty_id,
                          e.resolution);
                }
              },
              [&](const PayoutFailed &e) {
                SL_WARN(log,
                        "Payout {} of bounty {} failed: {}",
                        e.payout_id,
                        e.bounty_id,
                        e.reason);
              });
        });
  }

}  // namespace nexus::notification
