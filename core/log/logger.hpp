/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

// pre-include all formatters
#include "log/formatters/optional.hpp"

namespace nexus::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP, WRONG_TUNING };

  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides given as `<level>` (whole node) or
   * `<group>=<level>`. Stops at the first chunk that names an unknown group
   * or level.
   */
  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("nexus");

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace nexus::log

OUTCOME_HPP_DECLARE_ERROR(nexus::log, Error);
