/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(nexus::log, Error, e) {
  using E = nexus::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::WRONG_TUNING:
      return "Log tuning must look like <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace nexus::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "nexus::log::setLoggingSystem() must be called before "
                       "any logger is created");
      return logging_system;
    }

    // short forms are accepted as in `-lwarn`
    constexpr std::array<std::pair<std::string_view, Level>, 13> kLevels{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevels) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(chunk));
        logging_system->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      std::string group{chunk.substr(0, eq)};
      if (group.empty() or eq + 1 == chunk.size()) {
        return Error::WRONG_TUNING;
      }
      if (not logging_system->getGroup(group)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(chunk.substr(eq + 1)));
      logging_system->setLevelOfGroup(group, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace nexus::log
