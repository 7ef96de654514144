/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/nexus_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using nexus::application::AppConfigurationImpl;
using nexus::application::NexusApplicationImpl;

namespace {
  int run_node(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        nexus::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    if (auto res = nexus::log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      std::cerr << "Wrong --log value: " << res.error().message() << '\n';
      return EXIT_FAILURE;
    }

    auto logger =
        nexus::log::createLogger("Main", nexus::log::defaultGroupName);
    SL_INFO(logger, "Nexus node started");

    int exit_code = EXIT_FAILURE;
    {
      auto app = std::make_shared<NexusApplicationImpl>(configuration);
      exit_code = app->run();
    }

    SL_INFO(logger, "Nexus node stopped");
    logger->flush();

    return exit_code;
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("nexus");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        nexus::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto nexus_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<nexus::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<nexus::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(nexus_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  nexus::log::setLoggingSystem(logging_system);

  int exit_code = run_node(argc, argv);

  auto logger =
      nexus::log::createLogger("Main", nexus::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
