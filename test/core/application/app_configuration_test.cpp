/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <fstream>

#include "application/impl/app_configuration_impl.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using nexus::application::AppConfigurationImpl;
using nexus::primitives::Decimal;

using namespace std::chrono_literals;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  boost::filesystem::path tmp_dir = boost::filesystem::temp_directory_path()
                                    / boost::filesystem::unique_path();
  std::string config_path = (tmp_dir / "config.json").native();
  std::string invalid_config_path = (tmp_dir / "invalid_config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();

  static constexpr char const *file_content =
      R"({
        "general" : {
          "log": ["debug", "bounty=trace"],
          "seed": "/var/lib/nexus/seed.json"
        },
        "consensus" : {
          "min-submissions": 5,
          "threshold": "0.75",
          "weighted-voting": false,
          "dispute-threshold": 0.5
        },
        "reputation" : {
          "base-score": 500,
          "incorrect-penalty": -80,
          "decay-rate": "0.002"
        },
        "settlement" : {
          "slash-fraction": "0.5",
          "treasury": "platform",
          "backoff-base-ms": 250
        },
        "worker" : {
          "consensus-interval": 10,
          "threads": 8
        },
        "unknown" : {
          "key": "ignored"
        }
      })";
  static constexpr char const *invalid_file_content =
      R"({
        "consensus" : {
          "threshold": "two thirds"
        }
      })";
  static constexpr char const *damaged_file_content =
      R"({
        "consensus" : {
          "threshold": "0.7"
        },
        "settlement" : nt" : 5
        }
      })";

  void SetUp() override {
    boost::filesystem::create_directory(tmp_dir);
    ASSERT_TRUE(boost::filesystem::exists(tmp_dir));

    auto spawn_file = [](std::string const &path,
                         std::string const &file_content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << file_content;
    };

    spawn_file(config_path, file_content);
    spawn_file(invalid_config_path, invalid_file_content);
    spawn_file(damaged_config_path, damaged_file_content);

    auto logger = nexus::log::createLogger("AppConfigTest", "testing");
    app_config_ = std::make_shared<AppConfigurationImpl>(logger);
  }

  void TearDown() override {
    app_config_.reset();
    boost::filesystem::remove_all(tmp_dir);
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given new created AppConfigurationImpl
 * @when no arguments provided
 * @then only default values are available
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  char const *args[] = {"/path/"};

  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  auto &consensus = app_config_->consensusConfig();
  EXPECT_EQ(consensus.min_submissions, 3);
  EXPECT_EQ(consensus.max_submissions, 100);
  EXPECT_EQ(consensus.threshold, Decimal{"0.66"});
  EXPECT_TRUE(consensus.weighted_voting);
  EXPECT_EQ(app_config_->reputationConfig().base_score, 1000);
  EXPECT_EQ(app_config_->settlementConfig().treasury, "treasury");
  EXPECT_EQ(app_config_->settlementConfig().max_attempts, 5);
  EXPECT_EQ(app_config_->workerConfig().consensus_interval, 60s);
  EXPECT_EQ(app_config_->log(), std::vector<std::string>());
  EXPECT_FALSE(app_config_->seedPath());
}

/**
 * @given a configuration file
 * @when it is the only source
 * @then its values replace the defaults and unknown segments are ignored
 */
TEST_F(AppConfigurationTest, ConfigFileTest) {
  char const *args[] = {"/path/", "--config-file", config_path.c_str()};

  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  auto &consensus = app_config_->consensusConfig();
  EXPECT_EQ(consensus.min_submissions, 5);
  EXPECT_EQ(consensus.max_submissions, 100);
  EXPECT_EQ(consensus.threshold, Decimal{"0.75"});
  EXPECT_FALSE(consensus.weighted_voting);
  EXPECT_EQ(consensus.dispute_threshold, Decimal{"0.5"});

  auto &reputation = app_config_->reputationConfig();
  EXPECT_EQ(reputation.base_score, 500);
  EXPECT_EQ(reputation.incorrect_penalty, -80);
  EXPECT_EQ(reputation.decay_rate, Decimal{"0.002"});

  auto &settlement = app_config_->settlementConfig();
  EXPECT_EQ(settlement.slash_fraction, Decimal{"0.5"});
  EXPECT_EQ(settlement.treasury, "platform");
  EXPECT_EQ(settlement.backoff_base, 250ms);
  EXPECT_EQ(settlement.backoff_cap, 60000ms);

  EXPECT_EQ(app_config_->workerConfig().consensus_interval, 10s);
  EXPECT_EQ(app_config_->workerConfig().threads, 8);
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"debug", "bounty=trace"}));
  ASSERT_TRUE(app_config_->seedPath());
  EXPECT_EQ(app_config_->seedPath()->string(), "/var/lib/nexus/seed.json");
}

/**
 * @given a configuration file
 * @when some of its values are given on the command line too
 * @then the command line wins
 */
TEST_F(AppConfigurationTest, CmdLineOverridesFileTest) {
  char const *args[] = {"/path/",
                        "--config-file",
                        config_path.c_str(),
                        "--threshold",
                        "0.8",
                        "--treasury",
                        "dao",
                        "--worker-threads",
                        "3",
                        "-l",
                        "info"};

  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->consensusConfig().threshold, Decimal{"0.8"});
  EXPECT_EQ(app_config_->consensusConfig().min_submissions, 5);
  EXPECT_EQ(app_config_->settlementConfig().treasury, "dao");
  EXPECT_EQ(app_config_->workerConfig().threads, 3);
  EXPECT_EQ(app_config_->log(), std::vector<std::string>{"info"});
}

/**
 * @given new created AppConfigurationImpl
 * @when out of range values are given
 * @then configuration is rejected
 */
TEST_F(AppConfigurationTest, InvalidRangesTest) {
  {
    char const *args[] = {"/path/", "--threshold", "1.5"};
    EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    auto config = AppConfigurationImpl{
        nexus::log::createLogger("AppConfigTest", "testing")};
    char const *args[] = {"/path/", "--min-score", "100", "--max-score", "50"};
    EXPECT_FALSE(config.initializeFromArgs(std::size(args), args));
  }
  {
    auto config = AppConfigurationImpl{
        nexus::log::createLogger("AppConfigTest", "testing")};
    char const *args[] = {"/path/", "--fee-fraction", "abc"};
    EXPECT_FALSE(config.initializeFromArgs(std::size(args), args));
  }
  {
    auto config = AppConfigurationImpl{
        nexus::log::createLogger("AppConfigTest", "testing")};
    char const *args[] = {"/path/", "--worker-threads", "0"};
    EXPECT_FALSE(config.initializeFromArgs(std::size(args), args));
  }
}

/**
 * @given a configuration file with a malformed number
 * @when it is loaded
 * @then configuration is rejected
 */
TEST_F(AppConfigurationTest, InvalidConfigFileTest) {
  char const *args[] = {"/path/", "--config-file", invalid_config_path.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given a configuration file that is not valid JSON
 * @when it is loaded
 * @then configuration is rejected
 */
TEST_F(AppConfigurationTest, DamagedConfigFileTest) {
  char const *args[] = {"/path/", "--config-file", damaged_config_path.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given a path to a file that does not exist
 * @when it is given as the configuration file
 * @then configuration is rejected
 */
TEST_F(AppConfigurationTest, NoConfigFileTest) {
  auto missing = (tmp_dir / "missing.json").native();
  char const *args[] = {"/path/", "--config-file", missing.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given new created AppConfigurationImpl
 * @when an unknown option is given
 * @then configuration is rejected
 */
TEST_F(AppConfigurationTest, UnknownOptionTest) {
  char const *args[] = {"/path/", "--bounty-pool", "main"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}
