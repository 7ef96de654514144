/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <functional>
#include <memory>

#include "log/logger.hpp"

namespace nexus::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;

    /**
     * @return true if the node can be started with the resulting
     * configuration, false when help was requested or the input is invalid
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const consensus::ConsensusConfig &consensusConfig() const override {
      return consensus_;
    }

    const reputation::ReputationConfig &reputationConfig() const override {
      return reputation_;
    }

    const settlement::SettlementConfig &settlementConfig() const override {
      return settlement_;
    }

    const WorkerConfig &workerConfig() const override {
      return worker_;
    }

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    const std::optional<std::filesystem::path> &seedPath() const override {
      return seed_path_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_consensus_segment(const rapidjson::Value &val);
    void parse_reputation_segment(const rapidjson::Value &val);
    void parse_settlement_segment(const rapidjson::Value &val);
    void parse_worker_segment(const rapidjson::Value &val);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general",    [this](auto &val) { parse_general_segment(val); }},
        SegmentHandler{"consensus",  [this](auto &val) { parse_consensus_segment(val); }},
        SegmentHandler{"reputation", [this](auto &val) { parse_reputation_segment(val); }},
        SegmentHandler{"settlement", [this](auto &val) { parse_settlement_segment(val); }},
        SegmentHandler{"worker",     [this](auto &val) { parse_worker_segment(val); }},
    };
    // clang-format on

    bool validate_config();

    bool read_config_from_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_i32(const rapidjson::Value &val,
                  const char *name,
                  int32_t &target);
    bool load_bool(const rapidjson::Value &val, const char *name, bool &target);
    /// Accepts a JSON number or a decimal string, strings keep full precision
    bool load_decimal(const rapidjson::Value &val,
                      const char *name,
                      primitives::Decimal &target);
    bool load_seconds(const rapidjson::Value &val,
                      const char *name,
                      std::chrono::seconds &target);
    bool load_millis(const rapidjson::Value &val,
                     const char *name,
                     std::chrono::milliseconds &target);

    /// Stores a decimal given on the command line, logs malformed input
    bool set_decimal(const char *name,
                     const std::string &str,
                     primitives::Decimal &target);

    FilePtr open_file(const std::string &filepath);

    log::Logger logger_;

    consensus::ConsensusConfig consensus_;
    reputation::ReputationConfig reputation_;
    settlement::SettlementConfig settlement_;
    WorkerConfig worker_;
    std::vector<std::string> logger_tuning_config_;
    std::optional<std::filesystem::path> seed_path_;
    /// a value in the configuration file could not be used
    bool invalid_value_ = false;
  };

}  // namespace nexus::application
