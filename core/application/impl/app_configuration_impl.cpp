/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <boost/program_options.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include "application/impl/util.hpp"

namespace {

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

}  // namespace

namespace nexus::application {

  using primitives::Decimal;

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    BOOST_ASSERT(!filepath.empty());
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    for (auto &v : m->value.GetArray()) {
      if (v.IsString()) {
        target.emplace_back(v.GetString(), v.GetStringLength());
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_bool(const rapidjson::Value &val,
                                       const char *name,
                                       bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_i32(const rapidjson::Value &val,
                                      const char *name,
                                      int32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsInt()) {
      target = m->value.GetInt();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_decimal(const rapidjson::Value &val,
                                          const char *name,
                                          Decimal &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      return set_decimal(name, m->value.GetString(), target);
    }
    if (m->value.IsInt64()) {
      target = Decimal{m->value.GetInt64()};
      return true;
    }
    if (m->value.IsNumber()) {
      // binary doubles are not exact, keep the shortest decimal form
      return set_decimal(
          name, fmt::format("{}", m->value.GetDouble()), target);
    }
    SL_ERROR(logger_, "Value of '{}' must be a number", name);
    invalid_value_ = true;
    return false;
  }

  bool AppConfigurationImpl::load_seconds(const rapidjson::Value &val,
                                          const char *name,
                                          std::chrono::seconds &target) {
    uint32_t seconds = 0;
    if (load_u32(val, name, seconds)) {
      target = std::chrono::seconds{seconds};
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_millis(const rapidjson::Value &val,
                                         const char *name,
                                         std::chrono::milliseconds &target) {
    uint32_t millis = 0;
    if (load_u32(val, name, millis)) {
      target = std::chrono::milliseconds{millis};
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::set_decimal(const char *name,
                                         const std::string &str,
                                         Decimal &target) {
    auto res = util::parseDecimal(str);
    if (res.has_error()) {
      SL_ERROR(logger_, "Invalid value '{}' of '{}': {}", str, name, res.error());
      invalid_value_ = true;
      return false;
    }
    target = std::move(res.value());
    return true;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
    std::string seed;
    if (load_str(val, "seed", seed)) {
      seed_path_ = seed;
    }
  }

  void AppConfigurationImpl::parse_consensus_segment(
      const rapidjson::Value &val) {
    load_u32(val, "min-submissions", consensus_.min_submissions);
    load_u32(val, "max-submissions", consensus_.max_submissions);
    load_decimal(val, "threshold", consensus_.threshold);
    load_bool(val, "weighted-voting", consensus_.weighted_voting);
    load_decimal(val, "reputation-weight", consensus_.reputation_weight);
    load_decimal(val, "confidence-weight", consensus_.confidence_weight);
    load_decimal(val, "time-weight", consensus_.time_weight);
    load_decimal(val, "dispute-threshold", consensus_.dispute_threshold);
    load_decimal(val, "early-window", consensus_.early_window);
  }

  void AppConfigurationImpl::parse_reputation_segment(
      const rapidjson::Value &val) {
    load_i32(val, "base-score", reputation_.base_score);
    load_i32(val, "correct-points", reputation_.correct_points);
    load_i32(val, "incorrect-penalty", reputation_.incorrect_penalty);
    load_decimal(val, "streak-cap", reputation_.streak_cap);
    load_i32(val, "consensus-bonus", reputation_.consensus_bonus);
    load_i32(val, "early-bonus", reputation_.early_bonus);
    load_decimal(val, "decay-rate", reputation_.decay_rate);
    load_i32(val, "min-score", reputation_.min_score);
    load_i32(val, "max-score", reputation_.max_score);
  }

  void AppConfigurationImpl::parse_settlement_segment(
      const rapidjson::Value &val) {
    load_decimal(val, "slash-fraction", settlement_.slash_fraction);
    load_decimal(val, "fee-fraction", settlement_.fee_fraction);
    load_str(val, "treasury", settlement_.treasury);
    load_u32(val, "max-attempts", settlement_.max_attempts);
    load_millis(val, "backoff-base-ms", settlement_.backoff_base);
    load_millis(val, "backoff-cap-ms", settlement_.backoff_cap);
  }

  void AppConfigurationImpl::parse_worker_segment(const rapidjson::Value &val) {
    load_seconds(val, "consensus-interval", worker_.consensus_interval);
    load_seconds(val, "payout-interval", worker_.payout_interval);
    load_seconds(val, "decay-interval", worker_.decay_interval);
    load_u32(val, "threads", worker_.threads);
  }

  bool AppConfigurationImpl::validate_config() {
    if (invalid_value_) {
      return false;
    }
    auto res = util::validate(consensus_, reputation_, settlement_, worker_);
    if (res.has_error()) {
      SL_ERROR(logger_, "Invalid configuration: {}", res.error());
      return false;
    }
    if (settlement_.treasury.empty()) {
      SL_ERROR(logger_, "Treasury account must not be empty");
      return false;
    }
    if (consensus_.max_submissions < consensus_.min_submissions) {
      SL_WARN(logger_,
              "max-submissions {} is below min-submissions {}, "
              "no bounty can reach consensus",
              consensus_.max_submissions,
              consensus_.min_submissions);
    }
    if (consensus_.dispute_threshold <= consensus_.threshold) {
      SL_INFO(logger_,
              "dispute-threshold {} does not exceed threshold {}, bounties "
              "with the default threshold can only be disputed by admins",
              consensus_.dispute_threshold,
              consensus_.threshold);
    }
    return true;
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    BOOST_ASSERT(!filepath.empty());

    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not an object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lbounty=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a YAML file replacing the embedded logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("seed", po::value<std::string>(), "JSON file with bounties and submissions to load at startup")
        ;

    po::options_description consensus_desc("Consensus options");
    consensus_desc.add_options()
        ("min-submissions", po::value<uint32_t>(), "eligible submissions a bounty needs to resolve (default 3)")
        ("max-submissions", po::value<uint32_t>(), "earliest submissions counted per bounty (default 100)")
        ("threshold", po::value<std::string>(), "default share of the total weight the winning verdict needs (default 0.66)")
        ("weighted-voting", po::value<bool>(), "weight votes by reputation, confidence and time (default true)")
        ("reputation-weight", po::value<std::string>(), "reputation coefficient of the vote weight (default 0.5)")
        ("confidence-weight", po::value<std::string>(), "confidence coefficient of the vote weight (default 0.3)")
        ("time-weight", po::value<std::string>(), "submission time coefficient of the vote weight (default 0.2)")
        ("dispute-threshold", po::value<std::string>(), "results with a lower agreement may be disputed (default 0.4)")
        ("early-window", po::value<std::string>(), "share of the voting window earning the early bonus (default 0.2)")
        ;

    po::options_description reputation_desc("Reputation options");
    reputation_desc.add_options()
        ("base-score", po::value<int32_t>(), "reputation of a new engine (default 1000)")
        ("correct-points", po::value<int32_t>(), "points for a correct submission (default 50)")
        ("incorrect-penalty", po::value<int32_t>(), "points for an incorrect submission (default -100)")
        ("streak-cap", po::value<std::string>(), "maximal streak multiplier (default 1.5)")
        ("consensus-bonus", po::value<int32_t>(), "bonus for voting with the consensus (default 25)")
        ("early-bonus", po::value<int32_t>(), "bonus for an early submission (default 10)")
        ("decay-rate", po::value<std::string>(), "share of the score lost per inactive day (default 0.001)")
        ("min-score", po::value<int32_t>(), "lowest reputation (default 0)")
        ("max-score", po::value<int32_t>(), "highest reputation (default 10000)")
        ;

    po::options_description settlement_desc("Settlement options");
    settlement_desc.add_options()
        ("slash-fraction", po::value<std::string>(), "share of an incorrect stake that is forfeited (default 1.0)")
        ("fee-fraction", po::value<std::string>(), "platform fee taken from the reward (default 0)")
        ("treasury", po::value<std::string>(), "account receiving slashes and fees (default treasury)")
        ("max-attempts", po::value<uint32_t>(), "payment attempts before a payout fails (default 5)")
        ("backoff-base-ms", po::value<uint32_t>(), "delay after the first failed attempt (default 1000)")
        ("backoff-cap-ms", po::value<uint32_t>(), "longest delay between attempts (default 60000)")
        ;

    po::options_description worker_desc("Worker options");
    worker_desc.add_options()
        ("consensus-interval", po::value<uint32_t>(), "seconds between consensus ticks (default 60)")
        ("payout-interval", po::value<uint32_t>(), "seconds between payout passes (default 30)")
        ("decay-interval", po::value<uint32_t>(), "seconds between reputation decay passes (default 3600)")
        ("worker-threads", po::value<uint32_t>(), "bounties processed concurrently (default 2)")
        ;
    // clang-format on

    desc.add(consensus_desc)
        .add(reputation_desc)
        .add(settlement_desc)
        .add(worker_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool file_ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      file_ok = read_config_from_file(path);
    });
    if (not file_ok) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });
    find_argument<std::string>(
        vm, "seed", [&](const std::string &val) { seed_path_ = val; });

    find_argument<uint32_t>(vm, "min-submissions", [&](uint32_t val) {
      consensus_.min_submissions = val;
    });
    find_argument<uint32_t>(vm, "max-submissions", [&](uint32_t val) {
      consensus_.max_submissions = val;
    });
    find_argument<bool>(vm, "weighted-voting", [&](bool val) {
      consensus_.weighted_voting = val;
    });

    const std::array<std::pair<const char *, Decimal *>, 10> decimals{{
        {"threshold", &consensus_.threshold},
        {"reputation-weight", &consensus_.reputation_weight},
        {"confidence-weight", &consensus_.confidence_weight},
        {"time-weight", &consensus_.time_weight},
        {"dispute-threshold", &consensus_.dispute_threshold},
        {"early-window", &consensus_.early_window},
        {"streak-cap", &reputation_.streak_cap},
        {"decay-rate", &reputation_.decay_rate},
        {"slash-fraction", &settlement_.slash_fraction},
        {"fee-fraction", &settlement_.fee_fraction},
    }};
    for (auto &[name, target] : decimals) {
      if (auto val = find_argument<std::string>(vm, name)) {
        set_decimal(name, *val, *target);
      }
    }

    const std::array<std::pair<const char *, int32_t *>, 7> scores{{
        {"base-score", &reputation_.base_score},
        {"correct-points", &reputation_.correct_points},
        {"incorrect-penalty", &reputation_.incorrect_penalty},
        {"consensus-bonus", &reputation_.consensus_bonus},
        {"early-bonus", &reputation_.early_bonus},
        {"min-score", &reputation_.min_score},
        {"max-score", &reputation_.max_score},
    }};
    for (auto &[name, target] : scores) {
      if (auto val = find_argument<int32_t>(vm, name)) {
        *target = *val;
      }
    }

    find_argument<std::string>(vm, "treasury", [&](const std::string &val) {
      settlement_.treasury = val;
    });
    find_argument<uint32_t>(vm, "max-attempts", [&](uint32_t val) {
      settlement_.max_attempts = val;
    });
    find_argument<uint32_t>(vm, "backoff-base-ms", [&](uint32_t val) {
      settlement_.backoff_base = std::chrono::milliseconds{val};
    });
    find_argument<uint32_t>(vm, "backoff-cap-ms", [&](uint32_t val) {
      settlement_.backoff_cap = std::chrono::milliseconds{val};
    });

    find_argument<uint32_t>(vm, "consensus-interval", [&](uint32_t val) {
      worker_.consensus_interval = std::chrono::seconds{val};
    });
    find_argument<uint32_t>(vm, "payout-interval", [&](uint32_t val) {
      worker_.payout_interval = std::chrono::seconds{val};
    });
    find_argument<uint32_t>(vm, "decay-interval", [&](uint32_t val) {
      worker_.decay_interval = std::chrono::seconds{val};
    });
    find_argument<uint32_t>(
        vm, "worker-threads", [&](uint32_t val) { worker_.threads = val; });

    // if something wrong with config print help message
    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace nexus::application
