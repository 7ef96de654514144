/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/seed_loader.hpp"

#include <array>
#include <cstdio>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include "application/configuration_error.hpp"
#include "application/impl/util.hpp"

namespace nexus::application {

  using primitives::Bounty;
  using primitives::Submission;
  using primitives::Timestamp;

  namespace {

    std::optional<std::string> getString(const rapidjson::Value &val,
                                         const char *name) {
      auto m = val.FindMember(name);
      if (val.MemberEnd() != m and m->value.IsString()) {
        return std::string{m->value.GetString(), m->value.GetStringLength()};
      }
      return std::nullopt;
    }

    std::optional<Timestamp> getTime(const rapidjson::Value &val,
                                     const char *name) {
      auto m = val.FindMember(name);
      if (val.MemberEnd() != m and m->value.IsInt64()) {
        return Timestamp{std::chrono::milliseconds{m->value.GetInt64()}};
      }
      return std::nullopt;
    }

  }  // namespace

  SeedLoader::SeedLoader(std::shared_ptr<storage::BountyRepository> bounties,
                         consensus::ConsensusConfig defaults)
      : bounties_{std::move(bounties)},
        defaults_{std::move(defaults)},
        logger_{log::createLogger("SeedLoader", "application")} {
    BOOST_ASSERT(bounties_);
  }

  outcome::result<std::pair<size_t, size_t>> SeedLoader::loadFile(
      const std::filesystem::path &path) {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> file(
        std::fopen(path.c_str(), "r"), &std::fclose);
    if (not file) {
      SL_ERROR(logger_, "Can't open seed file {}", path.string());
      return ConfigurationError::INVALID_SEED;
    }

    std::array<char, 4096> buffer{};
    rapidjson::FileReadStream input_stream(
        file.get(), buffer.data(), buffer.size());
    rapidjson::Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Seed file {} parse failed with error {}",
               path.string(),
               GetParseError_En(document.GetParseError()));
      return ConfigurationError::INVALID_SEED;
    }
    return load(document);
  }

  outcome::result<std::pair<size_t, size_t>> SeedLoader::load(
      const rapidjson::Document &document) {
    if (not document.IsObject()) {
      return ConfigurationError::INVALID_SEED;
    }

    size_t bounties = 0;
    if (auto m = document.FindMember("bounties");
        document.MemberEnd() != m and m->value.IsArray()) {
      for (auto &val : m->value.GetArray()) {
        OUTCOME_TRY(bounty, parseBounty(val));
        OUTCOME_TRY(bounties_->putBounty(bounty));
        ++bounties;
      }
    }

    size_t submissions = 0;
    if (auto m = document.FindMember("submissions");
        document.MemberEnd() != m and m->value.IsArray()) {
      for (auto &val : m->value.GetArray()) {
        OUTCOME_TRY(submission, parseSubmission(val));
        OUTCOME_TRY(bounties_->putSubmission(submission));
        ++submissions;
      }
    }

    SL_INFO(logger_,
            "Seeded {} bounties and {} submissions",
            bounties,
            submissions);
    return std::make_pair(bounties, submissions);
  }

  outcome::result<Bounty> SeedLoader::parseBounty(
      const rapidjson::Value &val) const {
    if (not val.IsObject()) {
      return ConfigurationError::INVALID_SEED;
    }
    auto id = getString(val, "id");
    auto creator = getString(val, "creator");
    auto reward = getString(val, "reward");
    auto created_at = getTime(val, "created-at");
    auto deadline = getTime(val, "deadline");
    if (not id or not creator or not reward
        or not created_at or not deadline) {
      SL_ERROR(logger_, "Seed bounty {} misses a field", id.value_or("?"));
      return ConfigurationError::INVALID_SEED;
    }

    Bounty bounty{
        .id = *id,
        .creator = *creator,
        .min_submissions = defaults_.min_submissions,
        .consensus_threshold = defaults_.threshold,
        .created_at = *created_at,
        .deadline = *deadline,
    };
    OUTCOME_TRY(amount, util::parseBalance(*reward));
    bounty.reward = amount;
    if (auto min_stake = getString(val, "min-stake")) {
      OUTCOME_TRY(stake, util::parseBalance(*min_stake));
      bounty.min_stake = stake;
    }
    if (auto m = val.FindMember("min-submissions");
        val.MemberEnd() != m and m->value.IsUint()) {
      bounty.min_submissions = m->value.GetUint();
    }
    if (auto threshold = getString(val, "threshold")) {
      OUTCOME_TRY(fraction, util::parseDecimal(*threshold));
      if (fraction <= 0 or fraction > 1) {
        SL_ERROR(logger_, "Seed bounty {} has threshold {}", *id, *threshold);
        return ConfigurationError::INVALID_THRESHOLD;
      }
      bounty.consensus_threshold = fraction;
    }
    if (bounty.deadline < bounty.created_at) {
      SL_ERROR(logger_, "Seed bounty {} ends before it starts", *id);
      return ConfigurationError::INVALID_SEED;
    }
    return bounty;
  }

  outcome::result<Submission> SeedLoader::parseSubmission(
      const rapidjson::Value &val) const {
    if (not val.IsObject()) {
      return ConfigurationError::INVALID_SEED;
    }
    auto id = getString(val, "id");
    auto bounty = getString(val, "bounty");
    auto engine = getString(val, "engine");
    auto verdict_str = getString(val, "verdict");
    auto confidence_str = getString(val, "confidence");
    auto stake_str = getString(val, "stake");
    auto submitted_at = getTime(val, "submitted-at");
    if (not id or not bounty or not engine
        or not verdict_str or not confidence_str or not stake_str
        or not submitted_at) {
      SL_ERROR(logger_, "Seed submission {} misses a field", id.value_or("?"));
      return ConfigurationError::INVALID_SEED;
    }

    auto verdict = primitives::verdictFromString(*verdict_str);
    if (not verdict) {
      SL_ERROR(logger_,
               "Seed submission {} has unknown verdict '{}'",
               *id,
               *verdict_str);
      return ConfigurationError::INVALID_SEED;
    }
    OUTCOME_TRY(confidence, util::parseDecimal(*confidence_str));
    if (confidence < 0 or confidence > 1) {
      SL_ERROR(logger_,
               "Seed submission {} has confidence {} outside of [0, 1]",
               *id,
               *confidence_str);
      return ConfigurationError::INVALID_SEED;
    }
    OUTCOME_TRY(stake, util::parseBalance(*stake_str));
    if (stake == 0) {
      SL_ERROR(logger_, "Seed submission {} has no stake", *id);
      return ConfigurationError::INVALID_SEED;
    }

    return Submission{
        .id = *id,
        .bounty_id = *bounty,
        .engine_id = *engine,
        .verdict = *verdict,
        .confidence = std::move(confidence),
        .stake = std::move(stake),
        .submitted_at = *submitted_at,
    };
  }

}  // namespace nexus::application
