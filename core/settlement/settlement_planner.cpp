/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settlement/settlement_planner.hpp"

#include <algorithm>
#include <map>
#include <tuple>

#include <boost/assert.hpp>

namespace nexus::settlement {

  using primitives::Balance;
  using primitives::PayoutType;
  using primitives::Submission;
  using primitives::SubmissionStatus;

  namespace {

    PayoutAction submissionAction(const Submission &submission,
                                  PayoutType type,
                                  primitives::AccountId recipient,
                                  Balance amount,
                                  uint32_t round) {
      return PayoutAction{
          .id = fmt::format(
              "{}:{}:{}:{}", submission.bounty_id, round, submission.id, type),
          .bounty_id = submission.bounty_id,
          .submission_id = submission.id,
          .recipient = std::move(recipient),
          .amount = std::move(amount),
          .type = type,
          .round = round,
      };
    }

    PayoutAction accountAction(const primitives::BountyId &bounty_id,
                               PayoutType type,
                               primitives::AccountId recipient,
                               Balance amount,
                               uint32_t round) {
      return PayoutAction{
          .id = fmt::format("{}:{}:{}:{}", bounty_id, round, recipient, type),
          .bounty_id = bounty_id,
          .recipient = std::move(recipient),
          .amount = std::move(amount),
          .type = type,
          .round = round,
      };
    }

    std::vector<Submission> inSubmissionOrder(
        std::vector<Submission> submissions) {
      std::sort(submissions.begin(),
                submissions.end(),
                [](const Submission &lhs, const Submission &rhs) {
                  return std::tie(lhs.submitted_at, lhs.id)
                       < std::tie(rhs.submitted_at, rhs.id);
                });
      return submissions;
    }

    /// Subject of an action: the submission, or the account for plain ones
    std::string subjectOf(const PayoutAction &action) {
      return action.submission_id.value_or(action.recipient);
    }

  }  // namespace

  SettlementPlanner::SettlementPlanner(SettlementConfig config)
      : config_{std::move(config)},
        logger_{log::createLogger("SettlementPlanner", "settlement")} {
    BOOST_ASSERT(config_.slash_fraction >= 0 and config_.slash_fraction <= 1);
    BOOST_ASSERT(config_.fee_fraction >= 0 and config_.fee_fraction < 1);
  }

  std::string SettlementPlanner::planKey(const primitives::BountyId &bounty_id,
                                         uint32_t round) {
    return fmt::format("{}:{}", bounty_id, round);
  }

  std::string SettlementPlanner::disputePlanKey(
      const primitives::DisputeId &dispute_id) {
    return fmt::format("dispute:{}", dispute_id);
  }

  std::vector<PayoutAction> SettlementPlanner::plan(
      const primitives::Bounty &bounty,
      const primitives::ConsensusResult &result,
      const std::vector<Submission> &submissions,
      uint32_t round) const {
    std::vector<PayoutAction> actions;
    auto ordered = inSubmissionOrder(submissions);

    const Decimal fee_share = primitives::toDecimal(bounty.reward)
                            * config_.fee_fraction;
    const Balance fee = primitives::floorToBalance(fee_share);
    const Balance pool = bounty.reward - fee;
    if (fee > 0) {
      actions.push_back(accountAction(
          bounty.id, PayoutType::Fee, config_.treasury, fee, round));
    }

    // reward weights of correct submissions
    std::vector<std::pair<const Submission *, Decimal>> winners;
    Decimal total_weight{0};
    for (auto &submission : ordered) {
      if (submission.status != SubmissionStatus::Correct) {
        continue;
      }
      Decimal weight{1};
      if (result.weighted_voting) {
        auto it = result.weights.find(submission.id);
        weight = it != result.weights.end() ? it->second : Decimal{0};
      }
      total_weight += weight;
      winners.emplace_back(&submission, std::move(weight));
    }
    if (not winners.empty() and total_weight == 0) {
      // degenerate weights: split evenly
      for (auto &[_, weight] : winners) {
        weight = 1;
      }
      total_weight = static_cast<int64_t>(winners.size());
    }

    std::map<primitives::SubmissionId, Balance> shares;
    Balance distributed{0};
    const Submission *heaviest = nullptr;
    Decimal heaviest_weight{-1};
    for (auto &[submission, weight] : winners) {
      const Decimal portion = primitives::toDecimal(pool) * weight;
      const Decimal exact = portion / total_weight;
      auto share = primitives::floorToBalance(exact);
      distributed += share;
      shares.emplace(submission->id, share);
      if (weight > heaviest_weight) {
        heaviest = submission;
        heaviest_weight = weight;
      }
    }
    if (heaviest != nullptr) {
      shares[heaviest->id] += pool - distributed;
    }

    for (auto &submission : ordered) {
      switch (submission.status) {
        case SubmissionStatus::Correct: {
          if (submission.stake > 0) {
            actions.push_back(submissionAction(submission,
                                               PayoutType::StakeReturn,
                                               submission.engine_id,
                                               submission.stake,
                                               round));
          }
          auto &share = shares[submission.id];
          if (share > 0) {
            actions.push_back(submissionAction(submission,
                                               PayoutType::BountyReward,
                                               submission.engine_id,
                                               share,
                                               round));
          }
          break;
        }
        case SubmissionStatus::Incorrect: {
          const Decimal forfeit = primitives::toDecimal(submission.stake)
                                * config_.slash_fraction;
          const Balance slashed = primitives::floorToBalance(forfeit);
          if (slashed > 0) {
            actions.push_back(submissionAction(submission,
                                               PayoutType::StakeSlash,
                                               config_.treasury,
                                               slashed,
                                               round));
          }
          if (submission.stake > slashed) {
            actions.push_back(submissionAction(submission,
                                               PayoutType::StakeReturn,
                                               submission.engine_id,
                                               submission.stake - slashed,
                                               round));
          }
          break;
        }
        case SubmissionStatus::Pending:
          if (submission.stake > 0) {
            actions.push_back(submissionAction(submission,
                                               PayoutType::StakeReturn,
                                               submission.engine_id,
                                               submission.stake,
                                               round));
          }
          break;
      }
    }

    if (winners.empty() and pool > 0) {
      actions.push_back(accountAction(
          bounty.id, PayoutType::Refund, bounty.creator, pool, round));
    }

    SL_DEBUG(logger_,
             "Bounty {} round {}: {} payout actions, {} rewarded submissions",
             bounty.id,
             round,
             actions.size(),
             winners.size());
    return actions;
  }

  std::vector<PayoutAction> SettlementPlanner::planStakeReturn(
      const primitives::Bounty &bounty,
      const std::vector<Submission> &submissions,
      uint32_t round) const {
    std::vector<PayoutAction> actions;
    for (auto &submission : inSubmissionOrder(submissions)) {
      if (submission.stake > 0) {
        actions.push_back(submissionAction(submission,
                                           PayoutType::StakeReturn,
                                           submission.engine_id,
                                           submission.stake,
                                           round));
      }
    }
    if (bounty.reward > 0) {
      actions.push_back(accountAction(
          bounty.id, PayoutType::Refund, bounty.creator, bounty.reward, round));
    }
    return actions;
  }

  std::vector<PayoutAction> SettlementPlanner::reconcile(
      const std::vector<PayoutAction> &previous,
      const std::vector<PayoutAction> &target) {
    std::map<std::tuple<std::string, PayoutType>, Balance> paid;
    for (auto &action : previous) {
      paid[{subjectOf(action), action.type}] += action.amount;
    }

    std::vector<PayoutAction> compensation;
    for (auto &action : target) {
      if (action.type == PayoutType::StakeSlash) {
        continue;
      }
      auto &already = paid[{subjectOf(action), action.type}];
      if (action.amount > already) {
        auto &added = compensation.emplace_back(action);
        added.amount = action.amount - already;
      }
    }
    return compensation;
  }

  std::vector<PayoutAction> SettlementPlanner::planDisputeStake(
      const primitives::Dispute &dispute,
      primitives::DisputeResolution resolution) const {
    if (dispute.stake == 0) {
      return {};
    }
    const bool accepted =
        resolution == primitives::DisputeResolution::Accepted;
    auto type = accepted ? PayoutType::Refund : PayoutType::StakeSlash;
    return {PayoutAction{
        .id = fmt::format("{}:dispute:{}:{}", dispute.bounty_id, dispute.id, type),
        .bounty_id = dispute.bounty_id,
        .recipient = accepted ? dispute.disputer : config_.treasury,
        .amount = dispute.stake,
        .type = type,
    }};
  }

}  // namespace nexus::settlement
