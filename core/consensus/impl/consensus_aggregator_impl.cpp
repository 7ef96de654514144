/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/consensus_aggregator_impl.hpp"

#include <algorithm>
#include <tuple>

#include <boost/assert.hpp>

#include "consensus/agreement.hpp"
#include "consensus/consensus_resolver.hpp"
#include "consensus/verdict_distribution.hpp"

namespace nexus::consensus {

  using primitives::ConsensusResult;
  using primitives::Submission;

  ConsensusAggregatorImpl::ConsensusAggregatorImpl(ConsensusConfig config)
      : config_{std::move(config)},
        weighting_{config_},
        logger_{log::createLogger("ConsensusAggregator", "consensus")} {}

  std::vector<Submission> ConsensusAggregatorImpl::countedSubmissions(
      const primitives::Bounty &bounty,
      std::vector<Submission> submissions) const {
    std::erase_if(submissions, [&](const Submission &submission) {
      return submission.excluded or submission.stake < bounty.min_stake
          or submission.stake == 0;
    });

    std::sort(submissions.begin(),
              submissions.end(),
              [](const Submission &lhs, const Submission &rhs) {
                return std::tie(lhs.submitted_at, lhs.id)
                     < std::tie(rhs.submitted_at, rhs.id);
              });

    if (submissions.size() > config_.max_submissions) {
      SL_DEBUG(logger_,
               "Bounty {} has {} submissions, counting the first {}",
               bounty.id,
               submissions.size(),
               config_.max_submissions);
      submissions.resize(config_.max_submissions);
    }
    return submissions;
  }

  ConsensusResult ConsensusAggregatorImpl::aggregate(
      const primitives::Bounty &bounty,
      const std::vector<Submission> &counted) const {
    ConsensusResult result;
    result.bounty_id = bounty.id;
    result.total_submissions = counted.size();
    result.weighted_voting = config_.weighted_voting;

    std::vector<WeightedVote> votes;
    votes.reserve(counted.size());
    for (size_t order = 0; order < counted.size(); ++order) {
      auto &submission = counted[order];
      BOOST_ASSERT_MSG(submission.reputation_snapshot.has_value(),
                       "reputation must be resolved before aggregation");
      Decimal weight = weighting_.weight(
          submission.confidence,
          submission.reputation_snapshot.value_or(0),
          VoteWeighting::timeFactor(order, counted.size()));
      result.weights.emplace(submission.id, weight);
      votes.push_back(WeightedVote{
          .submission_id = submission.id,
          .voter = submission.engine_id,
          .verdict = submission.verdict,
          .confidence = submission.confidence,
          .weight = std::move(weight),
      });
    }

    result.distribution = buildDistribution(votes, config_.weighted_voting);

    auto resolution = resolve(result.distribution, bounty.consensus_threshold);
    result.final_verdict = resolution.verdict;
    result.confidence = resolution.confidence;
    result.consensus_reached = isConsensusReached(
        resolution, counted.size(), bounty.min_submissions);

    if (result.distribution.total_weight > 0) {
      result.weighted_score =
          result.distribution.at(resolution.verdict).weighted_count
          / result.distribution.total_weight;
    }
    result.agreement_score = agreementScore(result.distribution);
    result.dispute_eligible =
        canDispute(result.agreement_score, config_.dispute_threshold);

    SL_TRACE(logger_,
             "Bounty {}: verdict {} confidence {} agreement {}% over {} "
             "submissions, consensus {}",
             bounty.id,
             result.final_verdict,
             result.confidence,
             result.agreement_score,
             result.total_submissions,
             result.consensus_reached ? "reached" : "not reached");
    return result;
  }

  ConsensusResult ConsensusAggregatorImpl::imposeVerdict(
      const ConsensusResult &computed, primitives::Verdict verdict) const {
    ConsensusResult result = computed;
    auto &stats = result.distribution.at(verdict);
    result.final_verdict = verdict;
    result.confidence = stats.average_confidence;
    result.weighted_score = Decimal{0};
    if (result.distribution.total_weight > 0) {
      result.weighted_score =
          stats.weighted_count / result.distribution.total_weight;
    }
    result.consensus_reached = true;
    // an administrative decision closes the dispute window
    result.dispute_eligible = false;
    return result;
  }

}  // namespace nexus::consensus
