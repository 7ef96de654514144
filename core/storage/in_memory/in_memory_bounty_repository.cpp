/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_bounty_repository.hpp"

#include <algorithm>

#include "storage/storage_error.hpp"

namespace nexus::storage {

  outcome::result<Bounty> InMemoryBountyRepository::getBounty(
      const BountyId &id) const {
    return state_.sharedAccess([&](const State &state) -> outcome::result<Bounty> {
      auto it = state.bounties.find(id);
      if (it == state.bounties.end()) {
        return StorageError::NOT_FOUND;
      }
      return it->second;
    });
  }

  outcome::result<std::vector<Bounty>> InMemoryBountyRepository::getBounties(
      BountyStatus status) const {
    return state_.sharedAccess([&](const State &state) {
      std::vector<Bounty> bounties;
      for (auto &[_, bounty] : state.bounties) {
        if (bounty.status == status) {
          bounties.push_back(bounty);
        }
      }
      return outcome::result<std::vector<Bounty>>{std::move(bounties)};
    });
  }

  outcome::result<std::vector<Bounty>>
  InMemoryBountyRepository::getUnsettledBounties() const {
    return state_.sharedAccess([&](const State &state) {
      std::vector<Bounty> bounties;
      for (auto &[_, bounty] : state.bounties) {
        auto settled_status = bounty.status == BountyStatus::Completed
                           or bounty.status == BountyStatus::Expired;
        if (settled_status and bounty.settled_round < bounty.resolution_round) {
          bounties.push_back(bounty);
        }
      }
      return outcome::result<std::vector<Bounty>>{std::move(bounties)};
    });
  }

  outcome::result<void> InMemoryBountyRepository::putBounty(
      const Bounty &bounty) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      auto [_, inserted] = state.bounties.emplace(bounty.id, bounty);
      if (not inserted) {
        return StorageError::ALREADY_EXISTS;
      }
      return outcome::success();
    });
  }

  outcome::result<bool> InMemoryBountyRepository::compareAndSetStatus(
      const BountyId &id, BountyStatus expected, BountyStatus desired) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<bool> {
      auto it = state.bounties.find(id);
      if (it == state.bounties.end()) {
        return StorageError::NOT_FOUND;
      }
      if (it->second.status != expected) {
        return false;
      }
      it->second.status = desired;
      return true;
    });
  }

  outcome::result<bool> InMemoryBountyRepository::claimReview(
      const BountyId &id, const std::string &reviewer) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<bool> {
      auto it = state.bounties.find(id);
      if (it == state.bounties.end()) {
        return StorageError::NOT_FOUND;
      }
      auto &bounty = it->second;
      if (bounty.status == BountyStatus::UnderReview) {
        return bounty.reviewer == reviewer;
      }
      if (bounty.status != BountyStatus::Completed) {
        return false;
      }
      bounty.status = BountyStatus::UnderReview;
      bounty.reviewer = reviewer;
      return true;
    });
  }

  outcome::result<std::optional<uint32_t>>
  InMemoryBountyRepository::commitResolution(
      const BountyId &id,
      BountyStatus expected,
      BountyStatus desired,
      const primitives::ConsensusResult &result) {
    return state_.exclusiveAccess(
        [&](State &state) -> outcome::result<std::optional<uint32_t>> {
          auto it = state.bounties.find(id);
          if (it == state.bounties.end()) {
            return StorageError::NOT_FOUND;
          }
          auto &bounty = it->second;
          if (bounty.status != expected) {
            return std::nullopt;
          }
          if (desired != BountyStatus::UnderReview) {
            bounty.reviewer.reset();
          }
          bounty.status = desired;
          bounty.resolution_round += 1;
          bounty.consensus = result;
          return bounty.resolution_round;
        });
  }

  outcome::result<void> InMemoryBountyRepository::markSettled(
      const BountyId &id, uint32_t round) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      auto it = state.bounties.find(id);
      if (it == state.bounties.end()) {
        return StorageError::NOT_FOUND;
      }
      it->second.settled_round = std::max(it->second.settled_round, round);
      return outcome::success();
    });
  }

  outcome::result<std::vector<Submission>>
  InMemoryBountyRepository::getSubmissions(const BountyId &bounty_id) const {
    return state_.sharedAccess([&](const State &state) {
      auto it = state.submissions.find(bounty_id);
      if (it == state.submissions.end()) {
        return outcome::result<std::vector<Submission>>{
            std::vector<Submission>{}};
      }
      return outcome::result<std::vector<Submission>>{it->second};
    });
  }

  outcome::result<void> InMemoryBountyRepository::putSubmission(
      const Submission &submission) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      auto bounty = state.bounties.find(submission.bounty_id);
      if (bounty == state.bounties.end()) {
        return StorageError::NOT_FOUND;
      }
      if (bounty->second.status != BountyStatus::Open) {
        return StorageError::WRONG_STATE;
      }
      auto &submissions = state.submissions[submission.bounty_id];
      auto duplicate = std::any_of(
          submissions.begin(), submissions.end(), [&](const Submission &s) {
            return s.id == submission.id
                or s.engine_id == submission.engine_id;
          });
      if (duplicate) {
        return StorageError::ALREADY_EXISTS;
      }
      submissions.push_back(submission);
      return outcome::success();
    });
  }

  Submission *InMemoryBountyRepository::find(
      State &state,
      const BountyId &bounty_id,
      const primitives::SubmissionId &id) {
    auto it = state.submissions.find(bounty_id);
    if (it == state.submissions.end()) {
      return nullptr;
    }
    auto found = std::find_if(it->second.begin(),
                              it->second.end(),
                              [&](const Submission &s) { return s.id == id; });
    return found == it->second.end() ? nullptr : &*found;
  }

  outcome::result<void> InMemoryBountyRepository::recordOutcomes(
      const std::vector<Submission> &submissions) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      // validate everything first so the update is all or nothing
      std::vector<Submission *> targets;
      targets.reserve(submissions.size());
      for (auto &submission : submissions) {
        auto target = find(state, submission.bounty_id, submission.id);
        if (target == nullptr) {
          return StorageError::NOT_FOUND;
        }
        targets.push_back(target);
      }
      for (size_t i = 0; i < submissions.size(); ++i) {
        auto &source = submissions[i];
        auto &target = *targets[i];
        target.status = source.status;
        target.accuracy_score = source.accuracy_score;
        target.processed_at = source.processed_at;
        if (not target.reputation_snapshot) {
          target.reputation_snapshot = source.reputation_snapshot;
        }
      }
      return outcome::success();
    });
  }

  outcome::result<void> InMemoryBountyRepository::excludeSubmission(
      const BountyId &bounty_id, const primitives::SubmissionId &id) {
    return state_.exclusiveAccess([&](State &state) -> outcome::result<void> {
      auto target = find(state, bounty_id, id);
      if (target == nullptr) {
        return StorageError::NOT_FOUND;
      }
      target->excluded = true;
      return outcome::success();
    });
  }

}  // namespace nexus::storage
