/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(nexus::storage, StorageError, e) {
  using E = nexus::storage::StorageError;
  switch (e) {
    case E::NOT_FOUND:
      return "entry not found in storage";
    case E::ALREADY_EXISTS:
      return "entry already exists in storage";
    case E::UNAVAILABLE:
      return "storage is unavailable";
    case E::INVALID_ARGUMENT:
      return "invalid argument to storage";
    case E::WRONG_STATE:
      return "entry state does not allow the change";
  }
  return "unknown error";
}
