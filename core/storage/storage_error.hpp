/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace nexus::storage {

  /**
   * @brief error of a repository backend
   */
  enum class StorageError : int {
    NOT_FOUND = 1,
    ALREADY_EXISTS,
    /// backend temporarily cannot serve the request
    UNAVAILABLE,
    INVALID_ARGUMENT,
    /// entry exists but its state does not allow the change
    WRONG_STATE,
  };

}  // namespace nexus::storage

OUTCOME_HPP_DECLARE_ERROR(nexus::storage, StorageError);
