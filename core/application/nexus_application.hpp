/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace nexus::application {

  /**
   * @class NexusApplication consensus and settlement node interface
   */
  class NexusApplication {
   public:
    virtual ~NexusApplication() = default;

    /// Runs node until shutdown is requested
    /// @return process exit code
    virtual int run() = 0;
  };
}  // namespace nexus::application
