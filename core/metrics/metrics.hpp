/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "metrics/registry.hpp"

namespace nexus::metrics {
  using RegistryPtr = std::unique_ptr<Registry>;

  // the function recommended to use to create a registry of the chosen
  // implementation
  RegistryPtr createRegistry();

  /**
   * @brief A counter metric to represent a monotonically increasing value,
   * such as resolved bounties or failed payouts.
   *
   * This class represents the metric type counter:
   * https://prometheus.io/docs/concepts/metric_types/#counter
   */
  class Counter {
   public:
    virtual ~Counter() = default;

    virtual void inc() = 0;
  };

  /// A gauge metric to represent a sampled level, like open bounties
  class Gauge {
   public:
    virtual ~Gauge() = default;

    virtual void set(double val) = 0;
  };
}  // namespace nexus::metrics
