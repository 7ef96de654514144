/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
}  // namespace prometheus

namespace nexus::metrics {

  class PrometheusCounter : public Counter {
    friend class PrometheusRegistry;
    prometheus::Counter &m_;

   public:
    explicit PrometheusCounter(prometheus::Counter &m);
    void inc() override;
  };

  class PrometheusGauge : public Gauge {
    friend class PrometheusRegistry;
    prometheus::Gauge &m_;

   public:
    explicit PrometheusGauge(prometheus::Gauge &m);
    void set(double val) override;
  };

}  // namespace nexus::metrics
