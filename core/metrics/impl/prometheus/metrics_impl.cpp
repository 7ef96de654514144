/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>

namespace nexus::metrics {

  PrometheusCounter::PrometheusCounter(prometheus::Counter &m) : m_(m) {}

  void PrometheusCounter::inc() {
    m_.Increment();
  }

  PrometheusGauge::PrometheusGauge(prometheus::Gauge &m) : m_(m) {}

  void PrometheusGauge::set(double val) {
    m_.Set(val);
  }

}  // namespace nexus::metrics
