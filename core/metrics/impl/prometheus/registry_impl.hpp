/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace nexus::metrics {

  /**
   * Registry over prometheus-cpp. Families are created lazily, so a metric
   * may be requested before its family was registered.
   */
  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry() = default;

    static prometheus::Counter *internalMetric(Counter *metric);
    static prometheus::Gauge *internalMetric(Gauge *metric);

    void registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    std::string serialize() const override;

   private:
    template <typename T>
    using Families = std::map<std::string, prometheus::Family<T> *>;

    template <typename T, typename B>
    prometheus::Family<T> &family(
        Families<T> &families,
        B &&builder,
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels);

    std::mutex mutex_;
    prometheus::Registry registry_;
    Families<prometheus::Counter> counter_families_;
    Families<prometheus::Gauge> gauge_families_;
    std::vector<std::unique_ptr<PrometheusCounter>> counters_;
    std::vector<std::unique_ptr<PrometheusGauge>> gauges_;
  };

}  // namespace nexus::metrics
