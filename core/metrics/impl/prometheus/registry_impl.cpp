/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <prometheus/text_serializer.h>

#include "metrics/metrics.hpp"

namespace nexus::metrics {

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  prometheus::Counter *PrometheusRegistry::internalMetric(Counter *metric) {
    return &static_cast<PrometheusCounter *>(metric)->m_;
  }

  prometheus::Gauge *PrometheusRegistry::internalMetric(Gauge *metric) {
    return &static_cast<PrometheusGauge *>(metric)->m_;
  }

  template <typename T, typename B>
  prometheus::Family<T> &PrometheusRegistry::family(
      Families<T> &families,
      B &&builder,
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    auto it = families.find(name);
    if (it == families.end()) {
      auto &family =
          builder.Name(name).Help(help).Labels(labels).Register(registry_);
      it = families.emplace(name, &family).first;
    }
    return *it->second;
  }

  void PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    family(counter_families_, prometheus::BuildCounter(), name, help, labels);
  }

  void PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    family(gauge_families_, prometheus::BuildGauge(), name, help, labels);
  }

  Counter *PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    auto &metric =
        family(counter_families_, prometheus::BuildCounter(), name, "", {})
            .Add(labels);
    return counters_.emplace_back(std::make_unique<PrometheusCounter>(metric))
        .get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    auto &metric =
        family(gauge_families_, prometheus::BuildGauge(), name, "", {})
            .Add(labels);
    return gauges_.emplace_back(std::make_unique<PrometheusGauge>(metric))
        .get();
  }

  std::string PrometheusRegistry::serialize() const {
    return prometheus::TextSerializer{}.Serialize(registry_.Collect());
  }

}  // namespace nexus::metrics
