#include "core/metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
}

prometheus::Family<prometheus::Histogram> &
MetricsRegistry::create_histogram_family(const std::string &name,
                                         const std::string &help) {
  return prometheus::BuildHistogram().Name(name).Help(help).Register(
      *registry_);
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {
  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

const std::vector<double> &MetricsRegistry::latency_buckets() {
  // Seconds; training on the full catalogue lands in the upper buckets
  static const std::vector<double> buckets = {0.001, 0.005, 0.01, 0.05, 0.1,
                                              0.5,   1.0,   5.0,  10.0, 30.0};
  return buckets;
}
