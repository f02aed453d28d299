#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  // Families are labelled per endpoint/model by the caller via Add({...})
  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  prometheus::Family<prometheus::Histogram> &
  create_histogram_family(const std::string &name, const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  // Prometheus text exposition of everything registered so far
  std::string serialize() const;

  static const std::vector<double> &latency_buckets();

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

#endif // METRICS_REGISTRY_HPP
