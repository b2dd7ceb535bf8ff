#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>
#include <string>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  // Text exposition format for the /metrics endpoint
  std::string serialize() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

#endif // METRICS_REGISTRY_HPP
