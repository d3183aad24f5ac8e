#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
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

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help,
                        const std::map<std::string, std::string> &labels);

  prometheus::Family<prometheus::Histogram> &
  create_histogram_family(const std::string &name, const std::string &help);

  // Prometheus text exposition of everything registered so far
  std::string serialize_text();
  bool write_text_file(const std::string &filepath);

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// Counters and timers shared by every pipeline stage. Registered once on
// first use.
struct PipelineMetrics {
  prometheus::Counter &rows_read;
  prometheus::Counter &rows_rejected;
  prometheus::Counter &rows_corrected;
  prometheus::Counter &events_parsed;
  prometheus::Family<prometheus::Counter> &diagnostics;
  prometheus::Gauge &students;
  prometheus::Gauge &effective_k;
  prometheus::Family<prometheus::Histogram> &stage_duration;

  static PipelineMetrics &instance();
  prometheus::Histogram &stage_timer(const std::string &stage);
};

#endif // METRICS_REGISTRY_HPP
