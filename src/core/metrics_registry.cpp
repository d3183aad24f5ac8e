#include "metrics_registry.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

prometheus::Family<prometheus::Counter> &MetricsRegistry::create_counter_family(
    const std::string &name, const std::string &help,
    const std::map<std::string, std::string> &labels) {

  return prometheus::BuildCounter()
      .Name(name)
      .Help(help)
      .Labels(labels)
      .Register(*registry_);
}

prometheus::Family<prometheus::Histogram> &
MetricsRegistry::create_histogram_family(const std::string &name,
                                         const std::string &help) {
  return prometheus::BuildHistogram().Name(name).Help(help).Register(
      *registry_);
}

std::string MetricsRegistry::serialize_text() {
  prometheus::TextSerializer serializer;
  auto collected_metrics = registry_->Collect();
  return serializer.Serialize(collected_metrics);
}

bool MetricsRegistry::write_text_file(const std::string &filepath) {
  if (!Utils::create_directory_for_file(filepath)) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Could not create directory for " << filepath);
    return false;
  }
  std::ofstream out(filepath);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Could not open metrics output file: " << filepath);
    return false;
  }
  out << serialize_text();
  LOG(LogLevel::INFO, LogComponent::IO_WRITER,
      "Run metrics written to " << filepath);
  return out.good();
}

PipelineMetrics &PipelineMetrics::instance() {
  auto &registry = MetricsRegistry::instance();
  static PipelineMetrics metrics{
      registry.create_counter("lms_rows_read_total",
                              "Data rows read from the event source."),
      registry.create_counter("lms_rows_rejected_total",
                              "Data rows excluded by the parser."),
      registry.create_counter("lms_rows_corrected_total",
                              "Data rows kept after a field correction."),
      registry.create_counter("lms_events_parsed_total",
                              "Validated events handed to the metrics stage."),
      registry.create_counter_family("lms_diagnostics_total",
                                     "Diagnostics recorded, by kind.", {}),
      registry.create_gauge("lms_students",
                            "Distinct students in the last run."),
      registry.create_gauge("lms_clustering_effective_k",
                            "Number of clusters used in the last run."),
      registry.create_histogram_family(
          "lms_stage_duration_seconds",
          "Wall time spent in each pipeline stage.")};
  return metrics;
}

prometheus::Histogram &PipelineMetrics::stage_timer(const std::string &stage) {
  static const prometheus::Histogram::BucketBoundaries buckets = {
      0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 10.0};
  return stage_duration.Add({{"stage", stage}}, buckets);
}
