#include "pipeline.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/log_readers/base_event_reader.hpp"

#include <stdexcept>
#include <utility>

AnalyticsPipeline::AnalyticsPipeline(
    std::shared_ptr<const Config::AppConfig> config)
    : config_(std::move(config)) {
  if (!config_)
    throw std::invalid_argument("AnalyticsPipeline requires a configuration");
}

PipelineResult AnalyticsPipeline::run(IEventReader &reader) const {
  return run(reader.read_all());
}

PipelineResult AnalyticsPipeline::run(ParseResult parsed) const {
  PipelineResult result;
  result.rows_read = parsed.rows_read;
  result.rows_rejected = parsed.rows_rejected;
  result.rows_corrected = parsed.rows_corrected;
  result.duplicates_dropped = parsed.duplicates_dropped;
  result.diagnostics = std::move(parsed.diagnostics);

  std::vector<Event> events = std::move(parsed.events);
  if (!config_->timeframe.empty()) {
    events = EventParser::filter_by_timeframe(events, config_->timeframe,
                                              result.diagnostics);
    if (events.empty()) {
      result.diagnostics.push_back(make_diagnostic(
          DiagnosticKind::INSUFFICIENT_DATA, "parser", config_->timeframe,
          "No events fall inside timeframe " + config_->timeframe));
      LOG(LogLevel::WARN, LogComponent::CORE,
          "Timeframe " << config_->timeframe << " matched no events");
    }
  }
  result.events_analyzed = events.size();

  // --- Metrics ---
  analytics::MetricsEngine metrics_engine(config_->metrics);
  analytics::MetricsResult metrics = metrics_engine.compute(events);
  result.cohort = metrics.cohort;
  result.profiles = std::move(metrics.profiles);
  result.diagnostics.insert(result.diagnostics.end(),
                            metrics.diagnostics.begin(),
                            metrics.diagnostics.end());

  // --- Correlation and clustering, independent of each other ---
  analytics::CorrelationEngine correlation_engine;
  result.correlations = correlation_engine.compute(result.profiles);
  result.diagnostics.insert(result.diagnostics.end(),
                            result.correlations.diagnostics.begin(),
                            result.correlations.diagnostics.end());

  analytics::ClusteringEngine clustering_engine(config_->clustering);
  result.clusters =
      clustering_engine.cluster(result.profiles, config_->clustering.seed);
  result.diagnostics.insert(result.diagnostics.end(),
                            result.clusters.diagnostics.begin(),
                            result.clusters.diagnostics.end());

  // --- Recommendations ---
  analytics::RecommendationEngine recommendation_engine(
      result.profiles, result.correlations, result.clusters,
      config_->recommendation, config_->correlation.significance_threshold);
  result.recommendations = recommendation_engine.recommend_all(result.profiles);
  result.cohort_recommendations =
      analytics::RecommendationEngine::recommend_for_cohort(
          result.cohort, config_->recommendation);

  record_run_metrics(result);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Run complete: " << result.profiles.size() << " students, "
                       << result.events_analyzed << " events, "
                       << result.diagnostics.size() << " diagnostics");
  return result;
}

void AnalyticsPipeline::record_run_metrics(const PipelineResult &result) const {
  if (!config_->prometheus.enabled)
    return;

  auto &metrics = PipelineMetrics::instance();
  metrics.students.Set(static_cast<double>(result.profiles.size()));
  metrics.effective_k.Set(static_cast<double>(result.clusters.effective_k));
  for (const auto &diagnostic : result.diagnostics) {
    metrics.diagnostics
        .Add({{"kind", diagnostic_kind_to_string(diagnostic.kind)}})
        .Increment();
  }
}
