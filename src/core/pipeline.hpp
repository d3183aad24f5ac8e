#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "analysis/clustering_engine.hpp"
#include "analysis/correlation_engine.hpp"
#include "analysis/metrics_engine.hpp"
#include "analysis/recommendation_engine.hpp"
#include "core/config.hpp"
#include "core/diagnostics.hpp"
#include "core/event_parser.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

class IEventReader;

struct PipelineResult {
  // Input accounting
  uint64_t rows_read = 0;
  uint64_t rows_rejected = 0;
  uint64_t rows_corrected = 0;
  uint64_t duplicates_dropped = 0;
  size_t events_analyzed = 0;

  analytics::CohortSummary cohort;
  std::map<std::string, analytics::StudentProfile> profiles;
  analytics::CorrelationResult correlations;
  analytics::ClusterAssignment clusters;
  std::map<std::string, std::vector<analytics::Recommendation>>
      recommendations;
  std::vector<analytics::Recommendation> cohort_recommendations;

  // Parser, metrics, correlation and clustering diagnostics, in that order
  std::vector<Diagnostic> diagnostics;
};

// Owns one run: parse -> metrics -> {correlation, clustering} ->
// recommendations. Nothing is kept between runs.
class AnalyticsPipeline {
public:
  explicit AnalyticsPipeline(std::shared_ptr<const Config::AppConfig> config);

  // Throws SchemaError if the reader cannot produce any events
  PipelineResult run(IEventReader &reader) const;
  PipelineResult run(ParseResult parsed) const;

private:
  void record_run_metrics(const PipelineResult &result) const;

  std::shared_ptr<const Config::AppConfig> config_;
};

#endif // PIPELINE_HPP
