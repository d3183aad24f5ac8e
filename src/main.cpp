#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/pipeline.hpp"
#include "core/schema_error.hpp"
#include "io/log_readers/csv_file_event_reader.hpp"
#include "io/result_writers/json_result_writer.hpp"
#include "utils/utils.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace {

void print_summary(const PipelineResult &result) {
  std::cout << "\nLMS analysis summary\n"
            << "  Rows read:        " << result.rows_read << "\n"
            << "  Rows rejected:    " << result.rows_rejected << "\n"
            << "  Students:         " << result.cohort.total_students << "\n"
            << "  Events analyzed:  " << result.events_analyzed << "\n"
            << "  Period:           "
            << (result.events_analyzed > 0
                    ? Utils::format_date_ms(result.cohort.first_event_ms) +
                          " to " +
                          Utils::format_date_ms(result.cohort.last_event_ms)
                    : std::string("none"))
            << "\n"
            << "  Correlation:      "
            << analytics::correlation_status_to_string(
                   result.correlations.status)
            << " (" << result.correlations.sample_size << " graded)\n"
            << "  Clusters:         " << result.clusters.effective_k << "\n"
            << "  Diagnostics:      " << result.diagnostics.size() << "\n";

  for (const auto &cluster : result.clusters.clusters) {
    std::cout << "    [" << cluster.label << "] " << cluster.size()
              << " students: " << cluster.description << "\n";
  }
  if (!result.cohort_recommendations.empty()) {
    std::cout << "  Cohort recommendations:\n";
    for (const auto &rec : result.cohort_recommendations)
      std::cout << "    " << rec.priority << ". " << rec.text << "\n";
  }
  std::cout << std::endl;
}

} // namespace

// Usage: lms_analyzer [config.ini] [events.csv]
int main(int argc, char *argv[]) {
  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();
  if (argc > 2) {
    auto overridden = std::make_shared<Config::AppConfig>(*current_config);
    overridden->input_path = argv[2];
    current_config = overridden;
  }

  // --- Initialize Logging ---
  if (current_config->logging.log_levels.empty())
    LogManager::instance().configure(Config::default_logging_config());
  else
    LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "LMS analyzer starting on " << current_config->input_path);

  PipelineResult result;
  try {
    CsvFileEventReader reader(current_config->input_path,
                              current_config->parser);
    AnalyticsPipeline pipeline(current_config);
    result = pipeline.run(reader);
  } catch (const SchemaError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Run aborted: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  JsonResultWriter writer(current_config->output_path);
  if (!writer.write(result)) {
    std::cerr << "Error: could not write results to "
              << current_config->output_path << std::endl;
    return 1;
  }

  if (current_config->prometheus.enabled &&
      !current_config->metrics_output_path.empty()) {
    if (!MetricsRegistry::instance().write_text_file(
            current_config->metrics_output_path)) {
      std::cerr << "Error: could not write run metrics to "
                << current_config->metrics_output_path << std::endl;
      return 1;
    }
  }

  print_summary(result);
  LOG(LogLevel::INFO, LogComponent::CORE, "LMS analyzer finished.");
  return 0;
}
