#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *INPUT_PATH = "input_path";
constexpr const char *OUTPUT_PATH = "output_path";
constexpr const char *METRICS_OUTPUT_PATH = "metrics_output_path";
constexpr const char *TIMEFRAME = "timeframe";

// Parser Settings
constexpr const char *PA_GRADE_MIN = "grade_min";
constexpr const char *PA_GRADE_MAX = "grade_max";
constexpr const char *PA_REQUIRED_COLUMNS = "required_columns";
constexpr const char *PA_DROP_DUPLICATE_ROWS = "drop_duplicate_rows";
constexpr const char *PA_MAX_ACTIVITY_DURATION_SECONDS =
    "max_activity_duration_seconds";

// Metrics Settings
constexpr const char *ME_SESSION_INACTIVITY_THRESHOLD_SECONDS =
    "session_inactivity_threshold_seconds";
constexpr const char *ME_DEFAULT_WINDOW_DAYS = "default_window_days";
constexpr const char *ME_EARLY_SUBMISSION_MARGIN_HOURS =
    "early_submission_margin_hours";
constexpr const char *ME_REGULARITY_CAP = "regularity_cap";
constexpr const char *ME_WORKER_THREADS = "worker_threads";
constexpr const char *ME_MIN_GRADE_THRESHOLD = "min_grade_threshold";

// Correlation Settings
constexpr const char *CO_SIGNIFICANCE_THRESHOLD = "significance_threshold";

// Clustering Settings
constexpr const char *CL_K = "k";
constexpr const char *CL_AUTO_K = "auto_k";
constexpr const char *CL_K_MIN = "k_min";
constexpr const char *CL_K_MAX = "k_max";
constexpr const char *CL_ELBOW_THRESHOLD = "elbow_threshold";
constexpr const char *CL_MAX_ITERATIONS = "max_iterations";
constexpr const char *CL_N_INIT = "n_init";
constexpr const char *CL_SEED = "seed";
constexpr const char *CL_LABEL_FEATURE_COUNT = "label_feature_count";
constexpr const char *CL_LABEL_MIN_DEVIATION = "label_min_deviation";

// Recommendation Settings
constexpr const char *RE_MAX_RECOMMENDATIONS = "max_recommendations";
constexpr const char *RE_MIN_STANDING_GAP = "min_standing_gap";
constexpr const char *RE_MIN_GRADE_THRESHOLD = "min_grade_threshold";
constexpr const char *RE_GRADE_VARIABILITY_THRESHOLD =
    "grade_variability_threshold";
constexpr const char *RE_GRADE_TREND_THRESHOLD = "grade_trend_threshold";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ParserConfig {
  double grade_min = 0.0;
  double grade_max = 100.0;
  std::vector<std::string> required_columns = {"student_id", "event_type",
                                               "event_time"};
  bool drop_duplicate_rows = true;
  // Longer activity_duration values are clamped with a diagnostic
  double max_activity_duration_seconds = 86400.0;
};

struct MetricsConfig {
  uint64_t session_inactivity_threshold_seconds = 1800; // 30 minutes
  double default_window_days = 1.0;
  double early_submission_margin_hours = 24.0;
  double regularity_cap = 10.0;
  size_t worker_threads = 1;
  double min_grade_threshold = 60.0;
};

struct CorrelationConfig {
  double significance_threshold = 0.2;
};

struct ClusteringConfig {
  size_t k = 3;
  bool auto_k = false;
  size_t k_min = 2;
  size_t k_max = 6;
  double elbow_threshold = 0.1;
  size_t max_iterations = 100;
  size_t n_init = 10;
  uint64_t seed = 42;
  size_t label_feature_count = 2;
  double label_min_deviation = 0.5;
};

struct RecommendationConfig {
  size_t max_recommendations = 5;
  double min_standing_gap = 0.05;

  // Per-student grade rules
  double min_grade_threshold = 60.0;
  double grade_variability_threshold = 15.0; // Sample stddev of grades
  double grade_trend_threshold = 0.1;        // |slope| / stddev
};

struct PrometheusConfig {
  bool enabled = true;
};

struct AppConfig {
  std::string input_path = "data/lms_events.csv";
  std::string output_path = "reports/analysis_results.json";
  std::string metrics_output_path;
  std::string timeframe;

  ParserConfig parser;
  MetricsConfig metrics;
  CorrelationConfig correlation;
  ClusteringConfig clustering;
  RecommendationConfig recommendation;
  LoggingConfig logging;
  PrometheusConfig prometheus;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_parser_config(const ParserConfig &config,
                            std::vector<std::string> &errors);
bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors);
bool validate_clustering_config(const ClusteringConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Default log levels used when no [Logging] section overrides them
LoggingConfig default_logging_config();

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
