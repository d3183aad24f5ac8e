#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.writer", LogComponent::IO_WRITER},
    {"parser", LogComponent::PARSER},
    {"metrics.aggregate", LogComponent::METRICS},
    {"metrics.session", LogComponent::METRICS_SESSION},
    {"correlation", LogComponent::CORRELATION},
    {"clustering", LogComponent::CLUSTERING},
    {"recommend", LogComponent::RECOMMEND}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

LoggingConfig default_logging_config() {
  LoggingConfig logging;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  return logging;
}

bool validate_parser_config(const ParserConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (!std::isfinite(config.grade_min) || !std::isfinite(config.grade_max) ||
      config.grade_min >= config.grade_max) {
    errors.push_back("Parser grade_min must be finite and below grade_max");
    valid = false;
  }

  if (!std::isfinite(config.max_activity_duration_seconds) ||
      config.max_activity_duration_seconds <= 0.0) {
    errors.push_back(
        "Parser max_activity_duration_seconds must be a positive number");
    valid = false;
  }

  if (config.required_columns.empty()) {
    errors.push_back("Parser required_columns cannot be empty");
    valid = false;
  }

  for (const char *mandatory : {"student_id", "event_type", "event_time"}) {
    if (std::find(config.required_columns.begin(),
                  config.required_columns.end(),
                  mandatory) == config.required_columns.end()) {
      errors.push_back(std::string("Parser required_columns must include '") +
                       mandatory + "'");
      valid = false;
    }
  }

  return valid;
}

bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.session_inactivity_threshold_seconds < 1 ||
      config.session_inactivity_threshold_seconds > 86400) {
    errors.push_back("Metrics session inactivity threshold must be between 1 "
                     "and 86400 seconds");
    valid = false;
  }

  if (!(config.default_window_days > 0.0)) {
    errors.push_back("Metrics default window must be a positive number of days");
    valid = false;
  }

  if (config.early_submission_margin_hours < 0.0) {
    errors.push_back("Metrics early submission margin cannot be negative");
    valid = false;
  }

  if (!(config.regularity_cap > 0.0)) {
    errors.push_back("Metrics regularity cap must be positive");
    valid = false;
  }

  if (config.worker_threads < 1 || config.worker_threads > 64) {
    errors.push_back("Metrics worker threads must be between 1 and 64");
    valid = false;
  }

  return valid;
}

bool validate_clustering_config(const ClusteringConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.k < 1) {
    errors.push_back("Clustering k must be at least 1");
    valid = false;
  }

  if (config.auto_k && (config.k_min < 1 || config.k_min > config.k_max)) {
    errors.push_back("Clustering k_min must be at least 1 and not above k_max");
    valid = false;
  }

  if (config.max_iterations < 1 || config.max_iterations > 10000) {
    errors.push_back("Clustering max iterations must be between 1 and 10000");
    valid = false;
  }

  if (config.n_init < 1 || config.n_init > 100) {
    errors.push_back("Clustering n_init must be between 1 and 100");
    valid = false;
  }

  if (config.elbow_threshold <= 0.0 || config.elbow_threshold >= 1.0) {
    errors.push_back("Clustering elbow threshold must be between 0 and 1");
    valid = false;
  }

  if (config.label_min_deviation < 0.0) {
    errors.push_back("Clustering label min deviation cannot be negative");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_parser_config(config.parser, errors);
  valid &= validate_metrics_config(config.metrics, errors);
  valid &= validate_clustering_config(config.clustering, errors);

  if (config.correlation.significance_threshold < 0.0 ||
      config.correlation.significance_threshold >= 1.0) {
    errors.push_back(
        "Correlation significance threshold must be in [0, 1)");
    valid = false;
  }

  if (config.recommendation.max_recommendations < 1 ||
      config.recommendation.max_recommendations > 50) {
    errors.push_back("Recommendation cap must be between 1 and 50");
    valid = false;
  }

  if (config.recommendation.min_standing_gap < 0.0) {
    errors.push_back("Recommendation min standing gap cannot be negative");
    valid = false;
  }

  if (!std::isfinite(config.recommendation.min_grade_threshold)) {
    errors.push_back("Recommendation min grade threshold must be finite");
    valid = false;
  }

  if (config.recommendation.grade_variability_threshold < 0.0 ||
      config.recommendation.grade_trend_threshold < 0.0) {
    errors.push_back(
        "Recommendation grade variability and trend thresholds cannot be "
        "negative");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging = default_logging_config();

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::INPUT_PATH)
          config.input_path = value;
        else if (key == Keys::OUTPUT_PATH)
          config.output_path = value;
        else if (key == Keys::METRICS_OUTPUT_PATH)
          config.metrics_output_path = value;
        else if (key == Keys::TIMEFRAME)
          config.timeframe = value;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown key '" << key << "' ignored." << std::endl;

        // Parser settings
      } else if (current_section == "Parser") {
        if (key == Keys::PA_GRADE_MIN)
          config.parser.grade_min =
              Utils::string_to_number<double>(value).value_or(
                  config.parser.grade_min);
        else if (key == Keys::PA_GRADE_MAX)
          config.parser.grade_max =
              Utils::string_to_number<double>(value).value_or(
                  config.parser.grade_max);
        else if (key == Keys::PA_REQUIRED_COLUMNS) {
          std::vector<std::string> columns;
          for (const auto &column : Utils::split_string(value, ',')) {
            std::string normalized = Utils::to_lower_copy(Utils::trim_copy(column));
            if (!normalized.empty())
              columns.push_back(normalized);
          }
          if (!columns.empty())
            config.parser.required_columns = columns;
        } else if (key == Keys::PA_DROP_DUPLICATE_ROWS)
          config.parser.drop_duplicate_rows = string_to_bool(value);
        else if (key == Keys::PA_MAX_ACTIVITY_DURATION_SECONDS)
          config.parser.max_activity_duration_seconds =
              Utils::string_to_number<double>(value).value_or(
                  config.parser.max_activity_duration_seconds);

        // Metrics settings
      } else if (current_section == "Metrics") {
        if (key == Keys::ME_SESSION_INACTIVITY_THRESHOLD_SECONDS)
          config.metrics.session_inactivity_threshold_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.metrics.session_inactivity_threshold_seconds);
        else if (key == Keys::ME_DEFAULT_WINDOW_DAYS)
          config.metrics.default_window_days =
              Utils::string_to_number<double>(value).value_or(
                  config.metrics.default_window_days);
        else if (key == Keys::ME_EARLY_SUBMISSION_MARGIN_HOURS)
          config.metrics.early_submission_margin_hours =
              Utils::string_to_number<double>(value).value_or(
                  config.metrics.early_submission_margin_hours);
        else if (key == Keys::ME_REGULARITY_CAP)
          config.metrics.regularity_cap =
              Utils::string_to_number<double>(value).value_or(
                  config.metrics.regularity_cap);
        else if (key == Keys::ME_WORKER_THREADS)
          config.metrics.worker_threads =
              Utils::string_to_number<size_t>(value).value_or(
                  config.metrics.worker_threads);
        else if (key == Keys::ME_MIN_GRADE_THRESHOLD)
          config.metrics.min_grade_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.metrics.min_grade_threshold);

        // Correlation settings
      } else if (current_section == "Correlation") {
        if (key == Keys::CO_SIGNIFICANCE_THRESHOLD)
          config.correlation.significance_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.correlation.significance_threshold);

        // Clustering settings
      } else if (current_section == "Clustering") {
        if (key == Keys::CL_K)
          config.clustering.k = Utils::string_to_number<size_t>(value).value_or(
              config.clustering.k);
        else if (key == Keys::CL_AUTO_K)
          config.clustering.auto_k = string_to_bool(value);
        else if (key == Keys::CL_K_MIN)
          config.clustering.k_min =
              Utils::string_to_number<size_t>(value).value_or(
                  config.clustering.k_min);
        else if (key == Keys::CL_K_MAX)
          config.clustering.k_max =
              Utils::string_to_number<size_t>(value).value_or(
                  config.clustering.k_max);
        else if (key == Keys::CL_ELBOW_THRESHOLD)
          config.clustering.elbow_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.clustering.elbow_threshold);
        else if (key == Keys::CL_MAX_ITERATIONS)
          config.clustering.max_iterations =
              Utils::string_to_number<size_t>(value).value_or(
                  config.clustering.max_iterations);
        else if (key == Keys::CL_N_INIT)
          config.clustering.n_init =
              Utils::string_to_number<size_t>(value).value_or(
                  config.clustering.n_init);
        else if (key == Keys::CL_SEED)
          config.clustering.seed =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.clustering.seed);
        else if (key == Keys::CL_LABEL_FEATURE_COUNT)
          config.clustering.label_feature_count =
              Utils::string_to_number<size_t>(value).value_or(
                  config.clustering.label_feature_count);
        else if (key == Keys::CL_LABEL_MIN_DEVIATION)
          config.clustering.label_min_deviation =
              Utils::string_to_number<double>(value).value_or(
                  config.clustering.label_min_deviation);

        // Recommendation settings
      } else if (current_section == "Recommendation") {
        if (key == Keys::RE_MAX_RECOMMENDATIONS)
          config.recommendation.max_recommendations =
              Utils::string_to_number<size_t>(value).value_or(
                  config.recommendation.max_recommendations);
        else if (key == Keys::RE_MIN_STANDING_GAP)
          config.recommendation.min_standing_gap =
              Utils::string_to_number<double>(value).value_or(
                  config.recommendation.min_standing_gap);
        else if (key == Keys::RE_MIN_GRADE_THRESHOLD)
          config.recommendation.min_grade_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.recommendation.min_grade_threshold);
        else if (key == Keys::RE_GRADE_VARIABILITY_THRESHOLD)
          config.recommendation.grade_variability_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.recommendation.grade_variability_threshold);
        else if (key == Keys::RE_GRADE_TREND_THRESHOLD)
          config.recommendation.grade_trend_threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.recommendation.grade_trend_threshold);

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "metrics.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }

        // Prometheus Settings
      } else if (current_section == "Prometheus") {
        if (key == Keys::PROMETHEUS_ENABLED)
          config.prometheus.enabled = string_to_bool(value);
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
