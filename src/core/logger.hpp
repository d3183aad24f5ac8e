#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// One entry per pipeline stage so verbosity can be tuned stage by stage
enum class LogComponent {
  CORE,
  CONFIG,

  IO_READER,
  IO_WRITER,

  PARSER,
  METRICS,
  METRICS_SESSION,
  CORRELATION,
  CLUSTERING,
  RECOMMEND
};

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "core";
  case LogComponent::CONFIG:
    return "config";
  case LogComponent::IO_READER:
    return "io.reader";
  case LogComponent::IO_WRITER:
    return "io.writer";
  case LogComponent::PARSER:
    return "parser";
  case LogComponent::METRICS:
    return "metrics.aggregate";
  case LogComponent::METRICS_SESSION:
    return "metrics.session";
  case LogComponent::CORRELATION:
    return "correlation";
  case LogComponent::CLUSTERING:
    return "clustering";
  case LogComponent::RECOMMEND:
    return "recommend";
  }
  return "general";
}

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  // Redirects all log lines; the stream must outlive every later LOG call.
  void set_sink(std::ostream &sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &sink;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;
    return level >= it->second;
  }

  void write(LogLevel level, LogComponent component, const char *file,
             int line, const std::string &message) {
    auto now = std::chrono::system_clock::now();
    std::time_t time_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm utc{};
    gmtime_r(&time_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << ms.count() << "Z "
        << "[" << level_to_string(level) << "] "
        << "[" << component_to_string(component) << "] "
        << "[" << file << ":" << line << "] " << message << '\n';

    // Worker threads log concurrently; keep each line whole
    std::lock_guard<std::mutex> lock(mutex_);
    *sink_ << oss.str() << std::flush;
  }

private:
  LogManager() = default;

  mutable std::mutex mutex_;
  std::map<LogComponent, LogLevel> log_levels_;
  std::ostream *sink_ = &std::clog;
};

// Macro form keeps the message expression unevaluated when the level is off.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      std::ostringstream log_stream_;                                          \
      log_stream_ << message;                                                  \
      LogManager::instance().write(level, component, __FILE__, __LINE__,       \
                                   log_stream_.str());                         \
    }                                                                          \
  } while (0)

#endif // LOGGER_HPP
