#include "csv_file_event_reader.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/schema_error.hpp"
#include "utils/scoped_timer.hpp"

#include <string>

CsvFileEventReader::CsvFileEventReader(
    const std::string &filepath, const Config::ParserConfig &parser_config)
    : filepath_(filepath), parser_(parser_config) {
  file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Failed to open event source file: " << filepath);
    throw SchemaError("Failed to open event source file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened event file: " << filepath);
}

CsvFileEventReader::~CsvFileEventReader() {
  if (file_stream_.is_open())
    file_stream_.close();
}

bool CsvFileEventReader::is_open() const { return file_stream_.is_open(); }

ParseResult CsvFileEventReader::read_all() {
  auto &metrics = PipelineMetrics::instance();
  ScopedTimer timer(metrics.stage_timer("parse"));

  ParseResult result = parser_.parse(file_stream_);

  metrics.rows_read.Increment(static_cast<double>(result.rows_read));
  metrics.rows_rejected.Increment(
      static_cast<double>(result.rows_rejected + result.duplicates_dropped));
  metrics.rows_corrected.Increment(static_cast<double>(result.rows_corrected));
  metrics.events_parsed.Increment(static_cast<double>(result.events.size()));

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << result.events.size() << " events from " << filepath_);
  return result;
}
