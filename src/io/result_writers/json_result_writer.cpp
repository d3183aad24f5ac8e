#include "json_result_writer.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <fstream>

JsonResultWriter::JsonResultWriter(const std::string &file_path)
    : output_path_(file_path) {}

bool JsonResultWriter::write(const PipelineResult &result) const {
  if (output_path_.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "No output path configured for the result document");
    return false;
  }
  if (!Utils::create_directory_for_file(output_path_)) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Could not create directory for result file: " << output_path_);
    return false;
  }

  std::ofstream out(output_path_, std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Could not open result file: " << output_path_);
    return false;
  }

  try {
    out << JsonFormatter::format_result_to_json(result) << std::endl;
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Failed to serialize results: " << e.what());
    return false;
  }

  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WRITER,
        "Failed to write result file: " << output_path_);
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::IO_WRITER,
      "Results written to " << output_path_);
  return true;
}
