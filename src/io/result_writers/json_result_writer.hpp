#ifndef JSON_RESULT_WRITER_HPP
#define JSON_RESULT_WRITER_HPP

#include "core/pipeline.hpp"

#include <string>

// Writes the complete result document of one run to a file
class JsonResultWriter {
public:
  explicit JsonResultWriter(const std::string &file_path);

  bool write(const PipelineResult &result) const;
  const std::string &path() const { return output_path_; }

private:
  std::string output_path_;
};

#endif // JSON_RESULT_WRITER_HPP
