#ifndef CSV_FILE_EVENT_READER_HPP
#define CSV_FILE_EVENT_READER_HPP

#include "base_event_reader.hpp"
#include "core/config.hpp"

#include <fstream>
#include <string>

// An implementation of IEventReader that reads an LMS export from a CSV file
class CsvFileEventReader : public IEventReader {
public:
  CsvFileEventReader(const std::string &filepath,
                     const Config::ParserConfig &parser_config);
  ~CsvFileEventReader() override;

  ParseResult read_all() override;
  bool is_open() const;

private:
  std::string filepath_;
  std::ifstream file_stream_;
  EventParser parser_;
};

#endif // CSV_FILE_EVENT_READER_HPP
