#ifndef EVENT_PARSER_HPP
#define EVENT_PARSER_HPP

#include "core/config.hpp"
#include "core/diagnostics.hpp"
#include "core/event.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

struct ParseResult {
  std::vector<Event> events; // Stably sorted by timestamp
  std::vector<Diagnostic> diagnostics;

  uint64_t rows_read = 0;
  uint64_t rows_rejected = 0;
  uint64_t rows_corrected = 0;
  uint64_t duplicates_dropped = 0;
};

// Position of each recognized column in the header; nullopt when absent
struct ColumnLayout {
  size_t column_count = 0;
  std::optional<size_t> student_id;
  std::optional<size_t> event_type;
  std::optional<size_t> event_time;
  std::optional<size_t> module;
  std::optional<size_t> course;
  std::optional<size_t> grade;
  std::optional<size_t> duration;
};

class EventParser {
public:
  explicit EventParser(Config::ParserConfig config = Config::ParserConfig{});

  // Reads a header line followed by data rows. Bad rows become diagnostics.
  // Throws SchemaError when the source has no header, lacks a required
  // column, or yields no valid row.
  ParseResult parse(std::istream &input) const;

  // Throws SchemaError if a required column is missing
  ColumnLayout parse_header(const std::string &header_line) const;

  // Returns nullopt (and appends a diagnostic) when the row must be excluded.
  // Field corrections are appended as ROW_CORRECTED diagnostics.
  std::optional<Event> parse_row(const std::string &raw_line,
                                 const ColumnLayout &layout,
                                 uint64_t row_index,
                                 std::vector<Diagnostic> &diagnostics) const;

  // Keeps events inside a "YYYY-MM" or "YYYY" timeframe. An invalid
  // timeframe leaves the events untouched and records a diagnostic.
  static std::vector<Event>
  filter_by_timeframe(const std::vector<Event> &events,
                      const std::string &timeframe,
                      std::vector<Diagnostic> &diagnostics);

  // Maps header spellings to their canonical column name
  static std::string canonical_column_name(const std::string &raw_name);

private:
  Config::ParserConfig config_;
};

#endif // EVENT_PARSER_HPP
