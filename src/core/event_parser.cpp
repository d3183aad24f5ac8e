#include "event_parser.hpp"
#include "core/logger.hpp"
#include "core/schema_error.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

const std::map<std::string, std::string> column_aliases = {
    {"student_id", "student_id"},
    {"student", "student_id"},
    {"event_type", "event_type"},
    {"event_time", "event_time"},
    {"timestamp", "event_time"},
    {"module", "module"},
    {"module_id", "module"},
    {"course", "course"},
    {"course_id", "course"},
    {"grade", "grade"},
    {"activity_duration", "activity_duration"},
    {"duration", "activity_duration"}};

std::string format_number(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}
} // namespace

EventParser::EventParser(Config::ParserConfig config)
    : config_(std::move(config)) {}

std::string EventParser::canonical_column_name(const std::string &raw_name) {
  std::string name = Utils::to_lower_copy(Utils::trim_copy(raw_name));
  // Strip a UTF-8 byte order mark left on the first header cell
  if (name.size() >= 3 && static_cast<unsigned char>(name[0]) == 0xEF &&
      static_cast<unsigned char>(name[1]) == 0xBB &&
      static_cast<unsigned char>(name[2]) == 0xBF)
    name = name.substr(3);

  auto it = column_aliases.find(name);
  if (it != column_aliases.end())
    return it->second;
  return name;
}

ColumnLayout EventParser::parse_header(const std::string &header_line) const {
  auto columns_opt = Utils::split_csv_line(header_line);
  if (!columns_opt)
    throw SchemaError("Header row is not valid CSV: " + header_line);

  ColumnLayout layout;
  layout.column_count = columns_opt->size();

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < columns_opt->size(); ++i) {
    std::string name = canonical_column_name((*columns_opt)[i]);
    if (!seen.insert(name).second) {
      LOG(LogLevel::WARN, LogComponent::PARSER,
          "Duplicate header column '" << name
                                      << "', using the first occurrence.");
      continue;
    }

    if (name == "student_id")
      layout.student_id = i;
    else if (name == "event_type")
      layout.event_type = i;
    else if (name == "event_time")
      layout.event_time = i;
    else if (name == "module")
      layout.module = i;
    else if (name == "course")
      layout.course = i;
    else if (name == "grade")
      layout.grade = i;
    else if (name == "activity_duration")
      layout.duration = i;
  }

  for (const auto &required : config_.required_columns) {
    if (seen.find(canonical_column_name(required)) == seen.end())
      throw SchemaError("Missing required column: " + required);
  }

  return layout;
}

std::optional<Event>
EventParser::parse_row(const std::string &raw_line, const ColumnLayout &layout,
                       uint64_t row_index,
                       std::vector<Diagnostic> &diagnostics) const {
  auto reject = [&](const std::string &reason) -> std::optional<Event> {
    LOG(LogLevel::DEBUG, LogComponent::PARSER,
        "Row " << row_index << " rejected: " << reason);
    diagnostics.push_back(make_row_diagnostic(
        DiagnosticKind::ROW_PARSE_ERROR, row_index, raw_line, reason));
    return std::nullopt;
  };

  auto fields_opt = Utils::split_csv_line(raw_line);
  if (!fields_opt)
    return reject("Unterminated quoted field");

  const auto &fields = *fields_opt;
  if (fields.size() != layout.column_count)
    return reject("Expected " + std::to_string(layout.column_count) +
                  " fields, but found " + std::to_string(fields.size()));

  auto field = [&](const std::optional<size_t> &column) -> std::string {
    if (!column)
      return {};
    return Utils::trim_copy(fields[*column]);
  };

  Event event;
  event.row_index = row_index;

  event.student_id = field(layout.student_id);
  if (event.student_id.empty())
    return reject("Missing student_id");

  std::string type_str = field(layout.event_type);
  auto type_opt = event_type_from_string(type_str);
  if (!type_opt)
    return reject("Unrecognized event_type '" + type_str + "'");
  event.type = *type_opt;

  std::string time_str = field(layout.event_time);
  auto time_opt = Utils::convert_event_time_to_ms(time_str);
  if (!time_opt)
    return reject("Unparseable event_time '" + time_str + "'");
  event.timestamp_ms = *time_opt;

  event.module_id = field(layout.module);
  event.course_id = field(layout.course);

  // --- Optional numeric fields: corrected, never fatal ---
  std::string grade_str = field(layout.grade);
  if (!grade_str.empty() && grade_str != "-") {
    auto grade_opt = Utils::string_to_number<double>(grade_str);
    if (!grade_opt || !std::isfinite(*grade_opt)) {
      diagnostics.push_back(make_row_diagnostic(
          DiagnosticKind::ROW_CORRECTED, row_index, raw_line,
          "Unparseable grade '" + grade_str + "' treated as absent"));
    } else if (*grade_opt < config_.grade_min ||
               *grade_opt > config_.grade_max) {
      diagnostics.push_back(make_row_diagnostic(
          DiagnosticKind::ROW_CORRECTED, row_index, raw_line,
          "Grade " + grade_str + " outside [" +
              format_number(config_.grade_min) + ", " +
              format_number(config_.grade_max) + "] treated as absent"));
    } else {
      event.grade = *grade_opt;
    }
  }

  std::string duration_str = field(layout.duration);
  if (!duration_str.empty() && duration_str != "-") {
    auto duration_opt = Utils::string_to_number<double>(duration_str);
    if (!duration_opt || !std::isfinite(*duration_opt)) {
      diagnostics.push_back(make_row_diagnostic(
          DiagnosticKind::ROW_CORRECTED, row_index, raw_line,
          "Unparseable activity_duration '" + duration_str +
              "' treated as absent"));
    } else if (*duration_opt < 0.0) {
      diagnostics.push_back(make_row_diagnostic(
          DiagnosticKind::ROW_CORRECTED, row_index, raw_line,
          "Negative activity_duration " + duration_str + " clamped to 0"));
      event.duration_s = 0.0;
    } else if (*duration_opt > config_.max_activity_duration_seconds) {
      diagnostics.push_back(make_row_diagnostic(
          DiagnosticKind::ROW_CORRECTED, row_index, raw_line,
          "activity_duration " + duration_str + " above " +
              format_number(config_.max_activity_duration_seconds) +
              " s clamped to the maximum"));
      event.duration_s = config_.max_activity_duration_seconds;
    } else {
      event.duration_s = *duration_opt;
    }
  }

  return event;
}

ParseResult EventParser::parse(std::istream &input) const {
  ParseResult result;

  std::string header_line;
  bool have_header = false;
  while (std::getline(input, header_line)) {
    if (!Utils::trim_copy(header_line).empty()) {
      have_header = true;
      break;
    }
  }
  if (!have_header)
    throw SchemaError("Event source is empty or unreadable (no header row)");

  ColumnLayout layout = parse_header(header_line);
  LOG(LogLevel::DEBUG, LogComponent::PARSER,
      "Header accepted with " << layout.column_count << " columns");

  std::unordered_set<std::string> seen_rows;
  std::string line;
  uint64_t row_index = 0;

  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (Utils::trim_copy(line).empty())
      continue;

    row_index++;
    result.rows_read++;

    if (config_.drop_duplicate_rows && !seen_rows.insert(line).second) {
      result.duplicates_dropped++;
      result.diagnostics.push_back(
          make_row_diagnostic(DiagnosticKind::DUPLICATE_ROW, row_index, line,
                              "Exact duplicate of an earlier row"));
      continue;
    }

    size_t diagnostics_before = result.diagnostics.size();
    auto event_opt = parse_row(line, layout, row_index, result.diagnostics);
    if (!event_opt) {
      result.rows_rejected++;
      continue;
    }
    if (result.diagnostics.size() > diagnostics_before)
      result.rows_corrected++;

    result.events.push_back(std::move(*event_opt));
  }

  if (result.events.empty())
    throw SchemaError("No valid event rows found (" +
                      std::to_string(result.rows_read) + " rows read)");

  std::stable_sort(result.events.begin(), result.events.end(),
                   [](const Event &a, const Event &b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });

  LOG(LogLevel::INFO, LogComponent::PARSER,
      "Parsed " << result.events.size() << " events from " << result.rows_read
                << " rows (" << result.rows_rejected << " rejected, "
                << result.rows_corrected << " corrected, "
                << result.duplicates_dropped << " duplicates)");
  return result;
}

std::vector<Event>
EventParser::filter_by_timeframe(const std::vector<Event> &events,
                                 const std::string &timeframe,
                                 std::vector<Diagnostic> &diagnostics) {
  std::string period = Utils::trim_copy(timeframe);
  if (period.empty())
    return events;

  std::optional<int> year;
  std::optional<int> month;
  auto parts = Utils::split_string(period, '-');
  if (parts.size() == 1 || parts.size() == 2) {
    year = Utils::string_to_number<int>(parts[0]);
    if (parts.size() == 2) {
      month = Utils::string_to_number<int>(parts[1]);
      if (!month || *month < 1 || *month > 12)
        year.reset();
    }
  }

  if (!year || parts[0].size() != 4) {
    LOG(LogLevel::WARN, LogComponent::PARSER,
        "Invalid timeframe format: " << period << ". Using all data.");
    diagnostics.push_back(
        make_diagnostic(DiagnosticKind::INVALID_FILTER, "parser", period,
                        "Invalid timeframe '" + period +
                            "' (expected YYYY or YYYY-MM); using all data"));
    return events;
  }

  std::vector<Event> filtered;
  for (const auto &event : events) {
    if (Utils::year_of(event.timestamp_ms) != *year)
      continue;
    if (month && Utils::month_of_year(event.timestamp_ms) != *month)
      continue;
    filtered.push_back(event);
  }

  LOG(LogLevel::INFO, LogComponent::PARSER,
      "Timeframe " << period << " kept " << filtered.size() << " of "
                   << events.size() << " events");
  return filtered;
}
