#include "utils.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

namespace {

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return days[month - 1];
}

std::tm to_utc_tm(uint64_t timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / MS_PER_SECOND);
  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &seconds);
#else
  gmtime_r(&seconds, &t);
#endif
  return t;
}

// Parses exactly `width` decimal digits starting at `pos`
std::optional<int> read_fixed_digits(std::string_view s, size_t pos,
                                     size_t width) {
  if (pos + width > s.size())
    return std::nullopt;
  int value = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return std::nullopt;
    value = value * 10 + (s[i] - '0');
  }
  return value;
}
} // namespace

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::optional<std::vector<std::string>> split_csv_line(std::string_view line,
                                                       char delimiter) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      fields.push_back(std::move(current));
      current.clear();
    } else if (c != '\r') {
      current.push_back(c);
    }
  }

  if (in_quotes)
    return std::nullopt;

  fields.push_back(std::move(current));
  return fields;
}

std::optional<uint64_t> convert_event_time_to_ms(std::string_view time_str) {
  // Expected format: 2024-01-15 09:30:00
  std::string trimmed = trim_copy(time_str);
  std::string_view s(trimmed);
  if (s.size() != 19)
    return std::nullopt;
  if (s[4] != '-' || s[7] != '-' || (s[10] != ' ' && s[10] != 'T') ||
      s[13] != ':' || s[16] != ':')
    return std::nullopt;

  auto year = read_fixed_digits(s, 0, 4);
  auto month = read_fixed_digits(s, 5, 2);
  auto day = read_fixed_digits(s, 8, 2);
  auto hour = read_fixed_digits(s, 11, 2);
  auto minute = read_fixed_digits(s, 14, 2);
  auto second = read_fixed_digits(s, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second)
    return std::nullopt;

  if (*year < 1970 || *month < 1 || *month > 12 || *day < 1 ||
      *day > days_in_month(*year, *month) || *hour > 23 || *minute > 59 ||
      *second > 59)
    return std::nullopt;

  std::tm t{};
  t.tm_year = *year - 1900;
  t.tm_mon = *month - 1;
  t.tm_mday = *day;
  t.tm_hour = *hour;
  t.tm_min = *minute;
  t.tm_sec = *second;

  // timegm treats the tm struct as UTC, avoiding the local timezone
#if defined(_WIN32)
  std::time_t epoch_seconds = _mkgmtime(&t);
#else
  std::time_t epoch_seconds = timegm(&t);
#endif

  if (epoch_seconds < 0)
    return std::nullopt;

  return static_cast<uint64_t>(epoch_seconds) * MS_PER_SECOND;
}

std::string format_time_ms(uint64_t timestamp_ms) {
  std::tm t = to_utc_tm(timestamp_ms);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &t);
  return buffer;
}

std::string format_date_ms(uint64_t timestamp_ms) {
  std::tm t = to_utc_tm(timestamp_ms);
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &t);
  return buffer;
}

int hour_of_day(uint64_t timestamp_ms) { return to_utc_tm(timestamp_ms).tm_hour; }

int day_of_week(uint64_t timestamp_ms) {
  // tm_wday counts from Sunday
  return (to_utc_tm(timestamp_ms).tm_wday + 6) % 7;
}

int month_of_year(uint64_t timestamp_ms) {
  return to_utc_tm(timestamp_ms).tm_mon + 1;
}

int year_of(uint64_t timestamp_ms) {
  return to_utc_tm(timestamp_ms).tm_year + 1900;
}

bool create_directory_for_file(const std::string &filepath) {
  std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
  if (parent.empty())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec && std::filesystem::is_directory(parent);
}
} // namespace Utils
