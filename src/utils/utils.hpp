#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {

constexpr uint64_t MS_PER_SECOND = 1000;
constexpr uint64_t MS_PER_HOUR = 3600 * MS_PER_SECOND;
constexpr uint64_t MS_PER_DAY = 24 * MS_PER_HOUR;

std::vector<std::string> split_string(const std::string &text, char delimiter);

// Splits one CSV record. Double-quoted fields may contain the delimiter and
// use "" for a literal quote. Returns nullopt on an unterminated quote.
std::optional<std::vector<std::string>> split_csv_line(std::string_view line,
                                                       char delimiter = ',');

// Accepts "YYYY-MM-DD HH:MM:SS" (or 'T' as separator), interpreted as UTC
std::optional<uint64_t> convert_event_time_to_ms(std::string_view time_str);
std::string format_time_ms(uint64_t timestamp_ms);
std::string format_date_ms(uint64_t timestamp_ms);

int hour_of_day(uint64_t timestamp_ms);
// Monday = 0 ... Sunday = 6
int day_of_week(uint64_t timestamp_ms);
int month_of_year(uint64_t timestamp_ms);
int year_of(uint64_t timestamp_ms);
inline uint64_t day_index(uint64_t timestamp_ms) {
  return timestamp_ms / MS_PER_DAY;
}

// Creates the parent directories of `filepath`; true if they exist afterwards
bool create_directory_for_file(const std::string &filepath);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  if (s.front() == '+')
    s.remove_prefix(1);

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
