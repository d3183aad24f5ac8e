#ifndef EVENT_HPP
#define EVENT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class EventType {
  LOGIN,
  LOGOUT,
  ASSIGNMENT_SUBMIT,
  QUIZ_ATTEMPT,
  EXAM_START,
  FORUM_POST,
  FORUM_REPLY,
  CONTENT_VIEW,
  DOWNLOAD,

  // Must always be last
  EVENT_TYPE_COUNT
};

// Coarse grouping used by the cohort summary and cohort-level advice
enum class EventCategory {
  LOGIN,
  CONTENT,
  ASSESSMENT,
  SOCIAL,

  EVENT_CATEGORY_COUNT
};

constexpr size_t EVENT_TYPE_COUNT =
    static_cast<size_t>(EventType::EVENT_TYPE_COUNT);
constexpr size_t EVENT_CATEGORY_COUNT =
    static_cast<size_t>(EventCategory::EVENT_CATEGORY_COUNT);

struct Event {
  std::string student_id;
  EventType type = EventType::LOGIN;
  uint64_t timestamp_ms = 0;
  std::string module_id;
  std::string course_id;
  std::optional<double> grade;
  std::optional<double> duration_s;

  // 1-based index of the data row this event was read from
  uint64_t row_index = 0;
};

// Case-insensitive, whitespace-tolerant lookup
std::optional<EventType> event_type_from_string(std::string_view raw);
const char *event_type_to_string(EventType type);

EventCategory event_category(EventType type);
const char *event_category_to_string(EventCategory category);

#endif // EVENT_HPP
