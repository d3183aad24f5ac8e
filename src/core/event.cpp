#include "event.hpp"
#include "utils/utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace {
constexpr std::array<const char *, EVENT_TYPE_COUNT> EVENT_TYPE_NAMES = {
    "login",        "logout",     "assignment_submit",
    "quiz_attempt", "exam_start", "forum_post",
    "forum_reply",  "content_view", "download"};
} // namespace

std::optional<EventType> event_type_from_string(std::string_view raw) {
  std::string normalized = Utils::to_lower_copy(Utils::trim_copy(raw));
  for (size_t i = 0; i < EVENT_TYPE_NAMES.size(); ++i) {
    if (normalized == EVENT_TYPE_NAMES[i])
      return static_cast<EventType>(i);
  }
  return std::nullopt;
}

const char *event_type_to_string(EventType type) {
  size_t index = static_cast<size_t>(type);
  if (index < EVENT_TYPE_NAMES.size())
    return EVENT_TYPE_NAMES[index];
  return "unknown";
}

EventCategory event_category(EventType type) {
  switch (type) {
  case EventType::LOGIN:
  case EventType::LOGOUT:
    return EventCategory::LOGIN;
  case EventType::CONTENT_VIEW:
  case EventType::DOWNLOAD:
    return EventCategory::CONTENT;
  case EventType::ASSIGNMENT_SUBMIT:
  case EventType::QUIZ_ATTEMPT:
  case EventType::EXAM_START:
    return EventCategory::ASSESSMENT;
  case EventType::FORUM_POST:
  case EventType::FORUM_REPLY:
    return EventCategory::SOCIAL;
  case EventType::EVENT_TYPE_COUNT:
    break;
  }
  return EventCategory::LOGIN;
}

const char *event_category_to_string(EventCategory category) {
  switch (category) {
  case EventCategory::LOGIN:
    return "login";
  case EventCategory::CONTENT:
    return "content_interaction";
  case EventCategory::ASSESSMENT:
    return "assessment";
  case EventCategory::SOCIAL:
    return "social";
  case EventCategory::EVENT_CATEGORY_COUNT:
    break;
  }
  return "other";
}
