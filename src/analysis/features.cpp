#include "features.hpp"

#include <algorithm>
#include <array>

namespace analytics {

namespace {
struct FeatureInfo {
  const char *name;
  const char *display_name;
  const char *unit;
};

const std::array<FeatureInfo, FEATURE_COUNT> FEATURE_INFO = {{
    {"total_events", "total activity", " events"},
    {"active_days", "number of active days", " days"},
    {"events_per_day", "daily activity", "/day"},
    {"login_rate", "login frequency", "/day"},
    {"content_view_rate", "course material usage", "/day"},
    {"quiz_attempt_rate", "quiz practice", "/day"},
    {"assignment_submit_rate", "assignment submissions", "/day"},
    {"forum_participation_rate", "forum participation", "/day"},
    {"session_count", "number of study sessions", ""},
    {"avg_session_duration", "study session length", " s"},
    {"avg_events_per_session", "activities per session", ""},
    {"total_activity_duration", "total study time", " s"},
    {"early_submission_rate", "early submissions", ""},
    {"weekend_activity_ratio", "weekend activity", ""},
    {"night_activity_ratio", "late-night activity", ""},
    {"activity_regularity", "study regularity", ""},
}};
} // namespace

std::string get_feature_name(Feature f) {
  return FEATURE_INFO[static_cast<size_t>(f)].name;
}

std::string get_feature_display_name(Feature f) {
  return FEATURE_INFO[static_cast<size_t>(f)].display_name;
}

std::string get_feature_unit(Feature f) {
  return FEATURE_INFO[static_cast<size_t>(f)].unit;
}

std::optional<Feature> feature_from_name(const std::string &name) {
  auto it = std::find_if(FEATURE_INFO.begin(), FEATURE_INFO.end(),
                         [&](const FeatureInfo &info) { return name == info.name; });
  if (it == FEATURE_INFO.end())
    return std::nullopt;
  return static_cast<Feature>(std::distance(FEATURE_INFO.begin(), it));
}

} // namespace analytics
