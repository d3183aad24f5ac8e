#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace analytics {

enum class Feature {
  // --- Volume ---
  TOTAL_EVENTS,
  ACTIVE_DAYS,
  EVENTS_PER_DAY,

  // --- Per-day activity rates ---
  LOGIN_RATE,
  CONTENT_VIEW_RATE,
  QUIZ_ATTEMPT_RATE,
  ASSIGNMENT_SUBMIT_RATE,
  FORUM_PARTICIPATION_RATE,

  // --- Session-derived ---
  SESSION_COUNT,
  AVG_SESSION_DURATION,
  AVG_EVENTS_PER_SESSION,
  TOTAL_ACTIVITY_DURATION,

  // --- Timing behaviour ---
  EARLY_SUBMISSION_RATE,
  WEEKEND_ACTIVITY_RATIO,
  NIGHT_ACTIVITY_RATIO,
  ACTIVITY_REGULARITY,

  // This must always be the last item. It automatically provides the total
  // count.
  FEATURE_COUNT
};

constexpr size_t FEATURE_COUNT = static_cast<size_t>(Feature::FEATURE_COUNT);

// Machine name, e.g. "forum_participation_rate"
std::string get_feature_name(Feature f);
// Human-readable name, e.g. "forum participation rate"
std::string get_feature_display_name(Feature f);
// Unit suffix used when quoting values in text, e.g. "/day"
std::string get_feature_unit(Feature f);
std::optional<Feature> feature_from_name(const std::string &name);

inline Feature feature_at(size_t index) { return static_cast<Feature>(index); }

// Same features in the same order for every student. Unset values are 0.
struct FeatureVector {
  std::vector<double> values = std::vector<double>(FEATURE_COUNT, 0.0);

  double get(Feature f) const { return values[static_cast<size_t>(f)]; }
  void set(Feature f, double value) { values[static_cast<size_t>(f)] = value; }
};

} // namespace analytics

#endif // FEATURES_HPP
