#ifndef STUDENT_PROFILE_HPP
#define STUDENT_PROFILE_HPP

#include "analysis/features.hpp"
#include "core/event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace analytics {

struct Session {
  uint64_t start_ms = 0;
  uint64_t last_event_ms = 0;
  // Seconds from start_ms to the latest timestamp + activity duration
  double span_s = 0.0;
  size_t event_count = 0;

  double duration_s() const { return span_s; }
};

struct StudentProfile {
  std::string student_id;
  std::vector<Event> events; // Chronological
  std::vector<Session> sessions;
  FeatureVector features;

  // Mean of all valid grades; absent when the student has no graded event
  std::optional<double> final_grade;
  size_t graded_event_count = 0;
};

} // namespace analytics

#endif // STUDENT_PROFILE_HPP
