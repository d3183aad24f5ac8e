#ifndef SESSION_FEATURES_HPP
#define SESSION_FEATURES_HPP

#include "analysis/student_profile.hpp"
#include "core/event.hpp"

#include <cstdint>
#include <vector>

namespace analytics {

struct SessionFeatures {
  size_t session_count = 0;
  double avg_session_duration_s = 0.0;
  double avg_events_per_session = 0.0;
};

class SessionFeatureExtractor {
public:
  // Splits chronologically ordered events into sessions. A gap strictly
  // greater than the inactivity threshold starts a new session.
  static std::vector<Session> segment(const std::vector<Event> &events,
                                      uint64_t inactivity_threshold_ms);

  static SessionFeatures extract(const std::vector<Session> &sessions);
};

} // namespace analytics

#endif // SESSION_FEATURES_HPP
