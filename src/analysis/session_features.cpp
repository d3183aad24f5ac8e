#include "analysis/session_features.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cstddef>

namespace analytics {

namespace {
// Kept in double seconds; activity durations may exceed any integer ms range
double event_end_offset_s(const Event &event, uint64_t session_start_ms) {
  double offset_s =
      static_cast<double>(event.timestamp_ms - session_start_ms) / 1000.0;
  return offset_s + std::max(0.0, event.duration_s.value_or(0.0));
}

Session open_session(const Event &event) {
  Session session;
  session.start_ms = event.timestamp_ms;
  session.last_event_ms = event.timestamp_ms;
  session.span_s = event_end_offset_s(event, event.timestamp_ms);
  session.event_count = 1;
  return session;
}
} // namespace

std::vector<Session>
SessionFeatureExtractor::segment(const std::vector<Event> &events,
                                 uint64_t inactivity_threshold_ms) {
  std::vector<Session> sessions;
  if (events.empty())
    return sessions;

  Session current = open_session(events.front());

  for (size_t i = 1; i < events.size(); ++i) {
    const auto &event = events[i];
    uint64_t gap_ms = event.timestamp_ms - events[i - 1].timestamp_ms;
    if (gap_ms > inactivity_threshold_ms) {
      sessions.push_back(current);
      current = open_session(event);
      continue;
    }
    current.last_event_ms = event.timestamp_ms;
    current.span_s =
        std::max(current.span_s, event_end_offset_s(event, current.start_ms));
    current.event_count++;
  }
  sessions.push_back(current);

  LOG(LogLevel::TRACE, LogComponent::METRICS_SESSION,
      "Segmented " << events.size() << " events into " << sessions.size()
                   << " sessions");
  return sessions;
}

SessionFeatures
SessionFeatureExtractor::extract(const std::vector<Session> &sessions) {
  SessionFeatures features;
  if (sessions.empty())
    return features;

  double total_duration_s = 0.0;
  size_t total_events = 0;
  for (const auto &session : sessions) {
    total_duration_s += session.duration_s();
    total_events += session.event_count;
  }

  features.session_count = sessions.size();
  features.avg_session_duration_s = total_duration_s / sessions.size();
  features.avg_events_per_session =
      static_cast<double>(total_events) / sessions.size();
  return features;
}

} // namespace analytics
