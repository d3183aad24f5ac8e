#ifndef METRICS_ENGINE_HPP
#define METRICS_ENGINE_HPP

#include "analysis/student_profile.hpp"
#include "core/config.hpp"
#include "core/diagnostics.hpp"
#include "core/event.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace analytics {

struct GradeStats {
  size_t count = 0;
  double mean = 0.0;
  double median = 0.0;
  double stddev = 0.0; // Sample standard deviation
  double min = 0.0;
  double max = 0.0;
};

struct CohortSummary {
  size_t total_students = 0;
  size_t total_events = 0;
  double avg_events_per_student = 0.0;

  std::array<size_t, EVENT_TYPE_COUNT> event_type_counts{};
  std::array<size_t, EVENT_CATEGORY_COUNT> event_category_counts{};
  std::array<size_t, 24> hourly_distribution{};
  std::array<size_t, 7> weekday_distribution{}; // Monday = 0

  uint64_t first_event_ms = 0;
  uint64_t last_event_ms = 0;

  std::optional<GradeStats> grade_stats;
  size_t graded_students = 0;
  size_t students_below_grade_threshold = 0;
  double weekend_activity_share = 0.0;

  size_t category_count(EventCategory category) const {
    return event_category_counts[static_cast<size_t>(category)];
  }
};

struct MetricsResult {
  CohortSummary cohort;
  // Keyed by student id, so iteration is in id order
  std::map<std::string, StudentProfile> profiles;
  std::vector<Diagnostic> diagnostics;

  const StudentProfile *find(const std::string &student_id) const;
};

// Latest assignment_submit per (course, module), used as the deadline proxy
using DeadlineMap = std::map<std::pair<std::string, std::string>, uint64_t>;

class MetricsEngine {
public:
  explicit MetricsEngine(Config::MetricsConfig config = Config::MetricsConfig{});

  // Events must be in chronological order, as produced by the parser.
  MetricsResult compute(const std::vector<Event> &events) const;

  // Inverse coefficient of variation of inter-event gaps, capped at `cap`.
  // `degeneracy` receives a note when a neutral value was substituted.
  static double compute_regularity(const std::vector<Event> &events, double cap,
                                   std::string *degeneracy = nullptr);

  static DeadlineMap build_deadline_map(const std::vector<Event> &events);

  static GradeStats compute_grade_stats(std::vector<double> grades);

private:
  void compute_student(StudentProfile &profile, const DeadlineMap &deadlines,
                       std::vector<Diagnostic> &diagnostics) const;

  CohortSummary
  summarize_cohort(const std::vector<Event> &events,
                   const std::map<std::string, StudentProfile> &profiles) const;

  Config::MetricsConfig config_;
};

} // namespace analytics

#endif // METRICS_ENGINE_HPP
