#include "analysis/metrics_engine.hpp"
#include "analysis/session_features.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/stats_tracker.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>
#include <thread>

namespace analytics {

namespace {

bool is_weekend(uint64_t timestamp_ms) {
  return Utils::day_of_week(timestamp_ms) >= 5;
}

// 22:00 through 04:59
bool is_night(uint64_t timestamp_ms) {
  int hour = Utils::hour_of_day(timestamp_ms);
  return hour >= 22 || hour < 5;
}

std::string format_feature_vector(const FeatureVector &features) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < features.values.size(); ++i) {
    oss << features.values[i] << (i == features.values.size() - 1 ? "" : ", ");
  }
  oss << "]";
  return oss.str();
}

} // namespace

const StudentProfile *
MetricsResult::find(const std::string &student_id) const {
  auto it = profiles.find(student_id);
  return it == profiles.end() ? nullptr : &it->second;
}

MetricsEngine::MetricsEngine(Config::MetricsConfig config)
    : config_(std::move(config)) {}

DeadlineMap MetricsEngine::build_deadline_map(const std::vector<Event> &events) {
  DeadlineMap deadlines;
  for (const auto &event : events) {
    if (event.type != EventType::ASSIGNMENT_SUBMIT)
      continue;
    auto key = std::make_pair(event.course_id, event.module_id);
    auto it = deadlines.find(key);
    if (it == deadlines.end())
      deadlines.emplace(key, event.timestamp_ms);
    else
      it->second = std::max(it->second, event.timestamp_ms);
  }
  return deadlines;
}

double MetricsEngine::compute_regularity(const std::vector<Event> &events,
                                         double cap, std::string *degeneracy) {
  if (events.size() < 2)
    return 0.0;

  StatsTracker gaps;
  for (size_t i = 1; i < events.size(); ++i) {
    uint64_t gap_ms = events[i].timestamp_ms - events[i - 1].timestamp_ms;
    gaps.update(static_cast<double>(gap_ms) / Utils::MS_PER_SECOND);
  }

  double mean = gaps.get_mean();
  double stddev = gaps.get_population_stddev();

  if (mean <= 0.0) {
    if (degeneracy)
      *degeneracy = "All events share one timestamp; regularity set to 0";
    return 0.0;
  }
  if (stddev <= 0.0) {
    if (degeneracy)
      *degeneracy = "Inter-event gaps have zero variance; regularity set to "
                    "the cap";
    return cap;
  }
  return std::min(mean / stddev, cap);
}

GradeStats MetricsEngine::compute_grade_stats(std::vector<double> grades) {
  GradeStats stats;
  if (grades.empty())
    return stats;

  StatsTracker tracker;
  for (double grade : grades)
    tracker.update(grade);

  std::sort(grades.begin(), grades.end());
  size_t mid = grades.size() / 2;
  stats.median = grades.size() % 2 == 0
                     ? (grades[mid - 1] + grades[mid]) / 2.0
                     : grades[mid];
  stats.count = grades.size();
  stats.mean = tracker.get_mean();
  stats.stddev = tracker.get_stddev();
  stats.min = tracker.get_min();
  stats.max = tracker.get_max();
  return stats;
}

void MetricsEngine::compute_student(StudentProfile &profile,
                                    const DeadlineMap &deadlines,
                                    std::vector<Diagnostic> &diagnostics) const {
  const auto &events = profile.events;
  FeatureVector &features = profile.features;
  if (events.empty())
    return;

  // --- Observation window ---
  double window_days = config_.default_window_days;
  uint64_t span_ms = events.back().timestamp_ms - events.front().timestamp_ms;
  if (events.size() > 1) {
    if (span_ms == 0) {
      diagnostics.push_back(make_diagnostic(
          DiagnosticKind::NUMERIC_DEGENERACY, "metrics", profile.student_id,
          "Observation window is zero; default window used for rates"));
      LOG(LogLevel::WARN, LogComponent::METRICS,
          "Student " << profile.student_id
                     << " has a zero-length observation window");
    } else {
      window_days = static_cast<double>(span_ms) / Utils::MS_PER_DAY;
    }
  }

  // --- Counting pass ---
  std::array<size_t, EVENT_TYPE_COUNT> type_counts{};
  std::set<uint64_t> days;
  size_t weekend_events = 0;
  size_t night_events = 0;
  size_t submissions = 0;
  size_t early_submissions = 0;
  double total_duration_s = 0.0;
  double grade_sum = 0.0;
  uint64_t margin_ms = static_cast<uint64_t>(
      std::llround(config_.early_submission_margin_hours * Utils::MS_PER_HOUR));

  for (const auto &event : events) {
    type_counts[static_cast<size_t>(event.type)]++;
    days.insert(Utils::day_index(event.timestamp_ms));
    if (is_weekend(event.timestamp_ms))
      weekend_events++;
    if (is_night(event.timestamp_ms))
      night_events++;
    total_duration_s += event.duration_s.value_or(0.0);

    if (event.grade) {
      grade_sum += *event.grade;
      profile.graded_event_count++;
    }

    if (event.type == EventType::ASSIGNMENT_SUBMIT) {
      submissions++;
      auto it = deadlines.find({event.course_id, event.module_id});
      if (it != deadlines.end() && event.timestamp_ms + margin_ms <= it->second)
        early_submissions++;
    }
  }

  if (profile.graded_event_count > 0)
    profile.final_grade = grade_sum / profile.graded_event_count;

  auto count_of = [&](EventType type) {
    return static_cast<double>(type_counts[static_cast<size_t>(type)]);
  };
  double total = static_cast<double>(events.size());

  features.set(Feature::TOTAL_EVENTS, total);
  features.set(Feature::ACTIVE_DAYS, static_cast<double>(days.size()));
  features.set(Feature::EVENTS_PER_DAY, total / window_days);
  features.set(Feature::LOGIN_RATE, count_of(EventType::LOGIN) / window_days);
  features.set(Feature::CONTENT_VIEW_RATE,
               (count_of(EventType::CONTENT_VIEW) + count_of(EventType::DOWNLOAD)) /
                   window_days);
  features.set(Feature::QUIZ_ATTEMPT_RATE,
               count_of(EventType::QUIZ_ATTEMPT) / window_days);
  features.set(Feature::ASSIGNMENT_SUBMIT_RATE,
               count_of(EventType::ASSIGNMENT_SUBMIT) / window_days);
  features.set(Feature::FORUM_PARTICIPATION_RATE,
               (count_of(EventType::FORUM_POST) + count_of(EventType::FORUM_REPLY)) /
                   window_days);

  // --- Sessions ---
  profile.sessions = SessionFeatureExtractor::segment(
      events, config_.session_inactivity_threshold_seconds * Utils::MS_PER_SECOND);
  SessionFeatures session_features =
      SessionFeatureExtractor::extract(profile.sessions);
  features.set(Feature::SESSION_COUNT,
               static_cast<double>(session_features.session_count));
  features.set(Feature::AVG_SESSION_DURATION,
               session_features.avg_session_duration_s);
  features.set(Feature::AVG_EVENTS_PER_SESSION,
               session_features.avg_events_per_session);
  features.set(Feature::TOTAL_ACTIVITY_DURATION, total_duration_s);

  // --- Timing behaviour ---
  features.set(Feature::EARLY_SUBMISSION_RATE,
               submissions > 0 ? static_cast<double>(early_submissions) /
                                     submissions
                               : 0.0);
  features.set(Feature::WEEKEND_ACTIVITY_RATIO, weekend_events / total);
  features.set(Feature::NIGHT_ACTIVITY_RATIO, night_events / total);

  std::string degeneracy;
  features.set(Feature::ACTIVITY_REGULARITY,
               compute_regularity(events, config_.regularity_cap, &degeneracy));
  if (!degeneracy.empty()) {
    diagnostics.push_back(make_diagnostic(DiagnosticKind::NUMERIC_DEGENERACY,
                                          "metrics", profile.student_id,
                                          degeneracy));
  }

  for (size_t i = 0; i < FEATURE_COUNT; ++i) {
    double &value = features.values[i];
    if (!std::isfinite(value) || value < 0.0) {
      LOG(LogLevel::WARN, LogComponent::METRICS,
          "Student " << profile.student_id << " feature "
                     << get_feature_name(feature_at(i)) << " was " << value
                     << ", replaced by 0");
      diagnostics.push_back(make_diagnostic(
          DiagnosticKind::NUMERIC_DEGENERACY, "metrics", profile.student_id,
          "Non-finite or negative " + get_feature_name(feature_at(i)) +
              " replaced by 0"));
      value = 0.0;
    }
  }

  LOG(LogLevel::TRACE, LogComponent::METRICS,
      "Features for " << profile.student_id << ": "
                      << format_feature_vector(features));
}

CohortSummary MetricsEngine::summarize_cohort(
    const std::vector<Event> &events,
    const std::map<std::string, StudentProfile> &profiles) const {
  CohortSummary summary;
  summary.total_students = profiles.size();
  summary.total_events = events.size();
  if (!profiles.empty())
    summary.avg_events_per_student =
        static_cast<double>(events.size()) / profiles.size();

  std::vector<double> grades;
  size_t weekend_events = 0;
  if (!events.empty()) {
    summary.first_event_ms = events.front().timestamp_ms;
    summary.last_event_ms = events.front().timestamp_ms;
  }
  for (const auto &event : events) {
    summary.first_event_ms =
        std::min(summary.first_event_ms, event.timestamp_ms);
    summary.last_event_ms = std::max(summary.last_event_ms, event.timestamp_ms);
    summary.event_type_counts[static_cast<size_t>(event.type)]++;
    summary.event_category_counts[static_cast<size_t>(
        event_category(event.type))]++;
    summary.hourly_distribution[Utils::hour_of_day(event.timestamp_ms)]++;
    summary.weekday_distribution[Utils::day_of_week(event.timestamp_ms)]++;
    if (is_weekend(event.timestamp_ms))
      weekend_events++;
    if (event.grade)
      grades.push_back(*event.grade);
  }

  if (!events.empty()) {
    summary.weekend_activity_share =
        static_cast<double>(weekend_events) / events.size();
  }
  if (!grades.empty())
    summary.grade_stats = compute_grade_stats(std::move(grades));

  for (const auto &[id, profile] : profiles) {
    if (!profile.final_grade)
      continue;
    summary.graded_students++;
    if (*profile.final_grade < config_.min_grade_threshold)
      summary.students_below_grade_threshold++;
  }
  return summary;
}

MetricsResult MetricsEngine::compute(const std::vector<Event> &events) const {
  ScopedTimer timer(PipelineMetrics::instance().stage_timer("metrics"));
  MetricsResult result;

  // Per-student event lists must be chronological
  for (const auto &event : events) {
    auto &profile = result.profiles[event.student_id];
    if (profile.student_id.empty())
      profile.student_id = event.student_id;
    profile.events.push_back(event);
  }
  for (auto &[id, profile] : result.profiles) {
    std::stable_sort(profile.events.begin(), profile.events.end(),
                     [](const Event &a, const Event &b) {
                       return a.timestamp_ms < b.timestamp_ms;
                     });
  }

  const DeadlineMap deadlines = build_deadline_map(events);

  std::vector<StudentProfile *> ordered;
  ordered.reserve(result.profiles.size());
  for (auto &[id, profile] : result.profiles)
    ordered.push_back(&profile);

  size_t thread_count =
      std::max<size_t>(1, std::min(config_.worker_threads, ordered.size()));

  if (thread_count <= 1) {
    for (auto *profile : ordered)
      compute_student(*profile, deadlines, result.diagnostics);
  } else {
    // Contiguous partitions in id order; diagnostics merged in the same order
    std::vector<std::vector<Diagnostic>> partition_diagnostics(thread_count);
    std::vector<std::thread> workers;
    size_t chunk = (ordered.size() + thread_count - 1) / thread_count;

    for (size_t t = 0; t < thread_count; ++t) {
      size_t begin = t * chunk;
      size_t end = std::min(ordered.size(), begin + chunk);
      workers.emplace_back([this, &ordered, &deadlines, &partition_diagnostics,
                            t, begin, end]() {
        for (size_t i = begin; i < end; ++i)
          compute_student(*ordered[i], deadlines, partition_diagnostics[t]);
      });
    }
    for (auto &worker : workers)
      worker.join();

    for (auto &diagnostics : partition_diagnostics)
      result.diagnostics.insert(result.diagnostics.end(),
                                std::make_move_iterator(diagnostics.begin()),
                                std::make_move_iterator(diagnostics.end()));
  }

  result.cohort = summarize_cohort(events, result.profiles);

  LOG(LogLevel::INFO, LogComponent::METRICS,
      "Computed features for " << result.profiles.size() << " students over "
                               << events.size() << " events using "
                               << thread_count << " worker thread(s)");
  return result;
}

} // namespace analytics
