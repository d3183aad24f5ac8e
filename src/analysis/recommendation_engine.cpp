#include "analysis/recommendation_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/stats_tracker.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace analytics {

namespace {

struct FeatureAdvice {
  const char *increase;
  const char *decrease;
};

// Indexed by Feature
const std::array<FeatureAdvice, FEATURE_COUNT> FEATURE_ADVICE = {{
    {"Engage with the course more often; aim for a few activities every day.",
     "Focus on fewer, more purposeful activities instead of many short ones."},
    {"Spread your work over more days; short daily visits help retention.",
     "Concentrate study on fewer, well-planned days."},
    {"Plan a small amount of course work for each day of the week.",
     "Consolidate your daily activity into focused study blocks."},
    {"Log in to the course more regularly to stay on top of updates.",
     "Make each login count by planning what to work on beforehand."},
    {"Spend more time reviewing course materials and resources.",
     "Move from reading materials to practising with quizzes and assignments."},
    {"Use the practice quizzes to check your understanding more often.",
     "Review the material before attempting quizzes again."},
    {"Keep up with assignments and submit work as it is released.",
     "Take more care over each submission rather than resubmitting often."},
    {"Increase participation in forum discussions and peer collaboration.",
     "Balance forum time with individual study of the course materials."},
    {"Schedule more separate study sessions across the week.",
     "Combine short sessions into fewer, longer study periods."},
    {"Increase study session duration to at least 30 minutes for better "
     "retention.",
     "Break study sessions into shorter, more frequent intervals (30-60 "
     "minutes)."},
    {"Cover more activities in each study session.",
     "Slow down and work through fewer activities per session."},
    {"Invest more total time in course activities.",
     "Look for ways to study more efficiently in less total time."},
    {"Start assignments earlier and submit at least a day before the "
     "deadline.",
     "Review your work carefully before submitting early."},
    {"Consider some weekend review sessions for better retention.",
     "Balance study time more evenly throughout the week."},
    {"Late-evening review sessions can complement your daytime study.",
     "Consider studying during daylight hours for better concentration."},
    {"Build a steadier study routine with regular gaps between sessions.",
     "Vary your routine with extra sessions before assessments."},
}};

std::string format_value(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

double median_of(std::vector<double> values) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());
  size_t mid = values.size() / 2;
  return values.size() % 2 == 0 ? (values[mid - 1] + values[mid]) / 2.0
                                : values[mid];
}

constexpr size_t MIN_GRADES_FOR_VARIABILITY = 4;
constexpr size_t MIN_GRADES_FOR_TREND = 3;

std::vector<double> graded_values(const StudentProfile &profile) {
  std::vector<double> grades;
  for (const auto &event : profile.events) {
    if (event.grade)
      grades.push_back(*event.grade);
  }
  return grades;
}

void assign_priorities(std::vector<Recommendation> &recommendations) {
  for (size_t i = 0; i < recommendations.size(); ++i)
    recommendations[i].priority = i + 1;
}

} // namespace

RecommendationEngine::RecommendationEngine(
    const std::map<std::string, StudentProfile> &profiles,
    const CorrelationResult &correlations, const ClusterAssignment &clusters,
    Config::RecommendationConfig config, double significance_threshold)
    : correlations_(correlations), clusters_(clusters),
      config_(std::move(config)),
      significance_threshold_(significance_threshold),
      medians_(FEATURE_COUNT, 0.0), stddevs_(FEATURE_COUNT, 0.0) {
  for (size_t i = 0; i < FEATURE_COUNT; ++i) {
    std::vector<double> column;
    StatsTracker tracker;
    column.reserve(profiles.size());
    for (const auto &[id, profile] : profiles) {
      column.push_back(profile.features.values[i]);
      tracker.update(profile.features.values[i]);
    }
    medians_[i] = median_of(std::move(column));
    stddevs_[i] = tracker.get_population_stddev();
  }
}

double RecommendationEngine::cohort_median(Feature feature) const {
  return medians_[static_cast<size_t>(feature)];
}

double RecommendationEngine::cohort_stddev(Feature feature) const {
  return stddevs_[static_cast<size_t>(feature)];
}

std::string RecommendationEngine::render(Feature feature, bool increase,
                                         double value) const {
  const auto &advice = FEATURE_ADVICE[static_cast<size_t>(feature)];
  std::string unit = get_feature_unit(feature);
  std::ostringstream oss;
  oss << (increase ? "Raise" : "Lower") << " your "
      << get_feature_display_name(feature) << " (yours: " << format_value(value)
      << unit << ", cohort median: " << format_value(cohort_median(feature))
      << unit << "). " << (increase ? advice.increase : advice.decrease);
  return oss.str();
}

double RecommendationEngine::grade_trend(const std::vector<double> &grades) {
  if (grades.size() < 2)
    return 0.0;

  StatsTracker tracker;
  for (double grade : grades)
    tracker.update(grade);
  double stddev = tracker.get_population_stddev();
  if (stddev <= 0.0)
    return 0.0;

  double n = static_cast<double>(grades.size());
  double mean_x = (n - 1.0) / 2.0;
  double mean_y = tracker.get_mean();
  double covariance = 0.0;
  double variance_x = 0.0;
  for (size_t i = 0; i < grades.size(); ++i) {
    double dx = static_cast<double>(i) - mean_x;
    covariance += dx * (grades[i] - mean_y);
    variance_x += dx * dx;
  }
  return (covariance / variance_x) / stddev;
}

std::vector<Recommendation>
RecommendationEngine::recommend_from_grades(const StudentProfile &profile) const {
  std::vector<Recommendation> recommendations;
  std::vector<double> grades = graded_values(profile);
  if (grades.empty())
    return recommendations;

  StatsTracker tracker;
  for (double grade : grades)
    tracker.update(grade);

  if (tracker.get_mean() < config_.min_grade_threshold) {
    recommendations.push_back(
        {0,
         "Seek additional help; your current average grade (" +
             format_value(tracker.get_mean()) + "%) is below " +
             format_value(config_.min_grade_threshold) + "%.",
         "grade_average", 0.0});
  }

  if (grades.size() >= MIN_GRADES_FOR_VARIABILITY &&
      tracker.get_stddev() > config_.grade_variability_threshold) {
    recommendations.push_back(
        {0,
         "Work on consistency; your grades vary significantly between "
         "assignments (standard deviation " +
             format_value(tracker.get_stddev()) + ").",
         "grade_consistency", 0.0});
  }

  if (grades.size() >= MIN_GRADES_FOR_TREND) {
    double trend = grade_trend(grades);
    if (trend < -config_.grade_trend_threshold) {
      recommendations.push_back(
          {0,
           "Your grades are trending down; consider reviewing your study "
           "strategies.",
           "grade_trend", trend});
    } else if (trend > config_.grade_trend_threshold) {
      recommendations.push_back(
          {0,
           "Great improvement trend in your grades! Continue with your "
           "current strategies.",
           "grade_trend", trend});
    }
  }
  return recommendations;
}

std::vector<Recommendation>
RecommendationEngine::recommend_for_student(const StudentProfile &profile) const {
  std::vector<Recommendation> recommendations;
  size_t cap = std::max<size_t>(1, config_.max_recommendations);

  if (correlations_.status == CorrelationStatus::INSUFFICIENT_DATA) {
    recommendations.push_back(
        {1,
         "Not enough grade data is available yet to personalize advice. Keep "
         "engaging with course activities and check back once more "
         "assessments are graded.",
         "", 0.0});
    for (auto &rec : recommend_from_grades(profile)) {
      if (recommendations.size() >= cap)
        break;
      recommendations.push_back(std::move(rec));
    }
    assign_priorities(recommendations);
    return recommendations;
  }

  for (const auto &entry : correlations_.entries) {
    if (!entry.defined() || std::fabs(*entry.coefficient) <= significance_threshold_)
      continue;

    double r = *entry.coefficient;
    double value = profile.features.get(entry.feature);
    double median = cohort_median(entry.feature);
    double stddev = cohort_stddev(entry.feature);
    double gap = stddev > 0.0 ? std::fabs(value - median) / stddev : 0.0;

    // Positive r favors higher values, negative r favors lower ones
    bool unfavorable = r > 0 ? value < median : value > median;
    if (!unfavorable || gap <= config_.min_standing_gap)
      continue;

    recommendations.push_back({0, render(entry.feature, r > 0, value),
                               entry.feature_name, std::fabs(r) * gap});
  }

  std::stable_sort(recommendations.begin(), recommendations.end(),
                   [](const Recommendation &a, const Recommendation &b) {
                     if (a.score != b.score)
                       return a.score > b.score;
                     return a.feature < b.feature;
                   });
  // Grade-based advice ranks after the correlation-driven entries
  for (auto &rec : recommend_from_grades(profile))
    recommendations.push_back(std::move(rec));
  if (recommendations.size() > cap)
    recommendations.resize(cap);

  if (recommendations.empty()) {
    const ClusterInfo *cluster = clusters_.cluster_of(profile.student_id);
    std::string text =
        "Your activity is on par with or ahead of the cohort in every area "
        "linked to grades. Keep up your current routine";
    if (cluster)
      text += " (behaviour group: " + cluster->description + ")";
    text += ".";
    recommendations.push_back({1, text, "", 0.0});
  }

  assign_priorities(recommendations);
  LOG(LogLevel::DEBUG, LogComponent::RECOMMEND,
      "Student " << profile.student_id << ": " << recommendations.size()
                 << " recommendation(s), top: " << recommendations.front().text);
  return recommendations;
}

std::map<std::string, std::vector<Recommendation>>
RecommendationEngine::recommend_all(
    const std::map<std::string, StudentProfile> &profiles) const {
  ScopedTimer timer(PipelineMetrics::instance().stage_timer("recommendation"));
  std::map<std::string, std::vector<Recommendation>> all;
  for (const auto &[id, profile] : profiles)
    all.emplace(id, recommend_for_student(profile));

  LOG(LogLevel::INFO, LogComponent::RECOMMEND,
      "Generated recommendations for " << all.size() << " students");
  return all;
}

std::vector<Recommendation> RecommendationEngine::recommend_for_cohort(
    const CohortSummary &cohort, const Config::RecommendationConfig &config) {
  std::vector<Recommendation> recommendations;

  if (cohort.avg_events_per_student < 10.0) {
    recommendations.push_back(
        {0,
         "Increase overall course engagement; students average " +
             format_value(cohort.avg_events_per_student) +
             " activities, aim for at least 10.",
         "avg_events_per_student", 0.0});
  }

  size_t social = cohort.category_count(EventCategory::SOCIAL);
  size_t assessment = cohort.category_count(EventCategory::ASSESSMENT);
  if (static_cast<double>(social) < 0.5 * assessment) {
    recommendations.push_back(
        {0, "Encourage more forum participation and peer collaboration.",
         "social_events", 0.0});
  }

  if (cohort.total_events > 0 && cohort.weekend_activity_share < 0.1) {
    recommendations.push_back({0,
                               "Consider distributing learning activities "
                               "more evenly throughout the week.",
                               "weekend_activity_share", 0.0});
  }

  if (cohort.grade_stats && cohort.grade_stats->stddev > 20.0) {
    recommendations.push_back(
        {0,
         "Grades vary widely (standard deviation " +
             format_value(cohort.grade_stats->stddev) +
             "); consider additional support for students with grades "
             "below 70%.",
         "grade_stddev", 0.0});
  }

  if (recommendations.size() > config.max_recommendations)
    recommendations.resize(config.max_recommendations);
  assign_priorities(recommendations);
  return recommendations;
}

} // namespace analytics
