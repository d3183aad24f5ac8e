#ifndef RECOMMENDATION_ENGINE_HPP
#define RECOMMENDATION_ENGINE_HPP

#include "analysis/clustering_engine.hpp"
#include "analysis/correlation_engine.hpp"
#include "analysis/metrics_engine.hpp"
#include "analysis/student_profile.hpp"
#include "core/config.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace analytics {

struct Recommendation {
  size_t priority = 1; // 1 is the most important
  std::string text;
  std::string feature; // Empty for general messages
  double score = 0.0;
};

class RecommendationEngine {
public:
  // The correlation result and cluster assignment are referenced, not
  // copied, and must outlive the engine.
  RecommendationEngine(const std::map<std::string, StudentProfile> &profiles,
                       const CorrelationResult &correlations,
                       const ClusterAssignment &clusters,
                       Config::RecommendationConfig config =
                           Config::RecommendationConfig{},
                       double significance_threshold = 0.2);

  // Never empty, never longer than max_recommendations
  std::vector<Recommendation>
  recommend_for_student(const StudentProfile &profile) const;

  std::map<std::string, std::vector<Recommendation>>
  recommend_all(const std::map<std::string, StudentProfile> &profiles) const;

  // Instructor-facing suggestions derived from the cohort summary
  static std::vector<Recommendation>
  recommend_for_cohort(const CohortSummary &cohort,
                       const Config::RecommendationConfig &config);

  double cohort_median(Feature feature) const;
  double cohort_stddev(Feature feature) const;

  // Advice from the student's own graded events, in chronological order:
  // low average, inconsistent grades, then a rising or falling trend.
  std::vector<Recommendation>
  recommend_from_grades(const StudentProfile &profile) const;

  // Least-squares slope of grades over their index divided by their
  // population stddev; 0 for fewer than 2 grades or constant grades.
  static double grade_trend(const std::vector<double> &grades);

private:
  std::string render(Feature feature, bool increase, double value) const;

  const CorrelationResult &correlations_;
  const ClusterAssignment &clusters_;
  Config::RecommendationConfig config_;
  double significance_threshold_;

  std::vector<double> medians_;
  std::vector<double> stddevs_;
};

} // namespace analytics

#endif // RECOMMENDATION_ENGINE_HPP
