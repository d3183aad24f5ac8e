#include "analysis/recommendation_engine.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <memory>

using namespace analytics;

namespace {

// Four students whose listed features rise with the grade: s1 is the weakest
std::map<std::string, StudentProfile>
graded_cohort(const std::vector<Feature> &features) {
  std::map<std::string, StudentProfile> cohort;
  for (int i = 0; i < 4; ++i) {
    StudentProfile profile;
    profile.student_id = "s" + std::to_string(i + 1);
    profile.final_grade = 50.0 + 10.0 * i;
    for (Feature feature : features)
      profile.features.set(feature, static_cast<double>(i));
    cohort.emplace(profile.student_id, profile);
  }
  return cohort;
}

// Graded submissions one hour apart, in the given order
void add_graded_events(StudentProfile &profile,
                       const std::vector<double> &grades) {
  uint64_t timestamp_ms = 1705311000000ULL;
  for (double grade : grades) {
    Event event;
    event.student_id = profile.student_id;
    event.type = EventType::ASSIGNMENT_SUBMIT;
    event.timestamp_ms = timestamp_ms;
    event.grade = grade;
    profile.events.push_back(event);
    timestamp_ms += 3600 * 1000;
  }
}

} // namespace

class RecommendationEngineTest : public ::testing::Test {
protected:
  void build(const std::map<std::string, StudentProfile> &cohort,
             Config::RecommendationConfig config =
                 Config::RecommendationConfig{}) {
    profiles = cohort;
    correlations = CorrelationEngine().compute(profiles);
    Config::ClusteringConfig clustering_config;
    clustering_config.k = 2;
    clusters = ClusteringEngine(clustering_config).cluster(profiles);
    engine = std::make_unique<RecommendationEngine>(profiles, correlations,
                                                    clusters, config);
  }

  std::map<std::string, StudentProfile> profiles;
  CorrelationResult correlations;
  ClusterAssignment clusters;
  std::unique_ptr<RecommendationEngine> engine;
};

TEST_F(RecommendationEngineTest, CohortStatisticsComputedOnce) {
  build(graded_cohort({Feature::FORUM_PARTICIPATION_RATE}));
  EXPECT_DOUBLE_EQ(engine->cohort_median(Feature::FORUM_PARTICIPATION_RATE), 1.5);
  EXPECT_NEAR(engine->cohort_stddev(Feature::FORUM_PARTICIPATION_RATE),
              std::sqrt(1.25), 1e-12);
  EXPECT_DOUBLE_EQ(engine->cohort_median(Feature::LOGIN_RATE), 0.0);
}

TEST_F(RecommendationEngineTest, WeakStudentGetsTargetedAdvice) {
  build(graded_cohort({Feature::FORUM_PARTICIPATION_RATE}));

  auto recs = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].priority, 1u);
  EXPECT_EQ(recs[0].feature, "forum_participation_rate");
  EXPECT_NE(recs[0].text.find("forum participation"), std::string::npos);
  EXPECT_NE(recs[0].text.find("1.50"), std::string::npos); // Cohort median
  // |r| = 1, gap = 1.5 / sqrt(1.25)
  EXPECT_NEAR(recs[0].score, 1.5 / std::sqrt(1.25), 1e-9);
}

TEST_F(RecommendationEngineTest, StrongStudentGetsPositiveFallback) {
  build(graded_cohort({Feature::FORUM_PARTICIPATION_RATE}));

  auto recs = engine->recommend_for_student(profiles.at("s4"));
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].priority, 1u);
  EXPECT_TRUE(recs[0].feature.empty());
  const ClusterInfo *cluster = clusters.cluster_of("s4");
  ASSERT_NE(cluster, nullptr);
  EXPECT_NE(recs[0].text.find(cluster->description), std::string::npos);
}

TEST_F(RecommendationEngineTest, NegativeCorrelationFavorsLowerValues) {
  auto cohort = graded_cohort({});
  int i = 0;
  for (auto &[id, profile] : cohort)
    profile.features.set(Feature::NIGHT_ACTIVITY_RATIO, 0.9 - 0.2 * i++);
  build(cohort);

  auto weakest = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(weakest.size(), 1u);
  EXPECT_EQ(weakest[0].feature, "night_activity_ratio");
  EXPECT_EQ(weakest[0].text.rfind("Lower", 0), 0u);

  auto strongest = engine->recommend_for_student(profiles.at("s4"));
  EXPECT_TRUE(strongest[0].feature.empty());
}

TEST_F(RecommendationEngineTest, ListIsCappedAndRankedByScore) {
  Config::RecommendationConfig config;
  config.max_recommendations = 2;
  build(graded_cohort({Feature::TOTAL_EVENTS, Feature::ACTIVE_DAYS,
                       Feature::FORUM_PARTICIPATION_RATE, Feature::LOGIN_RATE,
                       Feature::QUIZ_ATTEMPT_RATE}),
        config);

  auto recs = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].priority, 1u);
  EXPECT_EQ(recs[1].priority, 2u);
  // Equal scores fall back to feature name order
  EXPECT_EQ(recs[0].feature, "active_days");
  EXPECT_EQ(recs[1].feature, "forum_participation_rate");
}

TEST_F(RecommendationEngineTest, EveryStudentGetsBetweenOneAndCap) {
  build(graded_cohort({Feature::TOTAL_EVENTS, Feature::LOGIN_RATE}));
  auto all = engine->recommend_all(profiles);
  ASSERT_EQ(all.size(), profiles.size());
  for (const auto &[id, recs] : all) {
    EXPECT_GE(recs.size(), 1u) << id;
    EXPECT_LE(recs.size(), 5u) << id;
  }
}

TEST_F(RecommendationEngineTest, InsufficientGradeDataMessage) {
  auto cohort = graded_cohort({Feature::FORUM_PARTICIPATION_RATE});
  cohort.at("s2").final_grade.reset();
  cohort.at("s3").final_grade.reset();
  cohort.at("s4").final_grade.reset();
  build(cohort);

  ASSERT_EQ(correlations.status, CorrelationStatus::INSUFFICIENT_DATA);
  auto recs = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_TRUE(recs[0].feature.empty());
  EXPECT_NE(recs[0].text.find("grade data"), std::string::npos);
}

TEST_F(RecommendationEngineTest, SameInputsSameRecommendations) {
  build(graded_cohort({Feature::TOTAL_EVENTS, Feature::QUIZ_ATTEMPT_RATE}));
  auto first = engine->recommend_all(profiles);
  auto second = engine->recommend_all(profiles);
  for (const auto &[id, recs] : first) {
    ASSERT_EQ(recs.size(), second.at(id).size());
    for (size_t i = 0; i < recs.size(); ++i)
      EXPECT_EQ(recs[i].text, second.at(id)[i].text);
  }
}

TEST_F(RecommendationEngineTest, LowAverageGradeAsksForHelp) {
  auto cohort = graded_cohort({Feature::FORUM_PARTICIPATION_RATE});
  add_graded_events(cohort.at("s4"), {40.0, 50.0});
  build(cohort);

  auto recs = engine->recommend_for_student(profiles.at("s4"));
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].feature, "grade_average");
  EXPECT_NE(recs[0].text.find("45.00%"), std::string::npos);
  EXPECT_NE(recs[0].text.find("60.00%"), std::string::npos);
}

TEST_F(RecommendationEngineTest, InconsistentGradesNeedFourGrades) {
  auto cohort = graded_cohort({Feature::FORUM_PARTICIPATION_RATE});
  add_graded_events(cohort.at("s4"), {90.0, 40.0, 40.0, 90.0});
  add_graded_events(cohort.at("s3"), {90.0, 40.0, 90.0});
  build(cohort);

  auto varied = engine->recommend_for_student(profiles.at("s4"));
  ASSERT_EQ(varied.size(), 1u);
  EXPECT_EQ(varied[0].feature, "grade_consistency");
  EXPECT_NE(varied[0].text.find("28.87"), std::string::npos);

  // Three grades are too few to judge consistency; the trend is flat
  auto short_history = engine->recommend_for_student(profiles.at("s3"));
  ASSERT_EQ(short_history.size(), 1u);
  EXPECT_TRUE(short_history[0].feature.empty());
}

TEST_F(RecommendationEngineTest, GradeTrendDirection) {
  auto cohort = graded_cohort({Feature::FORUM_PARTICIPATION_RATE});
  add_graded_events(cohort.at("s4"), {60.0, 70.0, 80.0});
  add_graded_events(cohort.at("s3"), {80.0, 70.0, 65.0});
  add_graded_events(cohort.at("s2"), {60.0, 90.0});
  build(cohort);

  auto improving = engine->recommend_for_student(profiles.at("s4"));
  ASSERT_EQ(improving.size(), 1u);
  EXPECT_EQ(improving[0].feature, "grade_trend");
  EXPECT_NE(improving[0].text.find("improvement"), std::string::npos);

  auto declining = engine->recommend_for_student(profiles.at("s3"));
  ASSERT_EQ(declining.size(), 1u);
  EXPECT_EQ(declining[0].feature, "grade_trend");
  EXPECT_NE(declining[0].text.find("trending down"), std::string::npos);

  // s2 is below the forum median; two grades give no trend advice
  for (const auto &rec : engine->recommend_for_student(profiles.at("s2")))
    EXPECT_NE(rec.feature, "grade_trend");
}

TEST(GradeTrendTest, SlopeOverPopulationDeviation) {
  EXPECT_NEAR(RecommendationEngine::grade_trend({60.0, 70.0, 80.0}),
              10.0 / std::sqrt(200.0 / 3.0), 1e-12);
  EXPECT_LT(RecommendationEngine::grade_trend({80.0, 70.0, 65.0}), -0.1);
  EXPECT_DOUBLE_EQ(RecommendationEngine::grade_trend({70.0}), 0.0);
  EXPECT_DOUBLE_EQ(RecommendationEngine::grade_trend({70.0, 70.0, 70.0}), 0.0);
  EXPECT_DOUBLE_EQ(RecommendationEngine::grade_trend({90.0, 40.0, 40.0, 90.0}),
                   0.0);
}

TEST_F(RecommendationEngineTest, GradeAdviceRanksAfterBehaviourAndIsCapped) {
  auto cohort = graded_cohort({Feature::FORUM_PARTICIPATION_RATE});
  add_graded_events(cohort.at("s1"), {40.0, 45.0, 50.0});
  build(cohort);

  auto recs = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(recs.size(), 3u);
  EXPECT_EQ(recs[0].feature, "forum_participation_rate");
  EXPECT_EQ(recs[1].feature, "grade_average");
  EXPECT_EQ(recs[2].feature, "grade_trend");
  for (size_t i = 0; i < recs.size(); ++i)
    EXPECT_EQ(recs[i].priority, i + 1);

  Config::RecommendationConfig capped;
  capped.max_recommendations = 2;
  build(cohort, capped);
  auto limited = engine->recommend_for_student(profiles.at("s1"));
  ASSERT_EQ(limited.size(), 2u);
  EXPECT_EQ(limited[0].feature, "forum_participation_rate");
  EXPECT_EQ(limited[1].feature, "grade_average");
}

TEST(CohortRecommendationTest, TriggersFromCohortSummary) {
  CohortSummary cohort;
  cohort.total_students = 4;
  cohort.total_events = 20;
  cohort.avg_events_per_student = 5.0;
  cohort.event_category_counts[static_cast<size_t>(EventCategory::ASSESSMENT)] = 10;
  cohort.event_category_counts[static_cast<size_t>(EventCategory::SOCIAL)] = 2;
  cohort.weekend_activity_share = 0.05;
  GradeStats grades;
  grades.count = 4;
  grades.stddev = 25.0;
  cohort.grade_stats = grades;

  Config::RecommendationConfig config;
  auto recs = RecommendationEngine::recommend_for_cohort(cohort, config);
  ASSERT_EQ(recs.size(), 4u);
  for (size_t i = 0; i < recs.size(); ++i)
    EXPECT_EQ(recs[i].priority, i + 1);
  EXPECT_NE(recs[1].text.find("forum participation"), std::string::npos);

  config.max_recommendations = 2;
  EXPECT_EQ(RecommendationEngine::recommend_for_cohort(cohort, config).size(), 2u);
}

TEST(CohortRecommendationTest, HealthyCohortNeedsNoAction) {
  CohortSummary cohort;
  cohort.total_events = 300;
  cohort.avg_events_per_student = 30.0;
  cohort.event_category_counts[static_cast<size_t>(EventCategory::ASSESSMENT)] = 50;
  cohort.event_category_counts[static_cast<size_t>(EventCategory::SOCIAL)] = 40;
  cohort.weekend_activity_share = 0.25;

  EXPECT_TRUE(RecommendationEngine::recommend_for_cohort(
                  cohort, Config::RecommendationConfig{})
                  .empty());
}
