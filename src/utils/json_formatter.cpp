#include "json_formatter.hpp"
#include "utils/utils.hpp"

namespace JsonFormatter {

namespace {
template <typename T> nlohmann::json optional_to_json(const std::optional<T> &opt) {
  if (opt)
    return *opt;
  return nullptr;
}

nlohmann::json feature_vector_to_json(const analytics::FeatureVector &features) {
  nlohmann::json j = nlohmann::json::object();
  for (size_t i = 0; i < analytics::FEATURE_COUNT; ++i)
    j[analytics::get_feature_name(analytics::feature_at(i))] =
        features.values[i];
  return j;
}
} // namespace

nlohmann::json cohort_to_json_object(const analytics::CohortSummary &cohort) {
  nlohmann::json j;
  j["total_students"] = cohort.total_students;
  j["total_events"] = cohort.total_events;
  j["avg_events_per_student"] = cohort.avg_events_per_student;

  nlohmann::json j_types = nlohmann::json::object();
  for (size_t i = 0; i < EVENT_TYPE_COUNT; ++i)
    j_types[event_type_to_string(static_cast<EventType>(i))] =
        cohort.event_type_counts[i];
  j["event_type_counts"] = j_types;

  nlohmann::json j_categories = nlohmann::json::object();
  for (size_t i = 0; i < EVENT_CATEGORY_COUNT; ++i)
    j_categories[event_category_to_string(static_cast<EventCategory>(i))] =
        cohort.event_category_counts[i];
  j["event_category_counts"] = j_categories;

  j["hourly_distribution"] = cohort.hourly_distribution;
  j["weekday_distribution"] = cohort.weekday_distribution;
  j["weekend_activity_share"] = cohort.weekend_activity_share;

  if (cohort.total_events > 0) {
    j["time_range"] = {{"start", Utils::format_time_ms(cohort.first_event_ms)},
                       {"end", Utils::format_time_ms(cohort.last_event_ms)}};
  } else {
    j["time_range"] = nullptr;
  }

  if (cohort.grade_stats) {
    const auto &g = *cohort.grade_stats;
    j["grade_stats"] = {{"count", g.count},   {"mean", g.mean},
                        {"median", g.median}, {"std", g.stddev},
                        {"min", g.min},       {"max", g.max}};
  } else {
    j["grade_stats"] = nullptr;
  }
  j["graded_students"] = cohort.graded_students;
  j["students_below_grade_threshold"] = cohort.students_below_grade_threshold;
  return j;
}

nlohmann::json student_to_json_object(const analytics::StudentProfile &profile) {
  nlohmann::json j;
  j["student_id"] = profile.student_id;
  j["final_grade"] = optional_to_json(profile.final_grade);
  j["graded_events"] = profile.graded_event_count;
  j["features"] = feature_vector_to_json(profile.features);
  return j;
}

nlohmann::json
correlations_to_json_object(const analytics::CorrelationResult &correlations) {
  nlohmann::json j;
  j["status"] = analytics::correlation_status_to_string(correlations.status);
  j["sample_size"] = correlations.sample_size;

  nlohmann::json j_entries = nlohmann::json::array();
  for (const auto &entry : correlations.entries) {
    nlohmann::json j_entry = {{"feature", entry.feature_name},
                              {"coefficient",
                               optional_to_json(entry.coefficient)},
                              {"sample_size", entry.sample_size}};
    if (!entry.defined())
      j_entry["reason"] = entry.undefined_reason;
    j_entries.push_back(j_entry);
  }
  j["entries"] = j_entries;
  return j;
}

nlohmann::json
clusters_to_json_object(const analytics::ClusterAssignment &clusters) {
  nlohmann::json j;
  j["defined"] = clusters.defined;
  j["requested_k"] = clusters.requested_k;
  j["effective_k"] = clusters.effective_k;
  j["seed"] = clusters.seed;
  j["iterations"] = clusters.iterations;
  j["converged"] = clusters.converged;
  j["inertia"] = clusters.inertia;
  j["assignments"] = clusters.assignments;

  nlohmann::json j_clusters = nlohmann::json::array();
  for (const auto &cluster : clusters.clusters) {
    nlohmann::json j_centroid = nlohmann::json::object();
    for (size_t i = 0; i < cluster.centroid.size() && i < analytics::FEATURE_COUNT;
         ++i)
      j_centroid[analytics::get_feature_name(analytics::feature_at(i))] =
          cluster.centroid[i];

    j_clusters.push_back({{"label", cluster.label},
                          {"description", cluster.description},
                          {"size", cluster.size()},
                          {"members", cluster.members},
                          {"centroid", j_centroid},
                          {"standardized_centroid",
                           cluster.standardized_centroid}});
  }
  j["clusters"] = j_clusters;
  return j;
}

nlohmann::json recommendations_to_json_array(
    const std::vector<analytics::Recommendation> &recommendations) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &rec : recommendations) {
    nlohmann::json j_rec = {{"priority", rec.priority}, {"text", rec.text}};
    if (!rec.feature.empty()) {
      j_rec["feature"] = rec.feature;
      j_rec["score"] = rec.score;
    }
    j.push_back(j_rec);
  }
  return j;
}

nlohmann::json diagnostic_to_json_object(const Diagnostic &diagnostic) {
  nlohmann::json j;
  j["kind"] = diagnostic_kind_to_string(diagnostic.kind);
  j["component"] = diagnostic.component;
  j["row_index"] = optional_to_json(diagnostic.row_index);
  if (!diagnostic.subject.empty())
    j["subject"] = diagnostic.subject;
  if (!diagnostic.raw_content.empty())
    j["raw_content"] = diagnostic.raw_content;
  j["message"] = diagnostic.message;
  return j;
}

nlohmann::json result_to_json_object(const PipelineResult &result) {
  nlohmann::json j;

  j["input"] = {{"rows_read", result.rows_read},
                {"rows_rejected", result.rows_rejected},
                {"rows_corrected", result.rows_corrected},
                {"duplicates_dropped", result.duplicates_dropped},
                {"events_analyzed", result.events_analyzed}};
  j["cohort_summary"] = cohort_to_json_object(result.cohort);

  nlohmann::json j_students = nlohmann::json::array();
  for (const auto &[id, profile] : result.profiles)
    j_students.push_back(student_to_json_object(profile));
  j["students"] = j_students;

  j["correlations"] = correlations_to_json_object(result.correlations);
  j["clusters"] = clusters_to_json_object(result.clusters);

  nlohmann::json j_recs = nlohmann::json::object();
  for (const auto &[id, recs] : result.recommendations)
    j_recs[id] = recommendations_to_json_array(recs);
  j["recommendations"] = j_recs;
  j["cohort_recommendations"] =
      recommendations_to_json_array(result.cohort_recommendations);

  nlohmann::json j_diagnostics = nlohmann::json::array();
  for (const auto &diagnostic : result.diagnostics)
    j_diagnostics.push_back(diagnostic_to_json_object(diagnostic));
  j["diagnostics"] = j_diagnostics;

  return j;
}

std::string format_result_to_json(const PipelineResult &result, int indent) {
  // Raw rows may carry invalid UTF-8; replace rather than throw
  return result_to_json_object(result).dump(
      indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace JsonFormatter
