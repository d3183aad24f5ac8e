#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/pipeline.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json cohort_to_json_object(const analytics::CohortSummary &cohort);
nlohmann::json student_to_json_object(const analytics::StudentProfile &profile);
nlohmann::json
correlations_to_json_object(const analytics::CorrelationResult &correlations);
nlohmann::json
clusters_to_json_object(const analytics::ClusterAssignment &clusters);
nlohmann::json recommendations_to_json_array(
    const std::vector<analytics::Recommendation> &recommendations);
nlohmann::json diagnostic_to_json_object(const Diagnostic &diagnostic);

// The complete result document
nlohmann::json result_to_json_object(const PipelineResult &result);
std::string format_result_to_json(const PipelineResult &result,
                                  int indent = 2);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
