#include "core/metrics_registry.hpp"
#include "core/pipeline.hpp"
#include "core/schema_error.hpp"
#include "io/log_readers/csv_file_event_reader.hpp"
#include "io/result_writers/json_result_writer.hpp"
#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>

class PipelineIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "lms_pipeline_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  std::string write_file(const std::string &name, const std::string &content) {
    auto path = test_dir / name;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  std::string read_file(const std::filesystem::path &path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  static std::string sample_csv() {
    return "student_id,event_type,event_time,module,course,grade,"
           "activity_duration\n"
           "1001,login,2024-01-15 09:30:00,module_1,course_101,,0\n"
           "1001,assignment_submit,2024-01-15 11:45:00,module_1,course_101,85,"
           "120\n"
           "1002,login,2024-01-15 10:00:00,module_1,course_101,,0\n"
           "1002,teleport,2024-01-15 10:05:00,module_1,course_101,,0\n"
           "1002,quiz_attempt,2024-01-16 10:10:00,module_1,course_101,70,300\n"
           "1003,forum_post,2024-01-20 20:00:00,module_2,course_101,,60\n"
           "1003,assignment_submit,2024-02-21 09:00:00,module_1,course_101,60,"
           "200\n";
  }

  std::filesystem::path test_dir;
};

TEST_F(PipelineIntegrationTest, RunsEndToEndFromCsvFile) {
  auto config = std::make_shared<Config::AppConfig>();
  std::string input = write_file("events.csv", sample_csv());

  CsvFileEventReader reader(input, config->parser);
  AnalyticsPipeline pipeline(config);
  PipelineResult result = pipeline.run(reader);

  EXPECT_EQ(result.rows_read, 7u);
  EXPECT_EQ(result.rows_rejected, 1u);
  EXPECT_EQ(result.events_analyzed, 6u);
  ASSERT_EQ(result.profiles.size(), 3u);
  EXPECT_EQ(result.cohort.total_students, 3u);

  // The unrecognized event type is reported with its row index
  bool found = false;
  for (const auto &diag : result.diagnostics) {
    if (diag.kind == DiagnosticKind::ROW_PARSE_ERROR) {
      ASSERT_TRUE(diag.row_index.has_value());
      EXPECT_EQ(*diag.row_index, 4u);
      found = true;
    }
  }
  EXPECT_TRUE(found);

  const auto &scenario = result.profiles.at("1001");
  EXPECT_DOUBLE_EQ(*scenario.final_grade, 85.0);
  EXPECT_DOUBLE_EQ(
      scenario.features.get(analytics::Feature::AVG_SESSION_DURATION), 60.0);

  EXPECT_EQ(result.correlations.status, analytics::CorrelationStatus::OK);
  EXPECT_EQ(result.correlations.sample_size, 3u);
  ASSERT_TRUE(result.clusters.defined);
  EXPECT_EQ(result.clusters.effective_k, 3u);
  EXPECT_EQ(result.clusters.assignments.size(), 3u);

  ASSERT_EQ(result.recommendations.size(), 3u);
  for (const auto &[id, recs] : result.recommendations) {
    EXPECT_GE(recs.size(), 1u);
    EXPECT_LE(recs.size(), config->recommendation.max_recommendations);
  }
  // Three students averaging two events each
  EXPECT_FALSE(result.cohort_recommendations.empty());
}

TEST_F(PipelineIntegrationTest, MissingFileIsSchemaError) {
  Config::ParserConfig parser;
  EXPECT_THROW(CsvFileEventReader((test_dir / "absent.csv").string(), parser),
               SchemaError);
}

TEST_F(PipelineIntegrationTest, TimeframeRestrictsEvents) {
  auto config = std::make_shared<Config::AppConfig>();
  config->timeframe = "2024-01";

  std::istringstream input(sample_csv());
  ParseResult parsed = EventParser(config->parser).parse(input);
  PipelineResult result = AnalyticsPipeline(config).run(std::move(parsed));

  EXPECT_EQ(result.events_analyzed, 5u);
  EXPECT_EQ(result.profiles.at("1003").events.size(), 1u);
}

TEST_F(PipelineIntegrationTest, EmptyTimeframeStillCompletes) {
  auto config = std::make_shared<Config::AppConfig>();
  config->timeframe = "2019";

  std::istringstream input(sample_csv());
  PipelineResult result =
      AnalyticsPipeline(config).run(EventParser(config->parser).parse(input));

  EXPECT_EQ(result.events_analyzed, 0u);
  EXPECT_TRUE(result.profiles.empty());
  EXPECT_FALSE(result.clusters.defined);
  EXPECT_EQ(result.correlations.status,
            analytics::CorrelationStatus::INSUFFICIENT_DATA);
  EXPECT_GE(count_diagnostics(result.diagnostics,
                              DiagnosticKind::INSUFFICIENT_DATA),
            2u);
}

TEST_F(PipelineIntegrationTest, WritesJsonDocumentAndRunMetrics) {
  auto config = std::make_shared<Config::AppConfig>();
  std::string input = write_file("events.csv", sample_csv());

  CsvFileEventReader reader(input, config->parser);
  PipelineResult result = AnalyticsPipeline(config).run(reader);

  auto output = test_dir / "reports" / "analysis_results.json";
  JsonResultWriter writer(output.string());
  ASSERT_TRUE(writer.write(result));

  auto doc = nlohmann::json::parse(read_file(output));
  EXPECT_EQ(doc["cohort_summary"]["total_students"], 3);
  EXPECT_EQ(doc["cohort_summary"]["event_type_counts"]["login"], 2);
  ASSERT_EQ(doc["students"].size(), 3u);
  EXPECT_EQ(doc["students"][0]["student_id"], "1001");
  EXPECT_DOUBLE_EQ(doc["students"][0]["features"]["total_activity_duration"]
                       .get<double>(),
                   120.0);
  EXPECT_EQ(doc["correlations"]["status"], "ok");
  EXPECT_EQ(doc["correlations"]["entries"].size(), analytics::FEATURE_COUNT);
  EXPECT_EQ(doc["clusters"]["effective_k"], 3);
  EXPECT_TRUE(doc["recommendations"].contains("1002"));

  bool found_row = false;
  for (const auto &diag : doc["diagnostics"]) {
    if (diag["kind"] == "row_parse_error") {
      EXPECT_EQ(diag["row_index"], 4);
      found_row = true;
    }
  }
  EXPECT_TRUE(found_row);

  auto metrics_path = test_dir / "metrics.prom";
  ASSERT_TRUE(MetricsRegistry::instance().write_text_file(metrics_path.string()));
  std::string metrics_text = read_file(metrics_path);
  EXPECT_NE(metrics_text.find("lms_rows_read_total"), std::string::npos);
  EXPECT_NE(metrics_text.find("lms_stage_duration_seconds"), std::string::npos);
}
