#include "core/event_parser.hpp"
#include "core/schema_error.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>

namespace {
const std::string HEADER =
    "student_id,event_type,event_time,module,course,grade,activity_duration\n";

ParseResult parse_text(const std::string &text,
                       Config::ParserConfig config = Config::ParserConfig{}) {
  std::istringstream input(text);
  EventParser parser(config);
  return parser.parse(input);
}

const Diagnostic *find_diagnostic(const ParseResult &result,
                                  DiagnosticKind kind) {
  auto it = std::find_if(
      result.diagnostics.begin(), result.diagnostics.end(),
      [kind](const Diagnostic &d) { return d.kind == kind; });
  return it == result.diagnostics.end() ? nullptr : &*it;
}
} // namespace

TEST(EventParsingTest, ParsesWellFormedRows) {
  auto result = parse_text(
      HEADER + "1001,login,2024-01-15 09:30:00,module_1,course_101,,0\n"
               "1001,assignment_submit,2024-01-15 11:45:00,module_1,course_101,"
               "85,120\n");

  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_EQ(result.rows_read, 2u);
  EXPECT_EQ(result.rows_rejected, 0u);
  EXPECT_TRUE(result.diagnostics.empty());

  const auto &login = result.events[0];
  EXPECT_EQ(login.student_id, "1001");
  EXPECT_EQ(login.type, EventType::LOGIN);
  EXPECT_EQ(login.timestamp_ms, 1705311000000ULL);
  EXPECT_EQ(login.module_id, "module_1");
  EXPECT_EQ(login.course_id, "course_101");
  EXPECT_FALSE(login.grade.has_value());
  ASSERT_TRUE(login.duration_s.has_value());
  EXPECT_DOUBLE_EQ(*login.duration_s, 0.0);
  EXPECT_EQ(login.row_index, 1u);

  const auto &submit = result.events[1];
  EXPECT_EQ(submit.type, EventType::ASSIGNMENT_SUBMIT);
  ASSERT_TRUE(submit.grade.has_value());
  EXPECT_DOUBLE_EQ(*submit.grade, 85.0);
  EXPECT_DOUBLE_EQ(*submit.duration_s, 120.0);
  EXPECT_EQ(submit.row_index, 2u);
}

TEST(EventParsingTest, UnknownEventTypeBecomesDiagnostic) {
  auto result = parse_text(
      HEADER + "1001,login,2024-01-15 09:30:00,m1,c1,,\n"
               "1002,teleport,2024-01-15 10:00:00,m1,c1,,\n"
               "1003,QUIZ_ATTEMPT ,2024-01-15 10:05:00,m1,c1,70,30\n");

  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_EQ(result.rows_rejected, 1u);

  const Diagnostic *diag = find_diagnostic(result, DiagnosticKind::ROW_PARSE_ERROR);
  ASSERT_NE(diag, nullptr);
  ASSERT_TRUE(diag->row_index.has_value());
  EXPECT_EQ(*diag->row_index, 2u);
  EXPECT_NE(diag->raw_content.find("teleport"), std::string::npos);
  EXPECT_EQ(result.events[1].type, EventType::QUIZ_ATTEMPT);
}

TEST(EventParsingTest, RejectsBadTimestampsAndMissingIds) {
  auto result = parse_text(
      HEADER + "1001,login,2024-02-30 09:30:00,m1,c1,,\n"
               ",login,2024-01-15 09:30:00,m1,c1,,\n"
               "1001,login,yesterday,m1,c1,,\n"
               "1001,logout,2024-01-15 09:45:00,m1,c1,,\n");

  EXPECT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.rows_rejected, 3u);
  EXPECT_EQ(count_diagnostics(result.diagnostics, DiagnosticKind::ROW_PARSE_ERROR),
            3u);
}

TEST(EventParsingTest, FieldCountMismatchIsRejected) {
  auto result = parse_text(HEADER + "1001,login,2024-01-15 09:30:00\n"
                                    "1001,login,2024-01-15 09:31:00,m1,c1,,\n");
  EXPECT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.rows_rejected, 1u);
}

TEST(EventParsingTest, OutOfRangeGradeIsDroppedWithCorrection) {
  auto result = parse_text(
      HEADER + "1001,quiz_attempt,2024-01-15 09:30:00,m1,c1,150,60\n"
               "1001,quiz_attempt,2024-01-15 09:40:00,m1,c1,abc,60\n"
               "1001,quiz_attempt,2024-01-15 09:50:00,m1,c1,-,60\n");

  ASSERT_EQ(result.events.size(), 3u);
  for (const auto &event : result.events)
    EXPECT_FALSE(event.grade.has_value());
  EXPECT_EQ(result.rows_corrected, 2u);
  EXPECT_EQ(count_diagnostics(result.diagnostics, DiagnosticKind::ROW_CORRECTED),
            2u);
}

TEST(EventParsingTest, NegativeDurationIsClampedToZero) {
  auto result =
      parse_text(HEADER + "1001,content_view,2024-01-15 09:30:00,m1,c1,,-45\n");

  ASSERT_EQ(result.events.size(), 1u);
  ASSERT_TRUE(result.events[0].duration_s.has_value());
  EXPECT_DOUBLE_EQ(*result.events[0].duration_s, 0.0);
  EXPECT_NE(find_diagnostic(result, DiagnosticKind::ROW_CORRECTED), nullptr);
}

TEST(EventParsingTest, OversizedDurationIsClampedToMaximum) {
  Config::ParserConfig config;
  config.max_activity_duration_seconds = 7200.0;
  auto result = parse_text(
      HEADER + "1001,content_view,2024-01-15 09:30:00,m1,c1,,1e20\n"
               "1001,content_view,2024-01-15 09:40:00,m1,c1,,7200\n",
      config);

  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_DOUBLE_EQ(*result.events[0].duration_s, 7200.0);
  EXPECT_DOUBLE_EQ(*result.events[1].duration_s, 7200.0);
  EXPECT_EQ(result.rows_corrected, 1u);

  const Diagnostic *diag =
      find_diagnostic(result, DiagnosticKind::ROW_CORRECTED);
  ASSERT_NE(diag, nullptr);
  ASSERT_TRUE(diag->row_index.has_value());
  EXPECT_EQ(*diag->row_index, 1u);
}

TEST(EventParsingTest, DuplicateRowsAreDropped) {
  std::string row = "1001,login,2024-01-15 09:30:00,m1,c1,,\n";
  auto result = parse_text(HEADER + row + row + row);

  EXPECT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.duplicates_dropped, 2u);
  EXPECT_EQ(count_diagnostics(result.diagnostics, DiagnosticKind::DUPLICATE_ROW),
            2u);

  Config::ParserConfig keep_duplicates;
  keep_duplicates.drop_duplicate_rows = false;
  auto kept = parse_text(HEADER + row + row, keep_duplicates);
  EXPECT_EQ(kept.events.size(), 2u);
}

TEST(EventParsingTest, HeaderAliasesQuotingAndColumnOrder) {
  auto result = parse_text(
      "\xEF\xBB\xBF" "Event_Time, Student_ID ,EVENT_TYPE,module_id,course_id,"
      "duration,notes\r\n"
      "2024-01-15 09:30:00,s-1,Forum_Post,\"Intro, part 1\",c1,30,\"a, b\"\r\n"
      "\r\n"
      "2024-01-15 09:00:00,s-2,download,m2,c1,,\r\n");

  ASSERT_EQ(result.events.size(), 2u);
  // Sorted by timestamp
  EXPECT_EQ(result.events[0].student_id, "s-2");
  EXPECT_EQ(result.events[1].student_id, "s-1");
  EXPECT_EQ(result.events[1].type, EventType::FORUM_POST);
  EXPECT_EQ(result.events[1].module_id, "Intro, part 1");
  EXPECT_DOUBLE_EQ(*result.events[1].duration_s, 30.0);
  EXPECT_EQ(result.events[1].row_index, 1u);
}

TEST(EventParsingTest, StableSortKeepsInputOrderForTies) {
  auto result = parse_text(HEADER + "b,login,2024-01-15 09:30:00,m,c,,\n"
                                    "a,login,2024-01-15 09:30:00,m,c,,\n"
                                    "c,login,2024-01-15 08:00:00,m,c,,\n");
  ASSERT_EQ(result.events.size(), 3u);
  EXPECT_EQ(result.events[0].student_id, "c");
  EXPECT_EQ(result.events[1].student_id, "b");
  EXPECT_EQ(result.events[2].student_id, "a");
}

TEST(EventParsingTest, SchemaErrors) {
  EXPECT_THROW(parse_text(""), SchemaError);
  EXPECT_THROW(parse_text("\n\n"), SchemaError);
  EXPECT_THROW(parse_text("student_id,event_type,module\n1,login,m\n"),
               SchemaError);
  EXPECT_THROW(parse_text(HEADER + "1,teleport,2024-01-15 09:30:00,m,c,,\n"),
               SchemaError);
  EXPECT_THROW(parse_text(HEADER), SchemaError);

  Config::ParserConfig needs_grade;
  needs_grade.required_columns = {"student_id", "event_type", "event_time",
                                  "grade"};
  EXPECT_THROW(parse_text("student_id,event_type,event_time\n"
                          "1,login,2024-01-15 09:30:00\n",
                          needs_grade),
               SchemaError);
}

TEST(EventParsingTest, TimeframeFilter) {
  auto result = parse_text(HEADER + "1,login,2023-12-31 23:00:00,m,c,,\n"
                                    "1,login,2024-01-15 09:30:00,m,c,,\n"
                                    "1,login,2024-02-01 09:30:00,m,c,,\n");

  std::vector<Diagnostic> diagnostics;
  auto january = EventParser::filter_by_timeframe(result.events, "2024-01",
                                                  diagnostics);
  ASSERT_EQ(january.size(), 1u);
  EXPECT_EQ(Utils::month_of_year(january[0].timestamp_ms), 1);

  auto year = EventParser::filter_by_timeframe(result.events, "2024",
                                               diagnostics);
  EXPECT_EQ(year.size(), 2u);
  EXPECT_TRUE(diagnostics.empty());

  auto all = EventParser::filter_by_timeframe(result.events, "2024-13",
                                              diagnostics);
  EXPECT_EQ(all.size(), 3u);
  ASSERT_EQ(diagnostics.size(), 1u);
  EXPECT_EQ(diagnostics[0].kind, DiagnosticKind::INVALID_FILTER);
}

TEST(EventParsingTest, EventTypeLookup) {
  EXPECT_EQ(event_type_from_string(" Content_View "), EventType::CONTENT_VIEW);
  EXPECT_FALSE(event_type_from_string("lecture").has_value());
  EXPECT_EQ(event_category(EventType::FORUM_REPLY), EventCategory::SOCIAL);
  EXPECT_EQ(event_category(EventType::EXAM_START), EventCategory::ASSESSMENT);
  EXPECT_STREQ(event_type_to_string(EventType::ASSIGNMENT_SUBMIT),
               "assignment_submit");
}
