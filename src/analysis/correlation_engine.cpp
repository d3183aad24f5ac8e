#include "analysis/correlation_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace analytics {

namespace {
constexpr const char *REASON_INSUFFICIENT_DATA = "insufficient_data";
constexpr const char *REASON_ZERO_FEATURE_VARIANCE = "zero_feature_variance";
constexpr const char *REASON_ZERO_GRADE_VARIANCE = "zero_grade_variance";

bool has_zero_variance(const std::vector<double> &values) {
  return std::all_of(values.begin(), values.end(),
                     [&](double v) { return v == values.front(); });
}

void rank_entries(std::vector<CorrelationEntry> &entries) {
  std::sort(entries.begin(), entries.end(),
            [](const CorrelationEntry &a, const CorrelationEntry &b) {
              if (a.defined() != b.defined())
                return a.defined();
              if (a.defined()) {
                double abs_a = std::fabs(*a.coefficient);
                double abs_b = std::fabs(*b.coefficient);
                if (abs_a != abs_b)
                  return abs_a > abs_b;
              }
              return a.feature_name < b.feature_name;
            });
}
} // namespace

const char *correlation_status_to_string(CorrelationStatus status) {
  switch (status) {
  case CorrelationStatus::OK:
    return "ok";
  case CorrelationStatus::INSUFFICIENT_DATA:
    return "insufficient_data";
  }
  return "unknown";
}

const CorrelationEntry *CorrelationResult::find(Feature feature) const {
  for (const auto &entry : entries) {
    if (entry.feature == feature)
      return &entry;
  }
  return nullptr;
}

std::optional<double> CorrelationEngine::pearson(const std::vector<double> &x,
                                                 const std::vector<double> &y) {
  if (x.size() != y.size())
    throw std::invalid_argument("pearson: input columns differ in length");
  if (x.size() < 2)
    return std::nullopt;

  double n = static_cast<double>(x.size());
  double mean_x = 0.0, mean_y = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    mean_x += x[i];
    mean_y += y[i];
  }
  mean_x /= n;
  mean_y /= n;

  double cov = 0.0, var_x = 0.0, var_y = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    double dx = x[i] - mean_x;
    double dy = y[i] - mean_y;
    cov += dx * dy;
    var_x += dx * dx;
    var_y += dy * dy;
  }
  if (var_x <= 0.0 || var_y <= 0.0)
    return std::nullopt;

  double r = cov / std::sqrt(var_x * var_y);
  if (!std::isfinite(r))
    return std::nullopt;
  return std::clamp(r, -1.0, 1.0);
}

CorrelationResult CorrelationEngine::compute(
    const std::map<std::string, StudentProfile> &profiles) const {
  ScopedTimer timer(PipelineMetrics::instance().stage_timer("correlation"));
  CorrelationResult result;

  std::vector<const StudentProfile *> graded;
  for (const auto &[id, profile] : profiles) {
    if (profile.final_grade)
      graded.push_back(&profile);
  }
  result.sample_size = graded.size();

  auto make_entry = [&](size_t index) {
    CorrelationEntry entry;
    entry.feature = feature_at(index);
    entry.feature_name = get_feature_name(entry.feature);
    entry.sample_size = graded.size();
    return entry;
  };

  if (graded.size() < 2) {
    result.status = CorrelationStatus::INSUFFICIENT_DATA;
    for (size_t i = 0; i < FEATURE_COUNT; ++i) {
      auto entry = make_entry(i);
      entry.undefined_reason = REASON_INSUFFICIENT_DATA;
      result.entries.push_back(std::move(entry));
    }
    rank_entries(result.entries);
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::INSUFFICIENT_DATA, "correlation", "",
        "Correlation needs at least 2 graded students, found " +
            std::to_string(graded.size())));
    LOG(LogLevel::WARN, LogComponent::CORRELATION,
        "Insufficient graded students for correlation: " << graded.size());
    return result;
  }

  result.status = CorrelationStatus::OK;

  std::vector<double> grades;
  grades.reserve(graded.size());
  for (const auto *profile : graded)
    grades.push_back(*profile->final_grade);
  bool grades_constant = has_zero_variance(grades);
  if (grades_constant) {
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::NUMERIC_DEGENERACY, "correlation", "final_grade",
        "All graded students share the same final grade"));
    LOG(LogLevel::WARN, LogComponent::CORRELATION,
        "Final grades have zero variance; no coefficient is defined");
  }

  for (size_t i = 0; i < FEATURE_COUNT; ++i) {
    auto entry = make_entry(i);
    std::vector<double> column;
    column.reserve(graded.size());
    for (const auto *profile : graded)
      column.push_back(profile->features.values[i]);

    if (grades_constant) {
      entry.undefined_reason = REASON_ZERO_GRADE_VARIANCE;
    } else if (has_zero_variance(column)) {
      entry.undefined_reason = REASON_ZERO_FEATURE_VARIANCE;
      result.diagnostics.push_back(make_diagnostic(
          DiagnosticKind::NUMERIC_DEGENERACY, "correlation", entry.feature_name,
          "Feature is constant across graded students; correlation "
          "undefined"));
      LOG(LogLevel::DEBUG, LogComponent::CORRELATION,
          "Feature " << entry.feature_name << " has zero variance");
    } else {
      entry.coefficient = pearson(column, grades);
      if (!entry.coefficient)
        entry.undefined_reason = REASON_ZERO_FEATURE_VARIANCE;
    }
    result.entries.push_back(std::move(entry));
  }

  rank_entries(result.entries);

  if (!result.entries.empty() && result.entries.front().defined()) {
    const auto &top = result.entries.front();
    LOG(LogLevel::INFO, LogComponent::CORRELATION,
        "Correlated " << FEATURE_COUNT << " features over " << graded.size()
                      << " graded students; strongest is " << top.feature_name
                      << " (r=" << *top.coefficient << ")");
  }
  return result;
}

} // namespace analytics
