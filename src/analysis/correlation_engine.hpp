#ifndef CORRELATION_ENGINE_HPP
#define CORRELATION_ENGINE_HPP

#include "analysis/features.hpp"
#include "analysis/student_profile.hpp"
#include "core/diagnostics.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace analytics {

enum class CorrelationStatus { OK, INSUFFICIENT_DATA };

const char *correlation_status_to_string(CorrelationStatus status);

struct CorrelationEntry {
  Feature feature = Feature::TOTAL_EVENTS;
  std::string feature_name;
  std::optional<double> coefficient; // In [-1, 1]; nullopt when undefined
  size_t sample_size = 0;
  // "zero_feature_variance", "zero_grade_variance" or "insufficient_data"
  std::string undefined_reason;

  bool defined() const { return coefficient.has_value(); }
};

struct CorrelationResult {
  CorrelationStatus status = CorrelationStatus::INSUFFICIENT_DATA;
  size_t sample_size = 0;
  // Defined entries by |r| descending, then undefined entries by name
  std::vector<CorrelationEntry> entries;
  std::vector<Diagnostic> diagnostics;

  const CorrelationEntry *find(Feature feature) const;
};

class CorrelationEngine {
public:
  // Pearson coefficient of each feature against final grade, over the
  // students that have a grade.
  CorrelationResult
  compute(const std::map<std::string, StudentProfile> &profiles) const;

  // Returns nullopt when either column has zero variance or fewer than two
  // samples. Throws std::invalid_argument on mismatched lengths.
  static std::optional<double> pearson(const std::vector<double> &x,
                                       const std::vector<double> &y);
};

} // namespace analytics

#endif // CORRELATION_ENGINE_HPP
