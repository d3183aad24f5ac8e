#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class DiagnosticKind {
  ROW_PARSE_ERROR,      // Row excluded
  ROW_CORRECTED,        // Row kept, a field was dropped or clamped
  DUPLICATE_ROW,        // Exact duplicate row excluded
  INSUFFICIENT_DATA,    // A component result is undefined
  NUMERIC_DEGENERACY,   // NaN/inf/zero-variance substituted
  PARAMETER_ADJUSTMENT, // A configured parameter was adjusted for the data
  INVALID_FILTER        // Timeframe filter ignored
};

struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::ROW_PARSE_ERROR;
  std::string component;
  std::optional<uint64_t> row_index;
  // Student id or feature name the diagnostic is about, when relevant
  std::string subject;
  std::string raw_content;
  std::string message;
};

const char *diagnostic_kind_to_string(DiagnosticKind kind);

Diagnostic make_row_diagnostic(DiagnosticKind kind, uint64_t row_index,
                               const std::string &raw_content,
                               const std::string &message);

Diagnostic make_diagnostic(DiagnosticKind kind, const std::string &component,
                           const std::string &subject,
                           const std::string &message);

size_t count_diagnostics(const std::vector<Diagnostic> &diagnostics,
                         DiagnosticKind kind);

#endif // DIAGNOSTICS_HPP
