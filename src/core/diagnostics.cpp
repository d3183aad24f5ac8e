#include "diagnostics.hpp"

#include <algorithm>

const char *diagnostic_kind_to_string(DiagnosticKind kind) {
  switch (kind) {
  case DiagnosticKind::ROW_PARSE_ERROR:
    return "row_parse_error";
  case DiagnosticKind::ROW_CORRECTED:
    return "row_corrected";
  case DiagnosticKind::DUPLICATE_ROW:
    return "duplicate_row";
  case DiagnosticKind::INSUFFICIENT_DATA:
    return "insufficient_data";
  case DiagnosticKind::NUMERIC_DEGENERACY:
    return "numeric_degeneracy";
  case DiagnosticKind::PARAMETER_ADJUSTMENT:
    return "parameter_adjustment";
  case DiagnosticKind::INVALID_FILTER:
    return "invalid_filter";
  }
  return "unknown";
}

Diagnostic make_row_diagnostic(DiagnosticKind kind, uint64_t row_index,
                               const std::string &raw_content,
                               const std::string &message) {
  Diagnostic d;
  d.kind = kind;
  d.component = "parser";
  d.row_index = row_index;
  d.raw_content = raw_content;
  d.message = message;
  return d;
}

Diagnostic make_diagnostic(DiagnosticKind kind, const std::string &component,
                           const std::string &subject,
                           const std::string &message) {
  Diagnostic d;
  d.kind = kind;
  d.component = component;
  d.subject = subject;
  d.message = message;
  return d;
}

size_t count_diagnostics(const std::vector<Diagnostic> &diagnostics,
                         DiagnosticKind kind) {
  return static_cast<size_t>(
      std::count_if(diagnostics.begin(), diagnostics.end(),
                    [kind](const Diagnostic &d) { return d.kind == kind; }));
}
