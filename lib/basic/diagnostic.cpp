// minml/basic/diagnostic.cpp - Diagnostic implementation
#include "minml/basic/diagnostic.hpp"

#include <utility>

namespace minml
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

Span Diagnostic::primary_span() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->span;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

Diagnostic & DiagnosticBag::report_error(Span span, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.message = std::move(message);
  d.labels.push_back(Label{span, std::move(label_message), LabelStyle::Primary});
  diagnostics_.push_back(std::move(d));
  return diagnostics_.back();
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

}  // namespace minml
