// minml/basic/diagnostic.hpp - Structured diagnostics
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minml/basic/span.hpp"

namespace minml
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle : uint8_t {
  Primary,    // the offending source
  Secondary,  // related context
};

struct Label
{
  Span span;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// A suggested edit: replace `span` by `replacement` (insert when `span` is empty).
struct FixIt
{
  Span span;
  std::string replacement;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "lex::invalid_int"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] Span primary_span() const noexcept;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// Append an error with one primary label. The returned reference is valid
  /// until the next diagnostic is added.
  Diagnostic & report_error(Span span, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace minml
