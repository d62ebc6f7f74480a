// minml/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "minml/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace minml
{

namespace
{

constexpr std::string_view k_tab_expansion = "    ";

/// Expand tabs so that caret columns line up with the printed text.
std::string clean_line(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += k_tab_expansion;
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

/// Whitespace prefix reaching 1-indexed column `col` of `line`.
std::string column_prefix(std::string_view line, uint32_t col)
{
  std::string prefix;
  for (size_t i = 0; i + 1 < col && i < line.size(); ++i) {
    prefix += (line[i] == '\t') ? std::string(k_tab_expansion) : std::string(1, ' ');
  }
  return prefix;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const Span primary = diag.primary_span();

  std::string filename = "<unknown>";
  if (primary.is_valid()) {
    const auto & abs_path = sources.get_path(primary.src());
    std::error_code ec;
    const auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
  }
  const FullSourceRange primary_fr = sources.get_full_range(primary);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_span().start() < b.primary_span().start();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << to_string(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  if (label.span.is_invalid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const SourceFile * source = sources.get_file(label.span.src());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = source->get_full_range(label.span);
  if (!fr.is_valid()) {
    return;
  }

  // Multi-line spans are underlined to the end of their first line.
  uint32_t end_col = fr.start_column + 1;
  if (fr.end_line == fr.start_line && fr.end_column > fr.start_column) {
    end_col = fr.end_column;
  } else if (fr.end_line > fr.start_line) {
    end_col = static_cast<uint32_t>(source->get_line(fr.start_line - 1).size()) + 1;
    end_col = std::max(end_col, fr.start_column + 1);
  }

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  const uint32_t line_num = line_index + 1;

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", clean_line(line));

  fmt::print(os_, "      {} {}", gutter_pipe_only(), column_prefix(line, start_col));

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(fixit.span.src());
  const FullSourceRange fr = sources.get_full_range(fixit.span);

  fmt::print(os_, "{}\n", gutter_pipe());
  if (source == nullptr || !fr.is_valid()) {
    fmt::print(os_, "      = fix: insert `{}`\n", fixit.replacement);
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": insert `{}` here\n", fixit.replacement);
  } else {
    fmt::print(os_, "help: insert `{}` here\n", fixit.replacement);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  // Splice the replacement into the line at the fix-it column.
  const std::string_view line = source->get_line(fr.start_line - 1);
  const size_t split = std::min<size_t>(fr.start_column - 1, line.size());
  size_t end_split = split;
  if (fr.end_line == fr.start_line) {
    end_split = std::min<size_t>(std::max(fr.end_column, fr.start_column) - 1, line.size());
  }
  std::string fixed(line.substr(0, split));
  fixed += fixit.replacement;
  fixed += line.substr(end_split);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fr.start_line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", clean_line(fixed));

  fmt::print(
    os_, "      {} {}", gutter_pipe_only(), column_prefix(line, fr.start_column));
  const std::string pluses(std::max<size_t>(fixit.replacement.size(), 1), '+');
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << pluses << rang::style::reset
        << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", pluses);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return "\033[1;36m  -->\033[0m";
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return "\033[1;36m      |\033[0m";
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return "\033[1;36m|\033[0m";
  }
  return "|";
}

}  // namespace minml
