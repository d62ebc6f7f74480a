// minml/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context and caret markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "minml/basic/diagnostic.hpp"
#include "minml/basic/source_manager.hpp"

namespace minml
{

/**
 * Prints diagnostics in Rust-style format:
 *
 *   error[lex::invalid_int]: invalid integer literal
 *     --> main.mml:1:9
 *         |
 *       1 | val x = 99999999999999999999
 *         |         ^^^^^^^^^^^^^^^^^^^^ does not fit in 64 bits
 *         |
 *         = help: integer literals must be below 2^64
 *
 * Only the (src, offset, length) projection of each label is consulted; line
 * and column are resolved through the registry.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Emit ANSI colours through rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace minml
