// minml/syntax/parse_error.hpp - Syntactic error taxonomy
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "minml/basic/diagnostic.hpp"
#include "minml/basic/span.hpp"
#include "minml/syntax/token.hpp"

namespace minml::syntax
{

enum class ParseErrorKind : uint8_t {
  UnexpectedToken,
  UnexpectedEof,
  ExpectedType,
  ExpectedPrimary,
  ExpectedDelimiter,
  ExpectedLiteral,  // reserved for literal-only positions
};

/**
 * The first syntax error of a parse.
 *
 * `span()` is the offending location. For ExpectedDelimiter it is the token
 * found instead of the closer (`end_span()`), and `open_span()` points at
 * the unmatched opener.
 */
class ParseError
{
public:
  [[nodiscard]] static ParseError unexpected_token(std::string expected, Token found, Span span);
  [[nodiscard]] static ParseError unexpected_eof(std::string expected, Span span);
  [[nodiscard]] static ParseError expected_type(Token found, Span span);
  [[nodiscard]] static ParseError expected_primary(Token found, Span span);
  [[nodiscard]] static ParseError expected_delimiter(
    TokenKind expected, TokenKind opened, Span open_span, Span end_span);
  [[nodiscard]] static ParseError expected_literal(Token found, Span span);

  [[nodiscard]] ParseErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] Span span() const noexcept { return span_; }
  [[nodiscard]] const std::string & expected() const noexcept { return expected_; }
  [[nodiscard]] const std::optional<Token> & found() const noexcept { return found_; }

  // ExpectedDelimiter only
  [[nodiscard]] std::string_view opened() const noexcept { return opened_; }
  [[nodiscard]] Span open_span() const noexcept { return open_span_; }
  [[nodiscard]] Span end_span() const noexcept { return span_; }

  [[nodiscard]] std::string_view code() const noexcept;
  [[nodiscard]] std::string message() const;
  [[nodiscard]] std::optional<std::string> help() const;

  [[nodiscard]] Diagnostic to_diagnostic() const;

private:
  ParseError(ParseErrorKind kind, Span span) : kind_(kind), span_(span) {}

  ParseErrorKind kind_;
  Span span_;
  std::string expected_;
  std::optional<Token> found_;
  std::string_view opened_;
  Span open_span_;
};

}  // namespace minml::syntax
