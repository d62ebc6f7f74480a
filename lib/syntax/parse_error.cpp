// minml/syntax/parse_error.cpp - Syntax error messages
#include "minml/syntax/parse_error.hpp"

namespace minml::syntax
{
namespace
{

std::string quoted(const Token & tok)
{
  if (tok.is(TokenKind::Eof)) {
    return "end of input";
  }
  return "`" + to_display(tok) + "`";
}

}  // namespace

ParseError ParseError::unexpected_token(std::string expected, Token found, Span span)
{
  ParseError e(ParseErrorKind::UnexpectedToken, span);
  e.expected_ = std::move(expected);
  e.found_ = std::move(found);
  return e;
}

ParseError ParseError::unexpected_eof(std::string expected, Span span)
{
  ParseError e(ParseErrorKind::UnexpectedEof, span);
  e.expected_ = std::move(expected);
  e.found_ = Token(TokenKind::Eof);
  return e;
}

ParseError ParseError::expected_type(Token found, Span span)
{
  ParseError e(ParseErrorKind::ExpectedType, span);
  e.expected_ = "a type";
  e.found_ = std::move(found);
  return e;
}

ParseError ParseError::expected_primary(Token found, Span span)
{
  ParseError e(ParseErrorKind::ExpectedPrimary, span);
  e.expected_ = "an expression";
  e.found_ = std::move(found);
  return e;
}

ParseError ParseError::expected_delimiter(
  TokenKind expected, TokenKind opened, Span open_span, Span end_span)
{
  ParseError e(ParseErrorKind::ExpectedDelimiter, end_span);
  e.expected_ = std::string(to_string(expected));
  e.opened_ = to_string(opened);
  e.open_span_ = open_span;
  return e;
}

ParseError ParseError::expected_literal(Token found, Span span)
{
  ParseError e(ParseErrorKind::ExpectedLiteral, span);
  e.expected_ = "a literal";
  e.found_ = std::move(found);
  return e;
}

std::string_view ParseError::code() const noexcept
{
  switch (kind_) {
    case ParseErrorKind::UnexpectedToken:
      return "parse::unexpected_token";
    case ParseErrorKind::UnexpectedEof:
      return "parse::unexpected_eof";
    case ParseErrorKind::ExpectedType:
      return "parse::expected_type";
    case ParseErrorKind::ExpectedPrimary:
      return "parse::expected_primary";
    case ParseErrorKind::ExpectedDelimiter:
      return "parse::expected_delimiter";
    case ParseErrorKind::ExpectedLiteral:
      return "parse::expected_literal";
  }
  return "parse::unexpected_token";
}

std::string ParseError::message() const
{
  switch (kind_) {
    case ParseErrorKind::UnexpectedToken:
    case ParseErrorKind::ExpectedType:
    case ParseErrorKind::ExpectedPrimary:
    case ParseErrorKind::ExpectedLiteral:
      return "expected " + expected_ + ", found " + quoted(*found_);
    case ParseErrorKind::UnexpectedEof:
      return "unexpected end of input, expected " + expected_;
    case ParseErrorKind::ExpectedDelimiter:
      return "unclosed delimiter `" + std::string(opened_) + "`, expected `" + expected_ + "`";
  }
  return {};
}

std::optional<std::string> ParseError::help() const
{
  switch (kind_) {
    case ParseErrorKind::ExpectedType:
      return std::string("types are `int`, `bool`, `char`, `real`, `unit` or `()`");
    case ParseErrorKind::ExpectedPrimary:
      return std::string(
        "an expression starts with a literal, a name, `(`, `let`, `if`, `~`, `not` or `&`");
    case ParseErrorKind::ExpectedDelimiter:
      return "add `" + expected_ + "` to close the `" + std::string(opened_) + "`";
    case ParseErrorKind::UnexpectedEof:
      return std::string("the input ends in the middle of a construct");
    default:
      return std::nullopt;
  }
}

Diagnostic ParseError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(code());
  d.message = message();

  switch (kind_) {
    case ParseErrorKind::UnexpectedToken:
      d.labels.push_back(Label{span_, "unexpected " + quoted(*found_), LabelStyle::Primary});
      break;
    case ParseErrorKind::UnexpectedEof:
      d.labels.push_back(Label{span_, "expected " + expected_, LabelStyle::Primary});
      break;
    case ParseErrorKind::ExpectedType:
      d.labels.push_back(Label{span_, "not a type", LabelStyle::Primary});
      break;
    case ParseErrorKind::ExpectedPrimary:
      d.labels.push_back(Label{span_, "expected an expression here", LabelStyle::Primary});
      break;
    case ParseErrorKind::ExpectedLiteral:
      d.labels.push_back(Label{span_, "expected a literal here", LabelStyle::Primary});
      break;
    case ParseErrorKind::ExpectedDelimiter:
      d.labels.push_back(Label{span_, "expected `" + expected_ + "`", LabelStyle::Primary});
      d.labels.push_back(
        Label{open_span_, "unclosed `" + std::string(opened_) + "` opened here",
              LabelStyle::Secondary});
      d.fixits.push_back(FixIt{Span{span_.src(), span_.start(), span_.start()}, expected_});
      break;
  }

  d.help_message = help();
  return d;
}

}  // namespace minml::syntax
