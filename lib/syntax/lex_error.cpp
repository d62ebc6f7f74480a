// minml/syntax/lex_error.cpp - Lexical error messages
#include "minml/syntax/lex_error.hpp"

#include "minml/basic/text.hpp"

namespace minml::syntax
{

LexError LexError::invalid_int(std::string lexeme)
{
  return LexError(LexErrorKind::InvalidInt, std::move(lexeme));
}

LexError LexError::invalid_float(std::string lexeme)
{
  return LexError(LexErrorKind::InvalidFloat, std::move(lexeme));
}

LexError LexError::empty_char() { return LexError(LexErrorKind::EmptyChar); }

LexError LexError::multi_char() { return LexError(LexErrorKind::MultiChar); }

LexError LexError::unknown_escape(char32_t c)
{
  LexError e(LexErrorKind::UnknownEscape, "\\" + encode_utf8(c));
  e.escape_ = c;
  return e;
}

LexError LexError::unterminated_char() { return LexError(LexErrorKind::UnterminatedChar); }

LexError LexError::invalid_number_char(std::string lexeme)
{
  return LexError(LexErrorKind::InvalidNumberChar, std::move(lexeme));
}

LexError LexError::invalid_token(std::string lexeme)
{
  return LexError(LexErrorKind::InvalidToken, std::move(lexeme));
}

std::string_view LexError::code() const noexcept
{
  switch (kind_) {
    case LexErrorKind::InvalidInt:
      return "lex::invalid_int";
    case LexErrorKind::InvalidFloat:
      return "lex::invalid_float";
    case LexErrorKind::EmptyChar:
      return "lex::empty_char";
    case LexErrorKind::MultiChar:
      return "lex::multi_char";
    case LexErrorKind::UnknownEscape:
      return "lex::unknown_escape";
    case LexErrorKind::UnterminatedChar:
      return "lex::unterminated_char";
    case LexErrorKind::InvalidNumberChar:
      return "lex::invalid_number_char";
    case LexErrorKind::InvalidToken:
      return "lex::invalid_token";
  }
  return "lex::invalid_token";
}

std::string LexError::message() const
{
  switch (kind_) {
    case LexErrorKind::InvalidInt:
      return "invalid integer literal `" + lexeme_ + "`";
    case LexErrorKind::InvalidFloat:
      return "invalid real literal `" + lexeme_ + "`";
    case LexErrorKind::EmptyChar:
      return "empty character literal";
    case LexErrorKind::MultiChar:
      return "character literal may only contain one character";
    case LexErrorKind::UnknownEscape:
      return "unknown character escape `" + lexeme_ + "`";
    case LexErrorKind::UnterminatedChar:
      return "unterminated character literal";
    case LexErrorKind::InvalidNumberChar:
      return "invalid character in numeric literal `" + lexeme_ + "`";
    case LexErrorKind::InvalidToken:
      return "unexpected character `" + lexeme_ + "`";
  }
  return {};
}

std::string LexError::label() const
{
  switch (kind_) {
    case LexErrorKind::InvalidInt:
      return "does not fit in 64 bits";
    case LexErrorKind::InvalidFloat:
      return "not a valid real number";
    case LexErrorKind::EmptyChar:
      return "expected a character between the quotes";
    case LexErrorKind::MultiChar:
      return "more than one character";
    case LexErrorKind::UnknownEscape:
      return "unknown escape";
    case LexErrorKind::UnterminatedChar:
      return "missing closing `'`";
    case LexErrorKind::InvalidNumberChar:
      return "numbers cannot run into letters or `_`";
    case LexErrorKind::InvalidToken:
      return "not valid here";
  }
  return {};
}

std::optional<std::string> LexError::help() const
{
  switch (kind_) {
    case LexErrorKind::InvalidInt:
      return std::string("integer literals must be below 2^64");
    case LexErrorKind::InvalidFloat:
      return std::string("real literals look like `1.5`, `.5`, `3.` or `2e10`");
    case LexErrorKind::EmptyChar:
      return std::string("a quote character is written `'\\''`");
    case LexErrorKind::MultiChar:
      return std::string("use exactly one character or one escape sequence");
    case LexErrorKind::UnknownEscape:
      return std::string("supported escapes are \\' \\\" \\\\ \\n \\r \\t \\0");
    case LexErrorKind::UnterminatedChar:
      return std::string("close the literal with `'` on the same line");
    case LexErrorKind::InvalidNumberChar:
      return std::string("separate the number from the following name with a space");
    case LexErrorKind::InvalidToken:
      if (lexeme_ == "|") {
        return std::string("did you mean `||`?");
      }
      if (lexeme_ == ".") {
        return std::string("a real literal needs a digit after `.`");
      }
      return std::nullopt;
  }
  return std::nullopt;
}

Diagnostic to_diagnostic(const Spanned<LexError> & err)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(err->code());
  d.message = err->message();
  d.labels.push_back(Label{err.span(), err->label(), LabelStyle::Primary});
  d.help_message = err->help();
  return d;
}

}  // namespace minml::syntax
