// minml/syntax/lex_error.hpp - Lexical error taxonomy
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "minml/basic/diagnostic.hpp"
#include "minml/basic/span.hpp"

namespace minml::syntax
{

enum class LexErrorKind : uint8_t {
  InvalidInt,
  InvalidFloat,
  EmptyChar,
  MultiChar,
  UnknownEscape,
  UnterminatedChar,
  InvalidNumberChar,
  InvalidToken,
};

/**
 * A single lexical error. The lexer pairs it with its span.
 *
 * `lexeme()` is the offending source text (number run, stray character);
 * `escape()` is set for UnknownEscape only.
 */
class LexError
{
public:
  [[nodiscard]] static LexError invalid_int(std::string lexeme);
  [[nodiscard]] static LexError invalid_float(std::string lexeme);
  [[nodiscard]] static LexError empty_char();
  [[nodiscard]] static LexError multi_char();
  [[nodiscard]] static LexError unknown_escape(char32_t c);
  [[nodiscard]] static LexError unterminated_char();
  [[nodiscard]] static LexError invalid_number_char(std::string lexeme);
  [[nodiscard]] static LexError invalid_token(std::string lexeme);

  [[nodiscard]] LexErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & lexeme() const noexcept { return lexeme_; }
  [[nodiscard]] std::optional<char32_t> escape() const noexcept { return escape_; }

  /// Machine code, e.g. "lex::invalid_int"
  [[nodiscard]] std::string_view code() const noexcept;
  [[nodiscard]] std::string message() const;
  [[nodiscard]] std::string label() const;
  [[nodiscard]] std::optional<std::string> help() const;

  [[nodiscard]] bool operator==(const LexError & other) const
  {
    return kind_ == other.kind_ && lexeme_ == other.lexeme_ && escape_ == other.escape_;
  }
  [[nodiscard]] bool operator!=(const LexError & other) const { return !(*this == other); }

private:
  explicit LexError(LexErrorKind kind, std::string lexeme = {})
  : kind_(kind), lexeme_(std::move(lexeme))
  {
  }

  LexErrorKind kind_;
  std::string lexeme_;
  std::optional<char32_t> escape_;
};

[[nodiscard]] Diagnostic to_diagnostic(const Spanned<LexError> & err);

}  // namespace minml::syntax
