// minml/syntax/lexer.hpp - Hand-written lexer
#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "minml/basic/result.hpp"
#include "minml/basic/span.hpp"
#include "minml/syntax/lex_error.hpp"
#include "minml/syntax/token.hpp"

namespace minml::syntax
{

using TokenStream = std::vector<Spanned<Token>>;
using LexErrors = std::vector<Spanned<LexError>>;
using LexResult = Result<TokenStream, LexErrors>;

/**
 * Greedy, longest-match lexer over one source.
 *
 * Every error found during a full scan is collected; the result is a
 * failure iff at least one was recorded. On success the stream ends with
 * exactly one Eof token spanning [len, len).
 */
class Lexer
{
public:
  Lexer(SourceId src, std::string_view input) : src_(src), input_(input) {}

  [[nodiscard]] LexResult lex_all();

private:
  /// Lex one token at pos_ (whitespace already skipped). Returns nullopt
  /// when an error was recorded instead.
  [[nodiscard]] std::optional<Spanned<Token>> next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= input_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < input_.size()) ? input_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, input_.size()); }

  void skip_whitespace();

  [[nodiscard]] std::optional<Spanned<Token>> lex_identifier_or_keyword();
  [[nodiscard]] std::optional<Spanned<Token>> lex_number();
  [[nodiscard]] std::optional<Spanned<Token>> lex_char();
  [[nodiscard]] std::optional<Spanned<Token>> lex_invalid();

  /// Decode the UTF-8 scalar at pos_ and step over it.
  [[nodiscard]] char32_t consume_scalar();

  [[nodiscard]] uint32_t offset() const noexcept { return static_cast<uint32_t>(pos_); }
  [[nodiscard]] Span make_span(uint32_t start) const noexcept { return {src_, start, offset()}; }
  [[nodiscard]] std::string_view slice(uint32_t start) const noexcept
  {
    return input_.substr(start, pos_ - start);
  }

  [[nodiscard]] Spanned<Token> emit(Token tok, uint32_t start) const
  {
    return {std::move(tok), make_span(start)};
  }
  void error(LexError err, uint32_t start)
  {
    errors_.emplace_back(std::move(err), make_span(start));
  }

  SourceId src_;
  std::string_view input_;
  size_t pos_ = 0;
  LexErrors errors_;
};

/// Lex `input` as source `src`.
[[nodiscard]] LexResult lex(SourceId src, std::string_view input);

}  // namespace minml::syntax
