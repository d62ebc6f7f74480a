// minml/syntax/lexer.cpp - Lexer implementation
#include "minml/syntax/lexer.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

#include "minml/basic/ident.hpp"
#include "minml/syntax/keywords.hpp"

namespace minml::syntax
{
namespace
{

constexpr char32_t k_replacement = 0xFFFD;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_ident_start(char c) { return is_alpha(c) || c == '_'; }
bool is_ident_continue(char c) { return is_alpha(c) || is_digit(c) || c == '_'; }

bool is_whitespace(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\f';
}

/// Byte length of the UTF-8 sequence introduced by `lead` (1 when malformed).
size_t utf8_length(unsigned char lead)
{
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return input_.size() >= pos_ + s.size() && input_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_whitespace(peek())) {
    advance(1);
  }
}

char32_t Lexer::consume_scalar()
{
  const auto lead = static_cast<unsigned char>(peek());
  const size_t len = utf8_length(lead);

  if (len == 1) {
    advance(1);
    return lead < 0x80 ? static_cast<char32_t>(lead) : k_replacement;
  }

  static constexpr unsigned char k_lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};
  char32_t cp = lead & k_lead_mask[len];
  for (size_t i = 1; i < len; ++i) {
    const auto cont = static_cast<unsigned char>(peek(i));
    if (pos_ + i >= input_.size() || (cont & 0xC0) != 0x80) {
      // Truncated sequence: step over the lead byte only.
      advance(1);
      return k_replacement;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  advance(len);
  // Overlong forms, surrogates and values past U+10FFFF are not scalars.
  static constexpr char32_t k_min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < k_min_for_len[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    return k_replacement;
  }
  return cp;
}

LexResult Lexer::lex_all()
{
  TokenStream out;
  errors_.clear();
  pos_ = 0;

  while (true) {
    skip_whitespace();
    if (eof()) {
      break;
    }
    if (auto tok = next_token()) {
      out.push_back(std::move(*tok));
    }
  }

  const auto len = static_cast<uint32_t>(input_.size());
  out.emplace_back(Token(TokenKind::Eof), Span{src_, len, len});

  if (!errors_.empty()) {
    return make_err(std::move(errors_));
  }
  return LexResult(std::move(out));
}

std::optional<Spanned<Token>> Lexer::next_token()
{
  const char c = peek();

  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
    return lex_number();
  }
  if (c == '\'') {
    return lex_char();
  }

  const uint32_t start = offset();

  // Two-character operators
  struct Punct
  {
    std::string_view text;
    TokenKind kind;
  };
  static constexpr Punct k_double[] = {
    {"::", TokenKind::Cons},  {":=", TokenKind::ColonEq}, {"<>", TokenKind::NotEq},
    {"<=", TokenKind::LessEq}, {">=", TokenKind::GtEq},   {"&&", TokenKind::AndAnd},
    {"||", TokenKind::OrOr},
  };
  for (const auto & p : k_double) {
    if (starts_with(p.text)) {
      advance(2);
      return emit(Token(p.kind), start);
    }
  }

  TokenKind kind = TokenKind::Eof;
  switch (c) {
    case ',':
      kind = TokenKind::Comma;
      break;
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '=':
      kind = TokenKind::Eq;
      break;
    case '~':
      kind = TokenKind::Tilde;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case ':':
      kind = TokenKind::Colon;
      break;
    case '<':
      kind = TokenKind::Less;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    case '&':
      kind = TokenKind::And;
      break;
    default:
      // Lone `|`, `.` without a digit, and anything unknown.
      return lex_invalid();
  }

  advance(1);
  return emit(Token(kind), start);
}

std::optional<Spanned<Token>> Lexer::lex_invalid()
{
  const uint32_t start = offset();
  (void)consume_scalar();
  error(LexError::invalid_token(std::string(slice(start))), start);
  return std::nullopt;
}

std::optional<Spanned<Token>> Lexer::lex_identifier_or_keyword()
{
  const uint32_t start = offset();
  while (!eof() && is_ident_continue(peek())) {
    advance(1);
  }

  const std::string_view text = slice(start);
  if (text == k_true || text == k_false) {
    return emit(Token::bool_lit(text == k_true), start);
  }
  if (const auto kw = lookup_keyword(text)) {
    return emit(Token(*kw), start);
  }
  return emit(Token::ident(Ident::intern(text)), start);
}

std::optional<Spanned<Token>> Lexer::lex_number()
{
  const uint32_t start = offset();
  bool is_real = false;

  auto skip_digits = [this] {
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  };

  // digit+ ('.' digit*)?  |  '.' digit+
  skip_digits();
  if (peek() == '.') {
    is_real = true;
    advance(1);
    skip_digits();
  }

  // ([eE][+-]?digit+)?
  if (peek() == 'e' || peek() == 'E') {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      is_real = true;
      advance(1 + sign);
      skip_digits();
    }
  }

  // A number running straight into a name, e.g. `12ab` or `1.5x`.
  if (!eof() && is_ident_continue(peek())) {
    while (!eof() && is_ident_continue(peek())) {
      advance(1);
    }
    error(LexError::invalid_number_char(std::string(slice(start))), start);
    return std::nullopt;
  }

  const std::string_view text = slice(start);

  if (is_real) {
    // strtod requires a null-terminated string.
    const std::string tmp(text);
    char * end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size()) {
      error(LexError::invalid_float(tmp), start);
      return std::nullopt;
    }
    return emit(Token::real_lit(v), start);
  }

  uint64_t v = 0;
  const auto res = std::from_chars(text.data(), text.data() + text.size(), v);
  if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
    error(LexError::invalid_int(std::string(text)), start);
    return std::nullopt;
  }
  return emit(Token::int_lit(v), start);
}

std::optional<Spanned<Token>> Lexer::lex_char()
{
  const uint32_t start = offset();
  advance(1);  // opening quote

  if (eof() || peek() == '\n') {
    error(LexError::unterminated_char(), start);
    return std::nullopt;
  }
  if (peek() == '\'') {
    advance(1);
    error(LexError::empty_char(), start);
    return std::nullopt;
  }

  char32_t value = 0;
  std::optional<Spanned<LexError>> bad_escape;

  if (peek() == '\\') {
    const uint32_t esc_start = offset();
    advance(1);
    if (eof() || peek() == '\n') {
      error(LexError::unterminated_char(), start);
      return std::nullopt;
    }
    const char32_t e = consume_scalar();
    switch (e) {
      case U'\'':
        value = U'\'';
        break;
      case U'"':
        value = U'"';
        break;
      case U'\\':
        value = U'\\';
        break;
      case U'n':
        value = U'\n';
        break;
      case U'r':
        value = U'\r';
        break;
      case U't':
        value = U'\t';
        break;
      case U'0':
        value = U'\0';
        break;
      default:
        bad_escape.emplace(LexError::unknown_escape(e), make_span(esc_start));
        break;
    }
  } else {
    value = consume_scalar();
  }

  if (peek() == '\'') {
    advance(1);
    if (bad_escape) {
      errors_.push_back(std::move(*bad_escape));
      return std::nullopt;
    }
    return emit(Token::char_lit(value), start);
  }

  // Resynchronize on the closing quote of the same line.
  while (!eof() && peek() != '\n' && peek() != '\'') {
    if (peek() == '\\' && peek(1) != '\n' && pos_ + 1 < input_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (peek() == '\'') {
    advance(1);
    error(LexError::multi_char(), start);
  } else {
    error(LexError::unterminated_char(), start);
  }
  return std::nullopt;
}

LexResult lex(SourceId src, std::string_view input) { return Lexer(src, input).lex_all(); }

}  // namespace minml::syntax
