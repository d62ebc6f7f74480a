// minml/syntax/token.hpp - Terminal alphabet of the language
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "minml/basic/ident.hpp"
#include "minml/basic/span.hpp"

namespace minml::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  // Literals and names (payload-carrying)
  Int,
  Real,
  Bool,  // `true` / `false`
  Char,
  Ident,

  // Keywords
  KwFun,
  KwVal,
  KwLet,
  KwIn,
  KwEnd,
  KwIf,
  KwThen,
  KwElse,
  KwNot,
  KwMut,
  KwWhile,
  KwDo,
  KwMod,
  KwDiv,
  KwInt,
  KwBool,
  KwReal,
  KwChar,
  KwUnit,

  // Punctuation / operators
  Comma,
  LParen,
  RParen,
  Eq,       // =
  NotEq,    // <>
  Colon,    // :
  ColonEq,  // :=
  Cons,     // ::
  Tilde,    // ~
  Plus,
  Minus,
  Star,
  Gt,
  GtEq,
  Less,
  LessEq,
  AndAnd,  // &&
  OrOr,    // ||
  And,     // & (borrow)
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Int:
      return "integer literal";
    case TokenKind::Real:
      return "real literal";
    case TokenKind::Bool:
      return "boolean literal";
    case TokenKind::Char:
      return "character literal";
    case TokenKind::Ident:
      return "identifier";
    case TokenKind::KwFun:
      return "fun";
    case TokenKind::KwVal:
      return "val";
    case TokenKind::KwLet:
      return "let";
    case TokenKind::KwIn:
      return "in";
    case TokenKind::KwEnd:
      return "end";
    case TokenKind::KwIf:
      return "if";
    case TokenKind::KwThen:
      return "then";
    case TokenKind::KwElse:
      return "else";
    case TokenKind::KwNot:
      return "not";
    case TokenKind::KwMut:
      return "mut";
    case TokenKind::KwWhile:
      return "while";
    case TokenKind::KwDo:
      return "do";
    case TokenKind::KwMod:
      return "mod";
    case TokenKind::KwDiv:
      return "div";
    case TokenKind::KwInt:
      return "int";
    case TokenKind::KwBool:
      return "bool";
    case TokenKind::KwReal:
      return "real";
    case TokenKind::KwChar:
      return "char";
    case TokenKind::KwUnit:
      return "unit";
    case TokenKind::Comma:
      return ",";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Eq:
      return "=";
    case TokenKind::NotEq:
      return "<>";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonEq:
      return ":=";
    case TokenKind::Cons:
      return "::";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Gt:
      return ">";
    case TokenKind::GtEq:
      return ">=";
    case TokenKind::Less:
      return "<";
    case TokenKind::LessEq:
      return "<=";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::And:
      return "&";
  }
  return "<unknown>";
}

/**
 * A lexed token. Payloads are owned; nothing refers back into the source.
 *
 * The payload alternative is fixed by the kind: Int -> uint64_t,
 * Real -> double, Bool -> bool, Char -> char32_t, Ident -> minml::Ident,
 * everything else -> std::monostate.
 */
class Token
{
public:
  using Payload = std::variant<std::monostate, uint64_t, double, bool, char32_t, minml::Ident>;

  Token() noexcept = default;
  explicit Token(TokenKind kind) noexcept : kind_(kind) {}

  [[nodiscard]] static Token int_lit(uint64_t v)
  {
    return {TokenKind::Int, Payload{std::in_place_type<uint64_t>, v}};
  }
  [[nodiscard]] static Token real_lit(double v)
  {
    return {TokenKind::Real, Payload{std::in_place_type<double>, v}};
  }
  [[nodiscard]] static Token bool_lit(bool v)
  {
    return {TokenKind::Bool, Payload{std::in_place_type<bool>, v}};
  }
  [[nodiscard]] static Token char_lit(char32_t v)
  {
    return {TokenKind::Char, Payload{std::in_place_type<char32_t>, v}};
  }
  [[nodiscard]] static Token ident(minml::Ident id)
  {
    return {TokenKind::Ident, Payload{std::in_place_type<minml::Ident>, id}};
  }

  [[nodiscard]] TokenKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind_ == k; }
  [[nodiscard]] const Payload & payload() const noexcept { return payload_; }

  // Payload accessors; the kind must match.
  [[nodiscard]] uint64_t as_int() const { return std::get<uint64_t>(payload_); }
  [[nodiscard]] double as_real() const { return std::get<double>(payload_); }
  [[nodiscard]] bool as_bool() const { return std::get<bool>(payload_); }
  [[nodiscard]] char32_t as_char() const { return std::get<char32_t>(payload_); }
  [[nodiscard]] minml::Ident as_ident() const { return std::get<minml::Ident>(payload_); }

  [[nodiscard]] bool operator==(const Token & other) const
  {
    return kind_ == other.kind_ && payload_ == other.payload_;
  }
  [[nodiscard]] bool operator!=(const Token & other) const { return !(*this == other); }

private:
  Token(TokenKind kind, Payload payload) : kind_(kind), payload_(std::move(payload)) {}

  TokenKind kind_ = TokenKind::Eof;
  Payload payload_;
};

/// Source-like rendering of a token, e.g. `42`, `'a'`, `foo`, `:=`.
[[nodiscard]] std::string to_display(const Token & tok);

}  // namespace minml::syntax
