// minml/syntax/keywords.hpp - Reserved words
#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "minml/syntax/token.hpp"

namespace minml::syntax
{

/// Single reclassification table for identifier-shaped lexemes.
/// `true` and `false` are handled separately since they carry a payload.
inline constexpr std::array<std::pair<std::string_view, TokenKind>, 19> k_keywords = {{
  {"fun", TokenKind::KwFun},     {"val", TokenKind::KwVal},   {"let", TokenKind::KwLet},
  {"in", TokenKind::KwIn},       {"end", TokenKind::KwEnd},   {"if", TokenKind::KwIf},
  {"then", TokenKind::KwThen},   {"else", TokenKind::KwElse}, {"not", TokenKind::KwNot},
  {"mut", TokenKind::KwMut},     {"while", TokenKind::KwWhile}, {"do", TokenKind::KwDo},
  {"mod", TokenKind::KwMod},     {"div", TokenKind::KwDiv},   {"int", TokenKind::KwInt},
  {"bool", TokenKind::KwBool},   {"real", TokenKind::KwReal}, {"char", TokenKind::KwChar},
  {"unit", TokenKind::KwUnit},
}};

inline constexpr std::string_view k_true = "true";
inline constexpr std::string_view k_false = "false";

[[nodiscard]] constexpr std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept
{
  for (const auto & [word, kind] : k_keywords) {
    if (word == text) {
      return kind;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr bool is_reserved(std::string_view text) noexcept
{
  return lookup_keyword(text).has_value() || text == k_true || text == k_false;
}

}  // namespace minml::syntax
