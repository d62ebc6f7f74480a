// minml/syntax/token.cpp - Token rendering helpers
#include "minml/syntax/token.hpp"

#include <string>

#include "minml/basic/text.hpp"

namespace minml::syntax
{

std::string to_display(const Token & tok)
{
  switch (tok.kind()) {
    case TokenKind::Int:
      return std::to_string(tok.as_int());
    case TokenKind::Real:
      return format_real(tok.as_real());
    case TokenKind::Bool:
      return tok.as_bool() ? "true" : "false";
    case TokenKind::Char:
      return quote_char(tok.as_char());
    case TokenKind::Ident:
      return std::string(tok.as_ident().str());
    case TokenKind::Eof:
      return "end of input";
    default:
      return std::string(to_string(tok.kind()));
  }
}

}  // namespace minml::syntax
