// minml/ast/literal.cpp - Literal rendering
#include "minml/ast/literal.hpp"

#include "minml/basic/text.hpp"

namespace minml
{

std::string to_string(const Literal & lit)
{
  switch (lit.kind()) {
    case LiteralKind::Int:
      return std::to_string(lit.as_int());
    case LiteralKind::Char:
      return quote_char(lit.as_char());
    case LiteralKind::Bool:
      return lit.as_bool() ? "true" : "false";
    case LiteralKind::Real:
      return format_real(lit.as_real());
    case LiteralKind::Unit:
      return "()";
  }
  return {};
}

}  // namespace minml
