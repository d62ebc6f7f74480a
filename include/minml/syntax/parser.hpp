// minml/syntax/parser.hpp - Recursive-descent parser
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_context.hpp"
#include "minml/basic/result.hpp"
#include "minml/basic/span.hpp"
#include "minml/syntax/lexer.hpp"
#include "minml/syntax/parse_error.hpp"
#include "minml/syntax/token.hpp"

namespace minml::syntax
{

using ExprResult = Result<Spanned<Expr *>, ParseError>;
using DeclResult = Result<Spanned<Decl *>, ParseError>;
using ProgramResult = Result<Program *, ParseError>;

/**
 * Precedence-climbing parser over a lexed token stream.
 *
 * The parser stops at the first syntax error. Every grammar method returns
 * nullptr (or nullopt) once an error has been recorded, and the entry points
 * hand that single error back to the caller.
 *
 * Nodes are allocated in the AstContext, which must outlive the result.
 */
class Parser
{
public:
  /// `tokens` normally ends with Eof. A stream without one reads as if an
  /// Eof followed its last token.
  Parser(AstContext & ast, const TokenStream & tokens);

  /// One expression followed by end of input.
  [[nodiscard]] ExprResult parse_expression();

  /// One `val` or `fun` declaration followed by end of input.
  [[nodiscard]] DeclResult parse_declaration();

  /// Every declaration up to end of input.
  [[nodiscard]] ProgramResult parse_program();

private:
  // Token helpers
  [[nodiscard]] const Spanned<Token> & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const { return cur().value().is(k); }
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }

  /// Current token; never moves past the end of input.
  const Spanned<Token> & advance();
  std::optional<Span> match(TokenKind k);
  std::optional<Span> expect(TokenKind k, std::string_view what);
  std::optional<Spanned<Ident>> expect_ident(std::string_view what);
  void expect_end_of_input();

  /// Record `err` unless an earlier error exists.
  std::nullptr_t fail(ParseError err);
  std::nullptr_t fail_here(std::string expected);

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_compare();
  [[nodiscard]] Expr * parse_additive();
  [[nodiscard]] Expr * parse_multiplicative();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_borrow();
  [[nodiscard]] Expr * parse_app();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_paren();
  [[nodiscard]] Expr * parse_let();
  [[nodiscard]] Expr * parse_if();

  using OperatorMap = std::optional<BinaryOp> (*)(TokenKind);
  [[nodiscard]] Expr * parse_left_assoc(Expr * (Parser::*operand)(), OperatorMap op_for);

  [[nodiscard]] static bool starts_primary(TokenKind k) noexcept;

  // Statements and declarations
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] std::optional<ValBinding> parse_val_binding();
  [[nodiscard]] Decl * parse_decl();
  [[nodiscard]] FuncDecl * parse_fun();
  [[nodiscard]] Param * parse_param();
  [[nodiscard]] std::optional<Spanned<Type>> parse_type();

  AstContext & ast_;
  const TokenStream & tokens_;
  Spanned<Token> eof_;
  size_t pos_ = 0;
  std::optional<ParseError> error_;
};

/// Convenience wrappers that build a Parser over `tokens`.
[[nodiscard]] ExprResult parse_expression(AstContext & ast, const TokenStream & tokens);
[[nodiscard]] DeclResult parse_declaration(AstContext & ast, const TokenStream & tokens);
[[nodiscard]] ProgramResult parse_program(AstContext & ast, const TokenStream & tokens);

}  // namespace minml::syntax
