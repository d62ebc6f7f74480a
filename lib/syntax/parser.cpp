// minml/syntax/parser.cpp - Recursive-descent parser implementation
#include "minml/syntax/parser.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace minml::syntax
{
namespace
{

std::optional<BinaryOp> or_op(TokenKind k)
{
  if (k == TokenKind::OrOr) return BinaryOp::Or;
  return std::nullopt;
}

std::optional<BinaryOp> and_op(TokenKind k)
{
  if (k == TokenKind::AndAnd) return BinaryOp::And;
  return std::nullopt;
}

std::optional<BinaryOp> compare_op(TokenKind k)
{
  switch (k) {
    case TokenKind::Eq:
      return BinaryOp::Eq;
    case TokenKind::NotEq:
      return BinaryOp::NotEq;
    case TokenKind::Less:
      return BinaryOp::Less;
    case TokenKind::LessEq:
      return BinaryOp::LessEq;
    case TokenKind::Gt:
      return BinaryOp::Greater;
    case TokenKind::GtEq:
      return BinaryOp::GreaterEq;
    default:
      return std::nullopt;
  }
}

std::optional<BinaryOp> additive_op(TokenKind k)
{
  if (k == TokenKind::Plus) return BinaryOp::Add;
  if (k == TokenKind::Minus) return BinaryOp::Sub;
  return std::nullopt;
}

std::optional<BinaryOp> multiplicative_op(TokenKind k)
{
  switch (k) {
    case TokenKind::Star:
      return BinaryOp::Mul;
    case TokenKind::KwDiv:
      return BinaryOp::Div;
    case TokenKind::KwMod:
      return BinaryOp::Rem;
    default:
      return std::nullopt;
  }
}

std::optional<Type> type_keyword(TokenKind k)
{
  switch (k) {
    case TokenKind::KwInt:
      return Type::Int;
    case TokenKind::KwBool:
      return Type::Bool;
    case TokenKind::KwChar:
      return Type::Char;
    case TokenKind::KwReal:
      return Type::Real;
    case TokenKind::KwUnit:
      return Type::Unit;
    default:
      return std::nullopt;
  }
}

/// Empty span just past the last token.
Span end_of_input(const TokenStream & tokens)
{
  if (tokens.empty()) return {};
  const Span last = tokens.back().span();
  return Span{last.src(), last.end(), last.end()};
}

}  // namespace

Parser::Parser(AstContext & ast, const TokenStream & tokens)
: ast_(ast), tokens_(tokens), eof_(Token(TokenKind::Eof), end_of_input(tokens))
{
}

// ============================================================================
// Entry points
// ============================================================================

ExprResult Parser::parse_expression()
{
  Expr * e = parse_expr();
  if (e) expect_end_of_input();
  if (error_) return make_err(*error_);
  return spanned_node(e);
}

DeclResult Parser::parse_declaration()
{
  Decl * d = parse_decl();
  if (d) expect_end_of_input();
  if (error_) return make_err(*error_);
  return spanned_node(d);
}

ProgramResult Parser::parse_program()
{
  std::vector<Decl *> decls;
  while (!at_eof()) {
    Decl * d = parse_decl();
    if (!d) return make_err(*error_);
    decls.push_back(d);
  }

  const Span eof = cur().span();
  return ast_.create<Program>(ast_.copy_to_arena(decls), Span{eof.src(), 0, eof.end()});
}

// ============================================================================
// Token helpers
// ============================================================================

const Spanned<Token> & Parser::cur(size_t lookahead) const
{
  const size_t i = pos_ + lookahead;
  if (i < tokens_.size()) return tokens_[i];
  return eof_;
}

const Spanned<Token> & Parser::advance()
{
  const Spanned<Token> & t = cur();
  if (!t.value().is(TokenKind::Eof)) {
    ++pos_;
  }
  return t;
}

std::optional<Span> Parser::match(TokenKind k)
{
  if (!at(k)) return std::nullopt;
  return advance().span();
}

std::optional<Span> Parser::expect(TokenKind k, std::string_view what)
{
  if (auto s = match(k)) return s;
  fail_here(std::string(what));
  return std::nullopt;
}

std::optional<Spanned<Ident>> Parser::expect_ident(std::string_view what)
{
  if (!at(TokenKind::Ident)) {
    fail_here(std::string(what));
    return std::nullopt;
  }
  const auto & t = advance();
  return Spanned<Ident>{t.value().as_ident(), t.span()};
}

void Parser::expect_end_of_input()
{
  if (!at_eof()) {
    fail(ParseError::unexpected_token("end of input", cur().value(), cur().span()));
  }
}

std::nullptr_t Parser::fail(ParseError err)
{
  if (!error_) error_ = std::move(err);
  return nullptr;
}

std::nullptr_t Parser::fail_here(std::string expected)
{
  const auto & t = cur();
  if (t.value().is(TokenKind::Eof)) {
    return fail(ParseError::unexpected_eof(std::move(expected), t.span()));
  }
  return fail(ParseError::unexpected_token(std::move(expected), t.value(), t.span()));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_left_assoc(Expr * (Parser::*operand)(), OperatorMap op_for)
{
  Expr * lhs = (this->*operand)();
  if (!lhs) return nullptr;

  while (const auto op = op_for(cur().value().kind())) {
    const Span op_span = advance().span();
    Expr * rhs = (this->*operand)();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, Spanned<BinaryOp>{*op, op_span}, rhs, lhs->span().join(rhs->span()));
  }
  return lhs;
}

Expr * Parser::parse_or() { return parse_left_assoc(&Parser::parse_and, or_op); }

Expr * Parser::parse_and() { return parse_left_assoc(&Parser::parse_compare, and_op); }

// Comparisons chain left-associatively here; rejecting `a < b < c` is left
// to later passes.
Expr * Parser::parse_compare() { return parse_left_assoc(&Parser::parse_additive, compare_op); }

Expr * Parser::parse_additive()
{
  return parse_left_assoc(&Parser::parse_multiplicative, additive_op);
}

Expr * Parser::parse_multiplicative()
{
  return parse_left_assoc(&Parser::parse_unary, multiplicative_op);
}

Expr * Parser::parse_unary()
{
  std::optional<UnaryOp> op;
  if (at(TokenKind::Tilde)) {
    op = UnaryOp::Neg;
  } else if (at(TokenKind::KwNot)) {
    op = UnaryOp::Not;
  } else {
    return parse_borrow();
  }

  const Span op_span = advance().span();
  Expr * operand = parse_unary();
  if (!operand) return nullptr;
  return ast_.create<UnaryExpr>(
    Spanned<UnaryOp>{*op, op_span}, operand, op_span.join(operand->span()));
}

Expr * Parser::parse_borrow()
{
  const auto amp = match(TokenKind::And);
  if (!amp) return parse_app();

  Span op_span = *amp;
  BorrowOp op = BorrowOp::Ref;
  if (const auto mut = match(TokenKind::KwMut)) {
    op = BorrowOp::RefMut;
    op_span = op_span.join(*mut);
  }

  Expr * operand = parse_unary();
  if (!operand) return nullptr;
  return ast_.create<BorrowExpr>(
    Spanned<BorrowOp>{op, op_span}, operand, op_span.join(operand->span()));
}

Expr * Parser::parse_app()
{
  Expr * callee = parse_primary();
  if (!callee) return nullptr;

  // `x :=` opens the next statement of a `let`, so it never becomes an argument.
  while (starts_primary(cur().value().kind()) &&
         !(at(TokenKind::Ident) && cur(1).value().is(TokenKind::ColonEq))) {
    Expr * arg = parse_primary();
    if (!arg) return nullptr;
    callee = ast_.create<ApplyExpr>(callee, arg, callee->span().join(arg->span()));
  }
  return callee;
}

bool Parser::starts_primary(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Int:
    case TokenKind::Real:
    case TokenKind::Bool:
    case TokenKind::Char:
    case TokenKind::Ident:
    case TokenKind::LParen:
    case TokenKind::KwLet:
    case TokenKind::KwIf:
      return true;
    default:
      return false;
  }
}

Expr * Parser::parse_primary()
{
  const auto & t = cur();
  const Token & tok = t.value();

  switch (tok.kind()) {
    case TokenKind::Int:
      advance();
      return ast_.create<LiteralExpr>(Literal::make_int(tok.as_int()), t.span());
    case TokenKind::Real:
      advance();
      return ast_.create<LiteralExpr>(Literal::make_real(tok.as_real()), t.span());
    case TokenKind::Bool:
      advance();
      return ast_.create<LiteralExpr>(Literal::make_bool(tok.as_bool()), t.span());
    case TokenKind::Char:
      advance();
      return ast_.create<LiteralExpr>(Literal::make_char(tok.as_char()), t.span());
    case TokenKind::Ident:
      advance();
      return ast_.create<LocalExpr>(tok.as_ident(), t.span());
    case TokenKind::LParen:
      return parse_paren();
    case TokenKind::KwLet:
      return parse_let();
    case TokenKind::KwIf:
      return parse_if();
    case TokenKind::Eof:
      return fail(ParseError::unexpected_eof("an expression", t.span()));
    default:
      return fail(ParseError::expected_primary(tok, t.span()));
  }
}

Expr * Parser::parse_paren()
{
  const Span open = advance().span();

  if (const auto close = match(TokenKind::RParen)) {
    return ast_.create<LiteralExpr>(Literal::unit(), open.join(*close));
  }

  Expr * inner = parse_expr();
  if (!inner) return nullptr;

  const auto close = match(TokenKind::RParen);
  if (!close) {
    return fail(
      ParseError::expected_delimiter(TokenKind::RParen, TokenKind::LParen, open, cur().span()));
  }

  inner->span_ = open.join(*close);
  return inner;
}

Expr * Parser::parse_let()
{
  const Span let_span = advance().span();

  std::vector<Stmt *> stmts;
  while (!at(TokenKind::KwIn) && !at_eof()) {
    Stmt * s = parse_stmt();
    if (!s) return nullptr;
    stmts.push_back(s);
  }

  if (!expect(TokenKind::KwIn, "`in`")) return nullptr;
  Expr * body = parse_expr();
  if (!body) return nullptr;
  const auto end = expect(TokenKind::KwEnd, "`end`");
  if (!end) return nullptr;

  return ast_.create<LetExpr>(ast_.copy_to_arena(stmts), body, let_span.join(*end));
}

Expr * Parser::parse_if()
{
  const Span if_span = advance().span();

  Expr * cond = parse_expr();
  if (!cond) return nullptr;
  if (!expect(TokenKind::KwThen, "`then`")) return nullptr;
  Expr * then_branch = parse_expr();
  if (!then_branch) return nullptr;
  if (!expect(TokenKind::KwElse, "`else`")) return nullptr;
  Expr * else_branch = parse_expr();
  if (!else_branch) return nullptr;

  return ast_.create<IfExpr>(cond, then_branch, else_branch, if_span.join(else_branch->span()));
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  if (const auto val = match(TokenKind::KwVal)) {
    auto binding = parse_val_binding();
    if (!binding) return nullptr;
    return ast_.create<ValStmt>(*binding, val->join(binding->expr->span()));
  }

  if (const auto w = match(TokenKind::KwWhile)) {
    Expr * cond = parse_expr();
    if (!cond) return nullptr;
    if (!expect(TokenKind::KwDo, "`do`")) return nullptr;
    Stmt * body = parse_stmt();
    if (!body) return nullptr;
    return ast_.create<WhileStmt>(cond, body, w->join(body->span()));
  }

  if (at(TokenKind::Ident) && cur(1).value().is(TokenKind::ColonEq)) {
    const auto & t = advance();
    const Spanned<Ident> target{t.value().as_ident(), t.span()};
    advance();  // :=
    Expr * value = parse_expr();
    if (!value) return nullptr;
    return ast_.create<AssignStmt>(target, value, target.span().join(value->span()));
  }

  return fail_here("a statement or `in`");
}

std::optional<ValBinding> Parser::parse_val_binding()
{
  auto name = expect_ident("a name after `val`");
  if (!name) return std::nullopt;

  std::optional<Type> ty;
  if (match(TokenKind::Colon)) {
    const auto t = parse_type();
    if (!t) return std::nullopt;
    ty = t->value();
  }

  if (!expect(TokenKind::Eq, "`=`")) return std::nullopt;
  Expr * expr = parse_expr();
  if (!expr) return std::nullopt;

  return ValBinding{*name, ty, expr};
}

// ============================================================================
// Declarations
// ============================================================================

Decl * Parser::parse_decl()
{
  if (at(TokenKind::KwFun)) {
    return parse_fun();
  }

  if (const auto val = match(TokenKind::KwVal)) {
    auto binding = parse_val_binding();
    if (!binding) return nullptr;
    return ast_.create<ValDecl>(*binding, val->join(binding->expr->span()));
  }

  return fail_here("a declaration (`val` or `fun`)");
}

FuncDecl * Parser::parse_fun()
{
  const Span fun_span = advance().span();

  auto name = expect_ident("a function name");
  if (!name) return nullptr;

  std::vector<Param *> params;
  while (at(TokenKind::Ident) || at(TokenKind::LParen)) {
    Param * p = parse_param();
    if (!p) return nullptr;
    params.push_back(p);
  }

  std::optional<Spanned<Type>> ret;
  if (match(TokenKind::Colon)) {
    ret = parse_type();
    if (!ret) return nullptr;
  }

  if (!expect(TokenKind::Eq, "`=`")) return nullptr;
  Expr * body = parse_expr();
  if (!body) return nullptr;

  return ast_.create<FuncDecl>(
    *name, ast_.copy_to_arena(params), ret, body, fun_span.join(body->span()));
}

Param * Parser::parse_param()
{
  if (at(TokenKind::Ident)) {
    const auto & t = advance();
    const Ident name = t.value().as_ident();
    if (name == "_") {
      return ast_.create<WildcardParam>(t.span());
    }
    return ast_.create<IdentParam>(name, t.span());
  }

  const auto open = match(TokenKind::LParen);
  if (!open) return fail_here("a parameter");

  Param * inner = parse_param();
  if (!inner) return nullptr;
  if (!expect(TokenKind::Colon, "`:`")) return nullptr;
  const auto ty = parse_type();
  if (!ty) return nullptr;

  const auto close = match(TokenKind::RParen);
  if (!close) {
    return fail(
      ParseError::expected_delimiter(TokenKind::RParen, TokenKind::LParen, *open, cur().span()));
  }
  return ast_.create<TypedParam>(inner, *ty, open->join(*close));
}

std::optional<Spanned<Type>> Parser::parse_type()
{
  const auto & t = cur();

  if (const auto ty = type_keyword(t.value().kind())) {
    advance();
    return Spanned<Type>{*ty, t.span()};
  }

  if (const auto open = match(TokenKind::LParen)) {
    const auto close = match(TokenKind::RParen);
    if (!close) {
      fail(
        ParseError::expected_delimiter(TokenKind::RParen, TokenKind::LParen, *open, cur().span()));
      return std::nullopt;
    }
    return Spanned<Type>{Type::Unit, open->join(*close)};
  }

  fail(ParseError::expected_type(t.value(), t.span()));
  return std::nullopt;
}

// ============================================================================
// Free functions
// ============================================================================

ExprResult parse_expression(AstContext & ast, const TokenStream & tokens)
{
  return Parser(ast, tokens).parse_expression();
}

DeclResult parse_declaration(AstContext & ast, const TokenStream & tokens)
{
  return Parser(ast, tokens).parse_declaration();
}

ProgramResult parse_program(AstContext & ast, const TokenStream & tokens)
{
  return Parser(ast, tokens).parse_program();
}

}  // namespace minml::syntax
