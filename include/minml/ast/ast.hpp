// minml/ast/ast.hpp - AST node class definitions
//
// LLVM/Clang-style node hierarchy with classof() for RTTI. Nodes live in an
// AstContext arena and are immutable once the parser has built them.
//
#pragma once

#include <gsl/span>
#include <optional>

#include "minml/ast/ast_enums.hpp"
#include "minml/ast/literal.hpp"
#include "minml/basic/casting.hpp"
#include "minml/basic/ident.hpp"
#include "minml/basic/span.hpp"

namespace minml
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI and the Span it was parsed from. For a
 * compound node the span is the join of its children's spans, widened to
 * the keywords or parentheses that delimit it.
 */
class AstNode
{
public:
  const NodeKind kind;
  Span span_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] Span span() const noexcept { return span_; }

protected:
  explicit AstNode(NodeKind k, Span s = {}) : kind(k), span_(s) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(Span s = {}) : Base(K, s) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

/// Function parameter / binding pattern.
class Param : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_param_kind(node->kind); }

protected:
  explicit Param(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, Span s = {}) : AstNode(k, s) {}
};

/// Pair a node with its own span, the shape parser entry points return.
template <typename T>
[[nodiscard]] Spanned<T *> spanned_node(T * node)
{
  return {node, node->span()};
}

// ============================================================================
// Expression Nodes
// ============================================================================

class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::LiteralExpr>
{
public:
  Literal value;

  explicit LiteralExpr(Literal v, Span s = {}) : NodeBase(s), value(v) {}
};

/// Reference to a local name.
class LocalExpr : public NodeBase<LocalExpr, Expr, NodeKind::LocalExpr>
{
public:
  Ident name;

  explicit LocalExpr(Ident n, Span s = {}) : NodeBase(s), name(n) {}
};

/// `~e` or `not e`.
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  Spanned<UnaryOp> op;
  Expr * operand;

  UnaryExpr(Spanned<UnaryOp> o, Expr * e, Span s = {}) : NodeBase(s), op(o), operand(e) {}
};

/// `&e` or `&mut e`.
class BorrowExpr : public NodeBase<BorrowExpr, Expr, NodeKind::BorrowExpr>
{
public:
  Spanned<BorrowOp> op;
  Expr * operand;

  BorrowExpr(Spanned<BorrowOp> o, Expr * e, Span s = {}) : NodeBase(s), op(o), operand(e) {}
};

/// Application of a callee to a single argument (`f x`).
class ApplyExpr : public NodeBase<ApplyExpr, Expr, NodeKind::ApplyExpr>
{
public:
  Expr * callee;
  Expr * arg;

  ApplyExpr(Expr * f, Expr * a, Span s = {}) : NodeBase(s), callee(f), arg(a) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  Spanned<BinaryOp> op;
  Expr * rhs;

  BinaryExpr(Expr * l, Spanned<BinaryOp> o, Expr * r, Span s = {})
  : NodeBase(s), lhs(l), op(o), rhs(r)
  {
  }
};

/// `let stmts in body end`.
class LetExpr : public NodeBase<LetExpr, Expr, NodeKind::LetExpr>
{
public:
  gsl::span<Stmt *> stmts;
  Expr * body;

  LetExpr(gsl::span<Stmt *> ss, Expr * b, Span s = {}) : NodeBase(s), stmts(ss), body(b) {}
};

/// `if cond then a else b`.
class IfExpr : public NodeBase<IfExpr, Expr, NodeKind::IfExpr>
{
public:
  Expr * cond;
  Expr * then_branch;
  Expr * else_branch;

  IfExpr(Expr * c, Expr * t, Expr * e, Span s = {})
  : NodeBase(s), cond(c), then_branch(t), else_branch(e)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `val name (: ty)? = expr`, shared by the statement and declaration forms.
struct ValBinding
{
  Spanned<Ident> name;
  std::optional<Type> ty;
  Expr * expr;
};

class ValStmt : public NodeBase<ValStmt, Stmt, NodeKind::ValStmt>
{
public:
  ValBinding binding;

  explicit ValStmt(ValBinding b, Span s = {}) : NodeBase(s), binding(b) {}
};

/// `target := expr`.
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  Spanned<Ident> target;
  Expr * value;

  AssignStmt(Spanned<Ident> t, Expr * v, Span s = {}) : NodeBase(s), target(t), value(v) {}
};

/// `while cond do body`.
class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * cond;
  Stmt * body;

  WhileStmt(Expr * c, Stmt * b, Span s = {}) : NodeBase(s), cond(c), body(b) {}
};

// ============================================================================
// Parameter Nodes
// ============================================================================

class IdentParam : public NodeBase<IdentParam, Param, NodeKind::IdentParam>
{
public:
  Ident name;

  explicit IdentParam(Ident n, Span s = {}) : NodeBase(s), name(n) {}
};

/// `_`
class WildcardParam : public NodeBase<WildcardParam, Param, NodeKind::WildcardParam>
{
public:
  explicit WildcardParam(Span s = {}) : NodeBase(s) {}
};

/// `(inner : ty)`
class TypedParam : public NodeBase<TypedParam, Param, NodeKind::TypedParam>
{
public:
  Param * inner;
  Spanned<Type> ty;

  TypedParam(Param * p, Spanned<Type> t, Span s = {}) : NodeBase(s), inner(p), ty(t) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class ValDecl : public NodeBase<ValDecl, Decl, NodeKind::ValDecl>
{
public:
  ValBinding binding;

  explicit ValDecl(ValBinding b, Span s = {}) : NodeBase(s), binding(b) {}
};

/// `fun name params (: ret)? = body`.
class FuncDecl : public NodeBase<FuncDecl, Decl, NodeKind::FuncDecl>
{
public:
  Spanned<Ident> name;
  gsl::span<Param *> params;
  std::optional<Spanned<Type>> return_ty;
  Expr * body;

  FuncDecl(
    Spanned<Ident> n, gsl::span<Param *> ps, std::optional<Spanned<Type>> ret, Expr * b,
    Span s = {})
  : NodeBase(s), name(n), params(ps), return_ty(ret), body(b)
  {
  }
};

// ============================================================================
// Top-level
// ============================================================================

/// A whole source file: every declaration in order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> decls;

  explicit Program(gsl::span<Decl *> ds, Span s = {}) : NodeBase(s), decls(ds) {}
};

}  // namespace minml
