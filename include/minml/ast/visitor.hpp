// minml/ast/visitor.hpp - CRTP visitors for AST traversal
#pragma once

#include <type_traits>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_enums.hpp"
#include "minml/basic/casting.hpp"

namespace minml
{

namespace detail
{

/// Propagate const from NodePtrT to a derived node pointer type
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * Static-dispatch visitor. The derived class implements `visit_<snake>` for
 * the nodes it cares about; everything else falls through to the category
 * hooks (visit_expr, visit_stmt, visit_param, visit_decl) and then to
 * visit_node.
 *
 * @code
 *   class CountLocals : public ConstAstVisitor<CountLocals>
 *   {
 *   public:
 *     void visit_local_expr(const LocalExpr *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType Return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define MINML_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR MINML_VISIT_CASE
#define AST_NODE_STMT MINML_VISIT_CASE
#define AST_NODE_PARAM MINML_VISIT_CASE
#define AST_NODE_DECL MINML_VISIT_CASE
#define AST_NODE_TOP MINML_VISIT_CASE
#include "minml/ast/ast_nodes.def"
#undef MINML_VISIT_CASE
    }

    return ReturnType();
  }

  // Default per-node methods forward to the category hook
#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_PARAM(Class, Kind, Snake)                                  \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_param(node);                                 \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "minml/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_param(detail::propagate_const_t<NodePtrT, Param> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Pre-order traversal of every child. Override a visit method to observe a
 * node; call the base implementation to keep descending, or return false to
 * stop the whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_literal_expr(NodePtr<LiteralExpr> /*node*/) { return true; }
  bool visit_local_expr(NodePtr<LocalExpr> /*node*/) { return true; }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }
  bool visit_borrow_expr(NodePtr<BorrowExpr> node) { return get_derived().visit(node->operand); }

  bool visit_apply_expr(NodePtr<ApplyExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    return get_derived().visit(node->arg);
  }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }

  bool visit_let_expr(NodePtr<LetExpr> node)
  {
    for (auto * s : node->stmts) {
      if (!get_derived().visit(s)) return false;
    }
    return get_derived().visit(node->body);
  }

  bool visit_if_expr(NodePtr<IfExpr> node)
  {
    if (!get_derived().visit(node->cond)) return false;
    if (!get_derived().visit(node->then_branch)) return false;
    return get_derived().visit(node->else_branch);
  }

  bool visit_val_stmt(NodePtr<ValStmt> node) { return get_derived().visit(node->binding.expr); }
  bool visit_assign_stmt(NodePtr<AssignStmt> node) { return get_derived().visit(node->value); }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    if (!get_derived().visit(node->cond)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_ident_param(NodePtr<IdentParam> /*node*/) { return true; }
  bool visit_wildcard_param(NodePtr<WildcardParam> /*node*/) { return true; }
  bool visit_typed_param(NodePtr<TypedParam> node) { return get_derived().visit(node->inner); }

  bool visit_val_decl(NodePtr<ValDecl> node) { return get_derived().visit(node->binding.expr); }

  bool visit_func_decl(NodePtr<FuncDecl> node)
  {
    for (auto * p : node->params) {
      if (!get_derived().visit(p)) return false;
    }
    return get_derived().visit(node->body);
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * d : node->decls) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace minml
