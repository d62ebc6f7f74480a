// minml/ast/ast_dumper.hpp - Debug AST tree output
#pragma once

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_enums.hpp"
#include "minml/ast/visitor.hpp"

namespace minml
{

/**
 * Dumps AST nodes in a human-readable tree format.
 *
 * @code
 *   Program
 *   `-FuncDecl name='inc' ret='int'
 *     |-TypedParam type='int'
 *     | `-IdentParam name='x'
 *     `-BinaryExpr op='+'
 *       |-LocalExpr name='x'
 *       `-LiteralExpr 1
 * @endcode
 *
 * With `show_spans`, every line ends with the node's byte range `[start, end)`.
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os, bool show_spans = false)
  : os_(os), show_spans_(show_spans)
  {
  }

  void dump(const AstNode * node) { visit(node); }

  // ===========================================================================
  // Generic tree printer
  // ===========================================================================

  /// Either key='value' or a bare value
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string v) : value(std::move(v)) {}  // NOLINT(google-explicit-constructor)
    Prop(const char * v) : value(v) {}             // NOLINT(google-explicit-constructor)
  };

  template <typename... Containers>
  void print_tree(
    const AstNode * node, const std::vector<Prop> & props, const Containers &... children)
  {
    print_prefix();
    os_ << to_string(node->kind);
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    if (show_spans_ && node->span().is_valid()) {
      os_ << " [" << node->span().start() << ", " << node->span().end() << ")";
    }
    os_ << "\n";

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, children), ...);

    const IndentScope scope(*this);
    for (size_t i = 0; i < all_children.size(); ++i) {
      is_last_ = (i == all_children.size() - 1);
      visit(all_children[i]);
    }
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_program(const Program * node) { print_tree(node, {}, node->decls); }

  // --- Declarations ---
  void visit_val_decl(const ValDecl * node)
  {
    print_tree(node, binding_props(node->binding), node->binding.expr);
  }

  void visit_func_decl(const FuncDecl * node)
  {
    std::vector<Prop> props{{"name", node->name->str()}};
    if (node->return_ty) {
      props.emplace_back("ret", to_string(node->return_ty->value()));
    }
    print_tree(node, props, node->params, node->body);
  }

  // --- Parameters ---
  void visit_ident_param(const IdentParam * node)
  {
    print_tree(node, {{"name", node->name.str()}});
  }
  void visit_wildcard_param(const WildcardParam * node) { print_tree(node, {}); }
  void visit_typed_param(const TypedParam * node)
  {
    print_tree(node, {{"type", to_string(node->ty.value())}}, node->inner);
  }

  // --- Statements ---
  void visit_val_stmt(const ValStmt * node)
  {
    print_tree(node, binding_props(node->binding), node->binding.expr);
  }
  void visit_assign_stmt(const AssignStmt * node)
  {
    print_tree(node, {{"name", node->target->str()}}, node->value);
  }
  void visit_while_stmt(const WhileStmt * node) { print_tree(node, {}, node->cond, node->body); }

  // --- Expressions ---
  void visit_literal_expr(const LiteralExpr * node) { print_tree(node, {to_string(node->value)}); }
  void visit_local_expr(const LocalExpr * node) { print_tree(node, {{"name", node->name.str()}}); }
  void visit_unary_expr(const UnaryExpr * node)
  {
    print_tree(node, {{"op", to_string(node->op.value())}}, node->operand);
  }
  void visit_borrow_expr(const BorrowExpr * node)
  {
    print_tree(node, {{"op", to_string(node->op.value())}}, node->operand);
  }
  void visit_apply_expr(const ApplyExpr * node) { print_tree(node, {}, node->callee, node->arg); }
  void visit_binary_expr(const BinaryExpr * node)
  {
    print_tree(node, {{"op", to_string(node->op.value())}}, node->lhs, node->rhs);
  }
  void visit_let_expr(const LetExpr * node) { print_tree(node, {}, node->stmts, node->body); }
  void visit_if_expr(const IfExpr * node)
  {
    print_tree(node, {}, node->cond, node->then_branch, node->else_branch);
  }

private:
  static std::vector<Prop> binding_props(const ValBinding & b)
  {
    std::vector<Prop> props{{"name", b.name->str()}};
    if (b.ty) {
      props.emplace_back("type", to_string(*b.ty));
    }
    return props;
  }

  // --- Child collection ---

  static void collect_children(std::vector<const AstNode *> & out, const AstNode * node)
  {
    if (node) out.push_back(node);
  }

  template <typename T>
  static void collect_children(std::vector<const AstNode *> & out, gsl::span<T *> span)
  {
    for (const auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  // --- Rendering ---

  void print_prefix()
  {
    if (depth_ == 0) return;  // the root is printed flush left
    os_ << prefix_ << (is_last_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      if (d.depth_ > 0) {
        d.prefix_ += d.is_last_ ? "  " : "| ";
      }
      ++d.depth_;
    }

    ~IndentScope()
    {
      d.prefix_ = saved;
      --d.depth_;
    }
  };

  std::ostream & os_;
  bool show_spans_;
  std::string prefix_;
  size_t depth_ = 0;
  bool is_last_ = true;
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const AstNode * node, std::ostream & os, bool show_spans = false)
{
  AstDumper dumper(os, show_spans);
  dumper.dump(node);
}

inline std::string dump_to_string(const AstNode * node, bool show_spans = false)
{
  std::ostringstream ss;
  dump(node, ss, show_spans);
  return ss.str();
}

}  // namespace minml
