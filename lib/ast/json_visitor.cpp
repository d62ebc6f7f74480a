// minml/ast/json_visitor.cpp - JSON serialization implementation
//
#include "minml/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "minml/ast/ast.hpp"
#include "minml/ast/ast_enums.hpp"
#include "minml/basic/casting.hpp"
#include "minml/basic/span.hpp"
#include "minml/basic/text.hpp"

namespace minml
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_span(Span s)
{
  if (s.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", s.start()}, {"end", s.end()}};
}

json j_node_header(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->kind))}, {"span", j_span(n->span())}};
}

json j_literal(const Literal & lit)
{
  switch (lit.kind()) {
    case LiteralKind::Int:
      return json{{"kind", "Int"}, {"value", lit.as_int()}};
    case LiteralKind::Char:
      return json{{"kind", "Char"}, {"value", encode_utf8(lit.as_char())}};
    case LiteralKind::Bool:
      return json{{"kind", "Bool"}, {"value", lit.as_bool()}};
    case LiteralKind::Real:
      return json{{"kind", "Real"}, {"value", lit.as_real()}};
    case LiteralKind::Unit:
      return json{{"kind", "Unit"}, {"value", nullptr}};
  }
  return json{};
}

template <typename T>
json j_spanned_name(const Spanned<T> & s)
{
  return json{{"name", std::string(s->str())}, {"span", j_span(s.span())}};
}

json j_node(const AstNode * n);

template <typename T>
json j_list(gsl::span<T *> items)
{
  json arr = json::array();
  for (const auto * item : items) {
    arr.push_back(j_node(item));
  }
  return arr;
}

void add_binding(json & j, const ValBinding & b)
{
  j["name"] = j_spanned_name(b.name);
  j["ty"] = b.ty ? json(std::string(to_string(*b.ty))) : json(nullptr);
  j["expr"] = j_node(b.expr);
}

// ============================================================================
// Node serialization
// ============================================================================

json j_expr(const Expr * e)
{
  json j = j_node_header(e);

  if (const auto * lit = dyn_cast<LiteralExpr>(e)) {
    j["literal"] = j_literal(lit->value);
  } else if (const auto * local = dyn_cast<LocalExpr>(e)) {
    j["name"] = std::string(local->name.str());
  } else if (const auto * un = dyn_cast<UnaryExpr>(e)) {
    j["op"] = std::string(to_string(un->op.value()));
    j["op_span"] = j_span(un->op.span());
    j["operand"] = j_node(un->operand);
  } else if (const auto * bor = dyn_cast<BorrowExpr>(e)) {
    j["op"] = std::string(to_string(bor->op.value()));
    j["op_span"] = j_span(bor->op.span());
    j["operand"] = j_node(bor->operand);
  } else if (const auto * app = dyn_cast<ApplyExpr>(e)) {
    j["callee"] = j_node(app->callee);
    j["arg"] = j_node(app->arg);
  } else if (const auto * bin = dyn_cast<BinaryExpr>(e)) {
    j["op"] = std::string(to_string(bin->op.value()));
    j["op_span"] = j_span(bin->op.span());
    j["lhs"] = j_node(bin->lhs);
    j["rhs"] = j_node(bin->rhs);
  } else if (const auto * let = dyn_cast<LetExpr>(e)) {
    j["stmts"] = j_list(let->stmts);
    j["body"] = j_node(let->body);
  } else if (const auto * ife = dyn_cast<IfExpr>(e)) {
    j["cond"] = j_node(ife->cond);
    j["then"] = j_node(ife->then_branch);
    j["else"] = j_node(ife->else_branch);
  }
  return j;
}

json j_stmt(const Stmt * s)
{
  json j = j_node_header(s);

  if (const auto * val = dyn_cast<ValStmt>(s)) {
    add_binding(j, val->binding);
  } else if (const auto * asg = dyn_cast<AssignStmt>(s)) {
    j["target"] = j_spanned_name(asg->target);
    j["value"] = j_node(asg->value);
  } else if (const auto * wh = dyn_cast<WhileStmt>(s)) {
    j["cond"] = j_node(wh->cond);
    j["body"] = j_node(wh->body);
  }
  return j;
}

json j_param(const Param * p)
{
  json j = j_node_header(p);

  if (const auto * id = dyn_cast<IdentParam>(p)) {
    j["name"] = std::string(id->name.str());
  } else if (const auto * typed = dyn_cast<TypedParam>(p)) {
    j["inner"] = j_node(typed->inner);
    j["ty"] = std::string(to_string(typed->ty.value()));
    j["ty_span"] = j_span(typed->ty.span());
  }
  return j;
}

json j_decl(const Decl * d)
{
  json j = j_node_header(d);

  if (const auto * val = dyn_cast<ValDecl>(d)) {
    add_binding(j, val->binding);
  } else if (const auto * fn = dyn_cast<FuncDecl>(d)) {
    j["name"] = j_spanned_name(fn->name);
    j["params"] = j_list(fn->params);
    if (fn->return_ty) {
      j["return_ty"] = json{
        {"ty", std::string(to_string(fn->return_ty->value()))},
        {"span", j_span(fn->return_ty->span())}};
    } else {
      j["return_ty"] = nullptr;
    }
    j["body"] = j_node(fn->body);
  }
  return j;
}

json j_node(const AstNode * n)
{
  if (!n) return nullptr;

  if (const auto * e = dyn_cast<Expr>(n)) return j_expr(e);
  if (const auto * s = dyn_cast<Stmt>(n)) return j_stmt(s);
  if (const auto * p = dyn_cast<Param>(n)) return j_param(p);
  if (const auto * d = dyn_cast<Decl>(n)) return j_decl(d);
  if (const auto * prog = dyn_cast<Program>(n)) return to_json(prog);

  return j_node_header(n);
}

}  // namespace

nlohmann::json to_json(const AstNode * node) { return j_node(node); }

nlohmann::json to_json(const Program * program)
{
  if (!program) {
    return nlohmann::json{
      {"type", "Program"}, {"span", j_span({})}, {"decls", nlohmann::json::array()}};
  }

  return nlohmann::json{
    {"type", "Program"}, {"span", j_span(program->span())}, {"decls", j_list(program->decls)}};
}

}  // namespace minml
