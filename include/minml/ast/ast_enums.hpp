// minml/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and the closed set of primitive types.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace minml
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; categories are contiguous ranges.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "minml/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "minml/ast/ast_nodes.def"

// === Parameters / patterns ===
#define AST_NODE_PARAM(Class, Kind, Snake) Kind,
#include "minml/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "minml/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "minml/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_PARAM(Class, Kind, Snake) \
  case NodeKind::Kind:                     \
    return #Class;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "minml/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Primitive types
// ============================================================================

/// The closed set of types a program can name. `unit` and `()` both denote Unit.
enum class Type : uint8_t {
  Int,
  Char,
  Bool,
  Real,
  Unit,
};

// ============================================================================
// Operators
// ============================================================================

/// Binary operators. Precedence (loosest first): Or; And; comparisons;
/// Add/Sub; Mul/Div/Rem.
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< div
  Rem,  ///< mod
  // Comparison
  Eq,         ///< =
  NotEq,      ///< <>
  Less,       ///< <
  LessEq,     ///< <=
  Greater,    ///< >
  GreaterEq,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Neg,  ///< ~
  Not,  ///< not
};

enum class BorrowOp : uint8_t {
  Ref,     ///< &
  RefMut,  ///< & mut
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

/// Source keyword of a type (`()` for Unit).
[[nodiscard]] constexpr std::string_view to_string(Type ty) noexcept
{
  switch (ty) {
    case Type::Int:
      return "int";
    case Type::Char:
      return "char";
    case Type::Bool:
      return "bool";
    case Type::Real:
      return "real";
    case Type::Unit:
      return "()";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "div";
    case BinaryOp::Rem:
      return "mod";
    case BinaryOp::Eq:
      return "=";
    case BinaryOp::NotEq:
      return "<>";
    case BinaryOp::Less:
      return "<";
    case BinaryOp::LessEq:
      return "<=";
    case BinaryOp::Greater:
      return ">";
    case BinaryOp::GreaterEq:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Neg:
      return "~";
    case UnaryOp::Not:
      return "not";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BorrowOp op) noexcept
{
  switch (op) {
    case BorrowOp::Ref:
      return "&";
    case BorrowOp::RefMut:
      return "&mut";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::LiteralExpr;
inline constexpr NodeKind k_last_expr_kind = NodeKind::IfExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::ValStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::WhileStmt;

inline constexpr NodeKind k_first_param_kind = NodeKind::IdentParam;
inline constexpr NodeKind k_last_param_kind = NodeKind::TypedParam;

inline constexpr NodeKind k_first_decl_kind = NodeKind::ValDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::FuncDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_param_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_param_kind && kind <= detail::k_last_param_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace minml
