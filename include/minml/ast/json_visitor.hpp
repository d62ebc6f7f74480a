// minml/ast/json_visitor.hpp - JSON serialization for AST nodes
#pragma once

#include <nlohmann/json.hpp>

#include "minml/ast/ast.hpp"

namespace minml
{

/**
 * Serialize any AST node (and its subtree) to JSON.
 *
 * Every object carries "type" (the node class) and "span"
 * (`{"start": n, "end": m}`, or nulls for an invalid span).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a whole program.
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace minml
