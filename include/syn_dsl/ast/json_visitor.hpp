// syn_dsl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `sync ast` and by tests that compare whole trees.
//
#pragma once

#include <nlohmann/json.hpp>

#include "syn_dsl/ast/ast.hpp"

namespace syn_dsl
{

/**
 * Serialize an AST node to JSON.
 *
 * Every object has a "type" (the node class name) and a "range"
 * ({"start", "end"} byte offsets). A null node yields JSON null.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

}  // namespace syn_dsl
