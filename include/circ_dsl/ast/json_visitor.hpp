// circ_dsl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for the AST and for the definition store.
//
#pragma once

#include <nlohmann/json.hpp>

#include "circ_dsl/ast/ast.hpp"

namespace circ_dsl
{

class ProgramContext;

/**
 * Serialize an AST node to JSON.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its declarations.
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

/**
 * Serialize the definition store: one entry per qualified name with its
 * kind ("circuit" / "function") and declared name.
 */
[[nodiscard]] nlohmann::json to_json(const ProgramContext & context);

}  // namespace circ_dsl
