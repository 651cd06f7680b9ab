// kaleido/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for any AST node. Every object carries
// "type" (the node class name) and "range" (byte offsets).
//
#pragma once

#include <nlohmann/json.hpp>

#include "kaleido/ast/ast.hpp"

namespace kaleido
{

/**
 * Serialize an AST node of any kind to JSON.
 *
 * @param node The AST node to serialize (may be nullptr)
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its declarations.
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace kaleido
