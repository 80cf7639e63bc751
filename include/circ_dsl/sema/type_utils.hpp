// circ_dsl/sema/type_utils.hpp - Structural helpers over type nodes
#pragma once

#include <string>

#include "circ_dsl/ast/ast.hpp"

namespace circ_dsl
{

/**
 * Structural ("flat") equality of two declared types.
 *
 * - primitives are equal when they are the same primitive;
 * - named types are equal when their names match;
 * - tuples are compared element-wise;
 * - arrays are compared after flattening nested arrays, so `[[u8; 3]; 2]`
 *   equals `[u8; (2, 3)]`.
 *
 * A MissingType (or nullptr) is never equal to anything.
 */
[[nodiscard]] bool types_equal_flat(const TypeNode * a, const TypeNode * b);

/// Source-like spelling of a type, e.g. `[u8; (2, 3)]`.
[[nodiscard]] std::string type_to_string(const TypeNode * type);

}  // namespace circ_dsl
