// circ_dsl/imports/qualified_name.hpp - Scope joining for imported symbols
#pragma once

#include <string>
#include <string_view>

namespace circ_dsl
{

/// Separator placed between an owning scope and a local name.
inline constexpr std::string_view k_scope_separator = "_";

/**
 * Key under which `inner` is stored when installed into scope `outer`.
 *
 * @code
 *   join_scope("main", "Token");  // "main_Token"
 * @endcode
 */
[[nodiscard]] inline std::string join_scope(std::string_view outer, std::string_view inner)
{
  std::string out;
  out.reserve(outer.size() + k_scope_separator.size() + inner.size());
  out.append(outer);
  out.append(k_scope_separator);
  out.append(inner);
  return out;
}

}  // namespace circ_dsl
