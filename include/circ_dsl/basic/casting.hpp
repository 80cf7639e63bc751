// circ_dsl/basic/casting.hpp - classof-based isa / cast / dyn_cast
//
//   if (isa<NamedType>(type)) { ... }
//   const auto * arr = cast<ArrayType>(type);          // asserts on mismatch
//   if (const auto * ret = dyn_cast<ReturnStmt>(s)) {}  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace circ_dsl
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when `node` is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "Target type must provide classof()");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of a different kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of a different kind");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace circ_dsl
