// circ_dsl/ast/ast_context.hpp - AST arena and string pool
//
// One AstContext per parsed file. Imported programs keep their context alive
// by handing it to the ProgramContext that stores their declarations.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace circ_dsl
{

class AstNode;

/**
 * Owns all AST nodes and interned strings of one parse.
 *
 * Backed by std::pmr::monotonic_buffer_resource: allocation is a pointer
 * bump and everything is released together when the context is destroyed.
 *
 * @code
 *   AstContext ctx;
 *   auto * ty = ctx.create<PrimitiveType>(PrimitiveKind::U64);
 *   std::string_view name = ctx.intern("owner");
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), strings_(&arena_)
  {
  }

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer valid for the lifetime of this context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "arena-managed nodes must be trivially destructible "
      "(use std::string_view and gsl::span members)");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Copy `s` into the arena once and return a view that stays valid.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto it = strings_.find(s); it != strings_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *strings_.insert(std::string_view{}).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    return *strings_.insert(std::string_view(ptr, s.size())).first;
  }

  /// Copy a vector into arena storage.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays must be trivially destructible");
    if (vec.empty()) {
      return {};
    }
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t interned_count() const noexcept { return strings_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> strings_;
};

}  // namespace circ_dsl
