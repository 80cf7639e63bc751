// circ_dsl/sema/symbol_table.hpp - Function and variable symbols
//
// Program-level functions and circuits plus the variables of the function
// currently being checked. Block scopes are not modelled.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/ast/ast_enums.hpp"

namespace circ_dsl
{

// ============================================================================
// Symbol Types
// ============================================================================

enum class DeclarationKind : uint8_t {
  Input,  ///< function input
};

/**
 * How a variable was declared.
 */
struct Declaration
{
  DeclarationKind kind = DeclarationKind::Input;
  InputMode mode = InputMode::Private;  ///< Only meaningful for Input

  [[nodiscard]] static Declaration input(InputMode m) noexcept
  {
    return Declaration{DeclarationKind::Input, m};
  }
};

/**
 * A variable visible in the current function.
 */
struct VariableSymbol
{
  const TypeNode * type = nullptr;
  SourceRange span;
  Declaration declaration;
};

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// SymbolTable
// ============================================================================

/**
 * Symbol table for one program.
 *
 * Names (keys) must be interned string_views owned by an AstContext that
 * outlives the table.
 */
class SymbolTable
{
public:
  SymbolTable() = default;

  // ===========================================================================
  // Variables
  // ===========================================================================

  /**
   * Insert a variable.
   *
   * @return false if the name is already present (the existing entry is kept)
   */
  bool insert_variable(std::string_view name, VariableSymbol symbol);

  /// Drop every variable; called when a new function is entered.
  void clear_variables() noexcept { variables_.clear(); }

  [[nodiscard]] const VariableSymbol * lookup_variable(std::string_view name) const;
  [[nodiscard]] size_t variable_count() const noexcept { return variables_.size(); }

  // ===========================================================================
  // Functions and circuits
  // ===========================================================================

  /// @return false if a function with that name is already present
  bool insert_function(const FunctionDecl * decl);

  /// @return false if a circuit with that name is already present
  bool insert_circuit(const CircuitDecl * decl);

  [[nodiscard]] const FunctionDecl * lookup_function(std::string_view name) const;
  [[nodiscard]] const CircuitDecl * lookup_circuit(std::string_view name) const;

  [[nodiscard]] size_t function_count() const noexcept { return functions_.size(); }
  [[nodiscard]] size_t circuit_count() const noexcept { return circuits_.size(); }

  /// Drop every variable, function and circuit.
  void clear() noexcept;

private:
  std::unordered_map<std::string_view, VariableSymbol, StringViewHash, StringViewEqual> variables_;
  std::unordered_map<std::string_view, const FunctionDecl *, StringViewHash, StringViewEqual>
    functions_;
  std::unordered_map<std::string_view, const CircuitDecl *, StringViewHash, StringViewEqual>
    circuits_;
};

}  // namespace circ_dsl
