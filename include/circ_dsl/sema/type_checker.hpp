// circ_dsl/sema/type_checker.hpp - Declaration-level type checking
//
// Validates functions and circuit/record declarations of an assembled
// program. Runs after import resolution.
//
#pragma once

#include <string>
#include <string_view>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/imports/program_context.hpp"
#include "circ_dsl/sema/symbol_table.hpp"

namespace circ_dsl
{

/// Member every record must declare, with its required type.
struct RequiredRecordVariable
{
  std::string_view name;
  PrimitiveKind type;
};

inline constexpr RequiredRecordVariable k_record_owner{"owner", PrimitiveKind::Address};
inline constexpr RequiredRecordVariable k_record_balance{"balance", PrimitiveKind::U64};

/**
 * Type checker for functions and circuits.
 *
 * Every violated rule is reported once and checking continues, so a single
 * run surfaces all errors of a program.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(&context, &diags);
 * bool ok = checker.check(*program);
 * ```
 */
class TypeChecker
{
public:
  /**
   * @param definitions Definition store consulted for imported circuit types (may be nullptr)
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit TypeChecker(
    const ProgramContext * definitions = nullptr, DiagnosticBag * diags = nullptr);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Register the program's functions and circuits, then visit every circuit
   * and function.
   *
   * @return true if no errors occurred
   */
  bool check(const Program & program);

  /**
   * Check one function: input types, duplicate inputs, and that the body
   * contains a `return`.
   */
  void visit_function(const FunctionDecl & function);

  /**
   * Check one circuit: duplicate members and, for records, the required
   * `owner` and `balance` variables.
   */
  void visit_circuit(const CircuitDecl & circuit);

  /// Report an unknown type; nullptr (no declared type) is accepted.
  void check_ident_type(const TypeNode * type);

  // ===========================================================================
  // State
  // ===========================================================================

  [[nodiscard]] const SymbolTable & symbol_table() const noexcept { return table_; }

  /// Name of the function being visited, empty outside functions.
  [[nodiscard]] std::string_view current_function() const noexcept { return parent_; }

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void visit_block(const BlockStmt * block);
  void visit_stmt(const Stmt * stmt);

  void check_has_field(const CircuitDecl & circuit, const RequiredRecordVariable & required);
  [[nodiscard]] bool is_known_circuit(std::string_view name) const;

  void report_error(SourceRange range, std::string message, std::string_view code);
  void count_error() noexcept;

  const ProgramContext * definitions_;
  DiagnosticBag * diags_;
  SymbolTable table_;

  const Program * program_ = nullptr;
  std::string_view parent_;
  bool has_return_ = false;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace circ_dsl
