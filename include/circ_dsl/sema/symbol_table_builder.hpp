// circ_dsl/sema/symbol_table_builder.hpp - Program-level symbol registration
//
// Registers the functions and circuits of a program before type checking.
//
#pragma once

#include <string_view>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/sema/symbol_table.hpp"

namespace circ_dsl
{

/**
 * Fills a SymbolTable with the functions and circuits of a program.
 *
 * A second declaration with an already registered name is reported as
 * shadowing and the first declaration stays in the table.
 */
class SymbolTableBuilder
{
public:
  /**
   * @param table SymbolTable to populate
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit SymbolTableBuilder(SymbolTable & table, DiagnosticBag * diags = nullptr);

  /**
   * @return true if no errors occurred
   */
  bool build(const Program & program);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void report_shadowing(
    SourceRange range, SourceRange prev_range, std::string_view name, std::string_view kind,
    std::string_view code);

  SymbolTable & table_;
  DiagnosticBag * diags_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace circ_dsl
