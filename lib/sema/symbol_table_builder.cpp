// circ_dsl/sema/symbol_table_builder.cpp - Symbol table construction implementation
//
#include "circ_dsl/sema/symbol_table_builder.hpp"

#include <string>

#include "circ_dsl/basic/diagnostic_codes.hpp"

namespace circ_dsl
{

SymbolTableBuilder::SymbolTableBuilder(SymbolTable & table, DiagnosticBag * diags)
: table_(table), diags_(diags)
{
}

bool SymbolTableBuilder::build(const Program & program)
{
  has_errors_ = false;
  error_count_ = 0;

  for (const FunctionDecl * fn : program.functions) {
    if (!table_.insert_function(fn)) {
      const FunctionDecl * first = table_.lookup_function(fn->name);
      report_shadowing(
        fn->name_range, first->name_range, fn->name, "function", diag_code::k_shadowed_function);
    }
  }

  for (const CircuitDecl * circuit : program.circuits) {
    if (!table_.insert_circuit(circuit)) {
      const CircuitDecl * first = table_.lookup_circuit(circuit->name);
      report_shadowing(
        circuit->name_range, first->name_range, circuit->name, "circuit",
        diag_code::k_shadowed_circuit);
    }
  }

  return !has_errors_;
}

void SymbolTableBuilder::report_shadowing(
  SourceRange range, SourceRange prev_range, std::string_view name, std::string_view kind,
  std::string_view code)
{
  has_errors_ = true;
  ++error_count_;

  if (diags_ != nullptr) {
    diags_
      ->report_error(
        range,
        std::string(kind) + " `" + std::string(name) + "` shadows a previous declaration")
      .with_code(code)
      .with_secondary_label(prev_range, "first defined here");
  }
}

}  // namespace circ_dsl
