// circ_dsl/sema/symbol_table.cpp - Symbol table implementation
//
#include "circ_dsl/sema/symbol_table.hpp"

namespace circ_dsl
{

bool SymbolTable::insert_variable(std::string_view name, VariableSymbol symbol)
{
  auto [it, inserted] = variables_.emplace(name, symbol);
  return inserted;
}

const VariableSymbol * SymbolTable::lookup_variable(std::string_view name) const
{
  auto it = variables_.find(name);
  return it != variables_.end() ? &it->second : nullptr;
}

bool SymbolTable::insert_function(const FunctionDecl * decl)
{
  auto [it, inserted] = functions_.emplace(decl->name, decl);
  return inserted;
}

bool SymbolTable::insert_circuit(const CircuitDecl * decl)
{
  auto [it, inserted] = circuits_.emplace(decl->name, decl);
  return inserted;
}

const FunctionDecl * SymbolTable::lookup_function(std::string_view name) const
{
  auto it = functions_.find(name);
  return it != functions_.end() ? it->second : nullptr;
}

const CircuitDecl * SymbolTable::lookup_circuit(std::string_view name) const
{
  auto it = circuits_.find(name);
  return it != circuits_.end() ? it->second : nullptr;
}

void SymbolTable::clear() noexcept
{
  variables_.clear();
  functions_.clear();
  circuits_.clear();
}

}  // namespace circ_dsl
