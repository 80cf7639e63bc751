// circ_dsl/imports/program_context.cpp - Running definition store
#include "circ_dsl/imports/program_context.hpp"

#include <utility>

namespace circ_dsl
{

void ProgramContext::store(std::string key, StoredDefinition definition)
{
  definitions_.insert_or_assign(std::move(key), std::move(definition));
}

const StoredDefinition * ProgramContext::lookup(std::string_view key) const
{
  auto it = definitions_.find(key);
  return it != definitions_.end() ? &it->second : nullptr;
}

const CircuitDecl * ProgramContext::lookup_circuit(std::string_view key) const
{
  if (const StoredDefinition * def = lookup(key)) {
    if (const auto * circuit = std::get_if<CircuitDefinition>(def)) {
      return circuit->decl;
    }
  }
  return nullptr;
}

const FunctionDecl * ProgramContext::lookup_function(std::string_view key) const
{
  if (const StoredDefinition * def = lookup(key)) {
    if (const auto * function = std::get_if<FunctionDefinition>(def)) {
      return function->decl;
    }
  }
  return nullptr;
}

AstContext & ProgramContext::adopt(std::unique_ptr<AstContext> ast)
{
  arenas_.push_back(std::move(ast));
  return *arenas_.back();
}

}  // namespace circ_dsl
