// circ_dsl/imports/program_context.hpp - Running definition store
//
// Holds every circuit and function installed by import resolution, keyed by
// qualified name, together with the arenas and sources those definitions
// point into.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/ast/ast_context.hpp"
#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl
{

struct CircuitDefinition
{
  const CircuitDecl * decl = nullptr;
};

struct FunctionDefinition
{
  const FunctionDecl * decl = nullptr;
  /// Scope of the call site the function is bound to; unset for imports.
  std::optional<std::string> call_context;
};

using StoredDefinition = std::variant<CircuitDefinition, FunctionDefinition>;

/**
 * Definition store for one compilation.
 *
 * Written only by ImportResolver. Storing under an existing key replaces the
 * previous definition.
 */
class ProgramContext
{
public:
  using DefinitionMap = std::map<std::string, StoredDefinition, std::less<>>;

  ProgramContext() = default;
  ProgramContext(const ProgramContext &) = delete;
  ProgramContext & operator=(const ProgramContext &) = delete;

  void store(std::string key, StoredDefinition definition);

  [[nodiscard]] const StoredDefinition * lookup(std::string_view key) const;
  [[nodiscard]] const CircuitDecl * lookup_circuit(std::string_view key) const;
  [[nodiscard]] const FunctionDecl * lookup_function(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const { return lookup(key) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return definitions_.size(); }
  [[nodiscard]] bool empty() const noexcept { return definitions_.empty(); }
  [[nodiscard]] auto begin() const { return definitions_.begin(); }
  [[nodiscard]] auto end() const { return definitions_.end(); }

  /// Keep an AST arena alive for as long as this store.
  AstContext & adopt(std::unique_ptr<AstContext> ast);

  /// Arena for programs parsed on behalf of this store.
  AstContext & new_ast() { return adopt(std::make_unique<AstContext>()); }

  [[nodiscard]] SourceRegistry & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

private:
  DefinitionMap definitions_;
  std::vector<std::unique_ptr<AstContext>> arenas_;
  SourceRegistry sources_;
};

}  // namespace circ_dsl
