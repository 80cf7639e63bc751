// circ_dsl/imports/import_resolver.cpp - Resolving import declarations
#include "circ_dsl/imports/import_resolver.hpp"

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "circ_dsl/imports/qualified_name.hpp"
#include "circ_dsl/imports/source_loader.hpp"
#include "circ_dsl/syntax/frontend.hpp"

namespace circ_dsl
{
namespace
{

/// Marks a file as being resolved for the lifetime of the guard.
class ActiveFileGuard
{
public:
  ActiveFileGuard(std::set<std::string, std::less<>> & active, std::string key)
  : active_(active), key_(std::move(key))
  {
    active_.insert(key_);
  }

  ActiveFileGuard(const ActiveFileGuard &) = delete;
  ActiveFileGuard & operator=(const ActiveFileGuard &) = delete;

  ~ActiveFileGuard() { active_.erase(key_); }

private:
  std::set<std::string, std::less<>> & active_;
  std::string key_;
};

}  // namespace

ImportResolver::ImportResolver(ProgramContext & context) : context_(context) {}

void ImportResolver::set_entry_file(const std::filesystem::path & file)
{
  active_files_.insert(file_key(file));
}

std::string ImportResolver::file_key(const std::filesystem::path & path)
{
  std::error_code ec;
  std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    canonical = path.lexically_normal();
  }
  return canonical.generic_string();
}

// ============================================================================
// Entry Points
// ============================================================================

ImportStatus ImportResolver::enforce_import(std::string_view scope, const ImportDecl & import)
{
  std::filesystem::path root = search_root_;
  if (root.empty()) {
    std::error_code ec;
    root = std::filesystem::current_path(ec);
    if (ec) {
      return ImportStatus::fail(
        ImportError::directory_error(ec.message(), ".", import.get_range()));
    }
  }
  return enforce_package(scope, root, *import.package);
}

ImportStatus ImportResolver::enforce_package(
  std::string_view scope, const std::filesystem::path & path, const Package & package)
{
  const std::filesystem::path source_directory = path / k_source_directory_name;

  std::vector<std::filesystem::directory_entry> entries;
  std::error_code ec;
  std::filesystem::directory_iterator it(source_directory, ec);
  if (ec) {
    return ImportStatus::fail(
      ImportError::directory_error(ec.message(), source_directory, package.name_range));
  }
  const std::filesystem::directory_iterator end;
  while (it != end) {
    entries.push_back(*it);
    it.increment(ec);
    if (ec) break;
  }
  if (ec) {
    return ImportStatus::fail(
      ImportError::directory_error(ec.message(), source_directory, package.name_range));
  }

  // TODO: also search `<path>/imports/` and reject a package found in both directories.
  for (const auto & entry : entries) {
    const std::string file_name = entry.path().filename().string();
    if (strip_source_extension(file_name) == package.name) {
      return enforce_package_access(scope, entry, *package.access);
    }
  }

  return ImportStatus::fail(ImportError::unknown_package(package.name, package.name_range));
}

ImportStatus ImportResolver::resolve_definitions(const Program & program)
{
  for (const ImportDecl * import : program.imports) {
    ImportStatus st = enforce_import(program.name, *import);
    if (!st.success) {
      return st;
    }
  }

  for (const CircuitDecl * circuit : program.circuits) {
    context_.store(join_scope(program.name, circuit->name), CircuitDefinition{circuit});
  }
  for (const FunctionDecl * function : program.functions) {
    context_.store(
      join_scope(program.name, function->name), FunctionDefinition{function, std::nullopt});
  }
  return ImportStatus::ok();
}

// ============================================================================
// Package access
// ============================================================================

ImportStatus ImportResolver::enforce_package_access(
  std::string_view scope, const std::filesystem::directory_entry & entry,
  const PackageAccess & access)
{
  return std::visit(
    [&](const auto & a) -> ImportStatus {
      using T = std::decay_t<decltype(a)>;
      if constexpr (std::is_same_v<T, StarAccess>) {
        return enforce_import_star(scope, entry, a.range);
      } else if constexpr (std::is_same_v<T, SymbolAccess>) {
        return enforce_import_symbol(scope, entry, a);
      } else if constexpr (std::is_same_v<T, SubPackageAccess>) {
        return enforce_package(scope, entry.path(), *a.package);
      } else {
        for (const PackageAccess * nested : a.accesses) {
          ImportStatus st = enforce_package_access(scope, entry, *nested);
          if (!st.success) {
            return st;
          }
        }
        return ImportStatus::ok();
      }
    },
    access.access);
}

ImportStatus ImportResolver::enforce_import_star(
  std::string_view scope, const std::filesystem::directory_entry & entry, SourceRange span)
{
  const std::string key = file_key(entry.path());
  Program * program = nullptr;
  if (ImportStatus st = load(scope, entry, key, span, program); !st.success) {
    return st;
  }

  const ActiveFileGuard guard(active_files_, key);
  return resolve_definitions(*program);
}

ImportStatus ImportResolver::enforce_import_symbol(
  std::string_view scope, const std::filesystem::directory_entry & entry,
  const SymbolAccess & symbol)
{
  const std::string key = file_key(entry.path());
  Program * program = nullptr;
  if (ImportStatus st = load(scope, entry, key, symbol.range, program); !st.success) {
    return st;
  }

  StoredDefinition value;
  if (const CircuitDecl * circuit = program->find_circuit(symbol.symbol)) {
    value = CircuitDefinition{circuit};
  } else if (const FunctionDecl * function = program->find_function(symbol.symbol)) {
    value = FunctionDefinition{function, std::nullopt};
  } else {
    return ImportStatus::fail(
      ImportError::unknown_symbol(symbol.symbol, program->name, entry.path(), symbol.range));
  }

  const std::string_view name = symbol.alias.value_or(symbol.symbol);
  context_.store(join_scope(program->name, name), std::move(value));

  const ActiveFileGuard guard(active_files_, key);
  for (const ImportDecl * nested : program->imports) {
    ImportStatus st = enforce_import(program->name, *nested);
    if (!st.success) {
      return st;
    }
  }
  return ImportStatus::ok();
}

ImportStatus ImportResolver::load(
  std::string_view scope, const std::filesystem::directory_entry & entry, std::string_view key,
  SourceRange span, Program *& out)
{
  if (active_files_.find(key) != active_files_.end()) {
    return ImportStatus::fail(ImportError::cyclic_import(entry.path(), span));
  }

  SourceLoadResult loaded = parse_import_file(entry, span, context_.sources());
  if (!loaded.success) {
    return ImportStatus::fail(std::move(*loaded.error));
  }

  // Imported symbols share the namespace of the importing program.
  AstContext & ast = context_.adopt(std::move(loaded.loaded->ast));
  out = loaded.loaded->program;
  out->name = ast.intern(scope);
  return ImportStatus::ok();
}

}  // namespace circ_dsl
