// circ_dsl/imports/import_resolver.hpp - Resolving import declarations
//
// Locates imported packages on disk, parses them and installs their circuits
// and functions into a ProgramContext under qualified names.
//
#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/imports/import_error.hpp"
#include "circ_dsl/imports/program_context.hpp"

namespace circ_dsl
{

/**
 * Import resolution over the package layout
 *
 *   <root>/src/<package>.leo
 *   <root>/src/<package>/src/<sub>.leo
 *
 * Resolution is fail-fast: the first failure aborts the whole import and is
 * returned. Definitions stored before the failure stay in the store.
 *
 * ## Usage
 * ```cpp
 * ProgramContext context;
 * ImportResolver resolver(context);
 * resolver.set_search_root(project_root);
 * ImportStatus st = resolver.resolve_definitions(*program);
 * ```
 */
class ImportResolver
{
public:
  explicit ImportResolver(ProgramContext & context);

  /// Root packages are searched under; the working directory when empty.
  void set_search_root(std::filesystem::path root) { search_root_ = std::move(root); }
  [[nodiscard]] const std::filesystem::path & search_root() const noexcept
  {
    return search_root_;
  }

  /// Mark the file the entry program was parsed from, so importing it back is a cycle.
  void set_entry_file(const std::filesystem::path & file);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Resolve one import declaration of the program named `scope`.
   */
  ImportStatus enforce_import(std::string_view scope, const ImportDecl & import);

  /**
   * Find `package` under `<path>/src/` and apply its access path.
   */
  ImportStatus enforce_package(
    std::string_view scope, const std::filesystem::path & path, const Package & package);

  /**
   * Resolve every import of `program` with the program's name as scope, then
   * store its circuits and functions under `join_scope(program.name, name)`.
   */
  ImportStatus resolve_definitions(const Program & program);

private:
  ImportStatus enforce_package_access(
    std::string_view scope, const std::filesystem::directory_entry & entry,
    const PackageAccess & access);
  ImportStatus enforce_import_star(
    std::string_view scope, const std::filesystem::directory_entry & entry, SourceRange span);
  ImportStatus enforce_import_symbol(
    std::string_view scope, const std::filesystem::directory_entry & entry,
    const SymbolAccess & symbol);

  /// Parse `entry` and rename the result to `scope`. Fails if `key` is being resolved.
  ImportStatus load(
    std::string_view scope, const std::filesystem::directory_entry & entry,
    std::string_view key, SourceRange span, Program *& out);

  [[nodiscard]] static std::string file_key(const std::filesystem::path & path);

  ProgramContext & context_;
  std::filesystem::path search_root_;
  std::set<std::string, std::less<>> active_files_;  ///< files on the current import path
};

}  // namespace circ_dsl
