// circ_dsl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the checking pipeline.
// Used by the CLI and by integration tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/imports/import_error.hpp"
#include "circ_dsl/imports/program_context.hpp"
#include "circ_dsl/project/project_config.hpp"

namespace circ_dsl
{

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Package search root (overrides the project config; defaults to the working directory)
  std::optional<std::filesystem::path> search_root;

  /// Print pipeline progress to stderr
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether checking succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Definition store, sources and arenas of every parsed file
  std::unique_ptr<ProgramContext> context;

  /// Entry programs in the order they were checked
  std::vector<const Program *> programs;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Driver for the checking pipeline:
 * 1. Parse the entry file
 * 2. Resolve its imports into the definition store
 * 3. Build the symbol table and type check
 */
class Compiler
{
public:
  /**
   * Check a single source file.
   */
  [[nodiscard]] static CompileResult check_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Check in-memory source text. `path` names the program and is used in
   * diagnostics; it does not need to exist.
   */
  [[nodiscard]] static CompileResult check_source(
    const std::filesystem::path & path, std::string source_text, const CompileOptions & options);

  /**
   * Check every entry point of a project. All entry points share one
   * definition store. A repeated entry is checked once and reported as a
   * W0001 warning.
   */
  [[nodiscard]] static CompileResult check_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// Convert an import failure into an error diagnostic.
  static void report_import_error(const ImportError & error, DiagnosticBag & diags);

private:
  static const Program * check_program(
    const std::filesystem::path & path, std::string source_text,
    const std::filesystem::path & search_root, bool verbose, ProgramContext & context,
    DiagnosticBag & diags);

  static bool read_file(
    const std::filesystem::path & file, std::string & out, DiagnosticBag & diags);
};

}  // namespace circ_dsl
