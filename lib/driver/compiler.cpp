// circ_dsl/driver/compiler.cpp - Compiler driver implementation
//
#include "circ_dsl/driver/compiler.hpp"

#include <fmt/core.h>

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "circ_dsl/basic/diagnostic_codes.hpp"
#include "circ_dsl/imports/import_resolver.hpp"
#include "circ_dsl/sema/type_checker.hpp"
#include "circ_dsl/syntax/frontend.hpp"

namespace circ_dsl
{

CompileResult Compiler::check_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;
  result.context = std::make_unique<ProgramContext>();

  std::string text;
  if (!read_file(file, text, result.diagnostics)) {
    return result;
  }

  const std::filesystem::path root = options.search_root.value_or(std::filesystem::path{});
  if (const Program * program = check_program(
        file, std::move(text), root, options.verbose, *result.context, result.diagnostics)) {
    result.programs.push_back(program);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

CompileResult Compiler::check_source(
  const std::filesystem::path & path, std::string source_text, const CompileOptions & options)
{
  CompileResult result;
  result.context = std::make_unique<ProgramContext>();

  const std::filesystem::path root = options.search_root.value_or(std::filesystem::path{});
  if (const Program * program = check_program(
        path, std::move(source_text), root, options.verbose, *result.context,
        result.diagnostics)) {
    result.programs.push_back(program);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

CompileResult Compiler::check_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;
  result.context = std::make_unique<ProgramContext>();

  if (config.compiler.entry_points.empty()) {
    result.diagnostics
      .report_error(SourceRange{}, "no entry points defined in project configuration")
      .with_code(diag_code::k_io_error);
    return result;
  }

  const std::filesystem::path root =
    options.search_root.value_or(config.resolved_search_root());

  std::set<std::string> seen;
  for (const auto & entry_path : config.resolved_entry_points()) {
    if (!seen.insert(entry_path.generic_string()).second) {
      result.diagnostics
        .report_warning(
          SourceRange{},
          "entry point `" + entry_path.generic_string() + "` is listed more than once")
        .with_code(diag_code::k_duplicate_entry_point)
        .with_help("remove the repeated entry from `compiler.entry_points`");
      continue;
    }

    std::string text;
    if (!read_file(entry_path, text, result.diagnostics)) {
      continue;
    }
    if (const Program * program = check_program(
          entry_path, std::move(text), root, options.verbose, *result.context,
          result.diagnostics)) {
      result.programs.push_back(program);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

void Compiler::report_import_error(const ImportError & error, DiagnosticBag & diags)
{
  auto builder = diags.report_error(error.range, error.message);
  builder.with_code(diagnostic_code(error.kind));
  if (!error.path.empty()) {
    builder.with_help("while resolving `" + error.path.generic_string() + "`");
  }
}

const Program * Compiler::check_program(
  const std::filesystem::path & path, std::string source_text,
  const std::filesystem::path & search_root, bool verbose, ProgramContext & context,
  DiagnosticBag & diags)
{
  // 1. Parse
  if (verbose) {
    fmt::print(stderr, "[circc] parsing {}\n", path.generic_string());
  }
  DiagnosticBag parse_diags;
  const ParseOutput parsed =
    parse_source(context.sources(), path, std::move(source_text), context.new_ast(), parse_diags);
  const bool parse_failed = parse_diags.has_errors();
  diags.merge(std::move(parse_diags));
  if (parse_failed || parsed.program == nullptr) {
    return nullptr;
  }
  const Program & program = *parsed.program;

  // 2. Imports
  if (verbose) {
    fmt::print(
      stderr, "[circc] resolving {} import(s) of `{}` under {}\n", program.imports.size(),
      program.name, search_root.empty() ? "." : search_root.generic_string());
  }
  ImportResolver resolver(context);
  resolver.set_search_root(search_root);
  resolver.set_entry_file(path);
  const ImportStatus imported = resolver.resolve_definitions(program);
  if (!imported.success && imported.error) {
    report_import_error(*imported.error, diags);
  }

  // 3. Type checking
  TypeChecker checker(&context, &diags);
  const bool checked = checker.check(program);
  if (verbose) {
    fmt::print(
      stderr, "[circc] checked `{}`: {} error(s)\n", program.name, checked ? 0 : checker.error_count());
  }

  return &program;
}

bool Compiler::read_file(
  const std::filesystem::path & file, std::string & out, DiagnosticBag & diags)
{
  std::ifstream in(file, std::ios::in | std::ios::binary);
  if (!in) {
    diags.report_error(SourceRange{}, "cannot read file: " + file.string())
      .with_code(diag_code::k_io_error);
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

}  // namespace circ_dsl
